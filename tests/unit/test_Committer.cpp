#include <gtest/gtest.h>
#include "SyncHarness.hpp"
#include "sync/client/ConfirmCoordinator.hpp"
#include "crypto/util/hash.hpp"

#include <thread>

using namespace cs;
using namespace cs::test;
using namespace cs::sync;
using namespace cs::sync::model;
using crypto::hash::blake2b;
using sync::client::ConfirmCoordinator;

class CommitterTest : public ::testing::Test {
protected:
    SyncHarness h;
    std::string ws = h.workspace("alice", {"bob"});

    struct Prepared {
        SyncResponse accepted;
        ConfirmRequest request;
    };

    // Phase 1 plus uploads for `files` as new/modified changes, against `version`
    Prepared prepare(const std::string& user, const uint64_t version,
                     const std::unordered_map<std::string, std::string>& files) {
        SyncRequest req;
        req.workspaceVersion = version;
        for (const auto& [path, content] : files)
            req.files.push_back({.filePath = path, .kind = EntryKind::File, .action = ChangeAction::New,
                                 .clientHash = blake2b(content)});

        Prepared p;
        p.accepted = h.validator->validate(ws, user, req);
        EXPECT_EQ(p.accepted.status, SyncStatus::Ok);

        for (const auto& a : p.accepted.actions)
            if (a.needsUpload()) h.blobs->put(*a.uploadCapability, files.at(a.filePath));

        p.request.workspaceVersion = *p.accepted.provisionalVersion;
        p.request.reservationId = *p.accepted.reservationId;
        p.request.syncActions = ConfirmCoordinator::finalize(p.accepted.actions, files);
        return p;
    }

    // Phase 1 for deletes of committed `paths`, against `version`
    Prepared prepareDeletes(const std::string& user, const uint64_t version, const std::vector<std::string>& paths) {
        SyncRequest req;
        req.workspaceVersion = version;
        for (const auto& path : paths)
            req.files.push_back({.filePath = path, .kind = EntryKind::File, .action = ChangeAction::Deleted});

        Prepared p;
        p.accepted = h.validator->validate(ws, user, req);
        EXPECT_EQ(p.accepted.status, SyncStatus::Ok);

        p.request.workspaceVersion = *p.accepted.provisionalVersion;
        p.request.reservationId = *p.accepted.reservationId;
        p.request.syncActions = ConfirmCoordinator::finalize(p.accepted.actions, {});
        return p;
    }
};

TEST_F(CommitterTest, CommitAdvancesVersionAndWritesManifest) {
    const auto p = prepare("alice", 1, {{"/main.py", "print(1)"}});

    const auto resp = h.committer->confirm(ws, "alice", p.request);

    EXPECT_EQ(resp.status, ConfirmStatus::Success);
    EXPECT_EQ(resp.finalWorkspaceVersion, 2u);

    const auto snap = h.store->snapshot(ws);
    EXPECT_EQ(snap.version, 2u);
    ASSERT_EQ(snap.entries.size(), 1u);
    EXPECT_EQ(snap.entries[0].filePath, "/main.py");
    EXPECT_EQ(snap.entries[0].contentHash, blake2b("print(1)"));
    EXPECT_EQ(snap.entries[0].size, 8u);
    EXPECT_TRUE(h.store->getReservation(p.request.reservationId)->isCommitted());
}

TEST_F(CommitterTest, ReplayedConfirmReturnsSameVersion) {
    const auto p = prepare("alice", 1, {{"/a.py", "a"}});
    ASSERT_EQ(h.committer->confirm(ws, "alice", p.request).status, ConfirmStatus::Success);

    const auto again = h.committer->confirm(ws, "alice", p.request);
    EXPECT_EQ(again.status, ConfirmStatus::Success);
    EXPECT_EQ(again.finalWorkspaceVersion, 2u);
    EXPECT_EQ(h.store->snapshot(ws).version, 2u);
}

TEST_F(CommitterTest, SiblingReservationIsSuperseded) {
    const auto first = prepare("alice", 1, {{"/a.py", "alice"}});
    const auto second = prepare("bob", 1, {{"/b.py", "bob"}});

    ASSERT_EQ(h.committer->confirm(ws, "alice", first.request).status, ConfirmStatus::Success);

    const auto lost = h.committer->confirm(ws, "bob", second.request);
    EXPECT_EQ(lost.status, ConfirmStatus::Conflict);
    EXPECT_EQ(lost.reason, ConflictReason::Superseded);
    EXPECT_EQ(lost.currentVersion, 2u);

    const auto snap = h.store->snapshot(ws);
    ASSERT_EQ(snap.entries.size(), 1u);
    EXPECT_EQ(snap.entries[0].filePath, "/a.py");
}

TEST_F(CommitterTest, ConcurrentConfirmsHaveExactlyOneWinner) {
    const auto first = prepare("alice", 1, {{"/a.py", "alice"}});
    const auto second = prepare("bob", 1, {{"/b.py", "bob"}});

    ConfirmResponse ra, rb;
    std::thread ta([&] { ra = h.committer->confirm(ws, "alice", first.request); });
    std::thread tb([&] { rb = h.committer->confirm(ws, "bob", second.request); });
    ta.join();
    tb.join();

    const int wins = (ra.status == ConfirmStatus::Success) + (rb.status == ConfirmStatus::Success);
    EXPECT_EQ(wins, 1);
    const auto& loser = ra.status == ConfirmStatus::Success ? rb : ra;
    EXPECT_EQ(loser.status, ConfirmStatus::Conflict);
    EXPECT_EQ(h.store->snapshot(ws).version, 2u);
    EXPECT_EQ(h.store->snapshot(ws).entries.size(), 1u);
}

TEST_F(CommitterTest, ExpiredReservationIsRejected) {
    const auto p = prepare("alice", 1, {{"/a.py", "a"}});
    h.clock.advance(h.cfg.reservation_ttl + std::chrono::seconds(1));

    const auto resp = h.committer->confirm(ws, "alice", p.request);
    EXPECT_EQ(resp.status, ConfirmStatus::Conflict);
    EXPECT_EQ(resp.reason, ConflictReason::ReservationExpired);
    EXPECT_EQ(h.store->snapshot(ws).version, 1u);
}

TEST_F(CommitterTest, UnknownReservationCountsAsExpired) {
    auto p = prepare("alice", 1, {{"/a.py", "a"}});
    p.request.reservationId = "does-not-exist";

    const auto resp = h.committer->confirm(ws, "alice", p.request);
    EXPECT_EQ(resp.status, ConfirmStatus::Conflict);
    EXPECT_EQ(resp.reason, ConflictReason::ReservationExpired);
}

TEST_F(CommitterTest, MovedVersionIsConflict) {
    const auto p = prepare("alice", 1, {{"/a.py", "a"}});
    h.store->forceVersion(ws, 5);

    const auto resp = h.committer->confirm(ws, "alice", p.request);
    EXPECT_EQ(resp.status, ConfirmStatus::Conflict);
    EXPECT_EQ(resp.reason, ConflictReason::VersionMoved);
    EXPECT_EQ(resp.currentVersion, 5u);
    EXPECT_TRUE(h.store->snapshot(ws).entries.empty());
}

TEST_F(CommitterTest, HashDifferentFromPhaseOneIsRejected) {
    auto p = prepare("alice", 1, {{"/a.py", "a"}});
    p.request.syncActions[0].clientHash = blake2b("tampered");

    EXPECT_THROW(h.committer->confirm(ws, "alice", p.request), ValidationError);
    EXPECT_EQ(h.store->snapshot(ws).version, 1u);
    EXPECT_TRUE(h.store->getReservation(p.request.reservationId)->isPending());
}

TEST_F(CommitterTest, ActionSetMustMatchReservation) {
    auto p = prepare("alice", 1, {{"/a.py", "a"}, {"/b.py", "b"}});

    auto missing = p.request;
    missing.syncActions.pop_back();
    EXPECT_THROW(h.committer->confirm(ws, "alice", missing), ValidationError);

    auto rekeyed = p.request;
    rekeyed.syncActions[0].storageKey = "workspaces/elsewhere";
    EXPECT_THROW(h.committer->confirm(ws, "alice", rekeyed), ValidationError);

    auto wrongVersion = p.request;
    wrongVersion.workspaceVersion = 7;
    EXPECT_THROW(h.committer->confirm(ws, "alice", wrongVersion), ValidationError);

    auto noSize = p.request;
    noSize.syncActions[0].size.reset();
    EXPECT_THROW(h.committer->confirm(ws, "alice", noSize), ValidationError);
}

TEST_F(CommitterTest, OversizedFileIsRejected) {
    h.cfg.max_file_size_bytes = 4;
    const sync::server::Committer strict(h.store, h.blobs, h.cfg, h.clock.fn());

    const auto p = prepare("alice", 1, {{"/big.bin", "0123456789"}});
    EXPECT_THROW(strict.confirm(ws, "alice", p.request), ValidationError);
}

TEST_F(CommitterTest, ReplacedContentIsDeletedFromBlobStore) {
    const auto v1 = prepare("alice", 1, {{"/a.py", "v1"}});
    ASSERT_EQ(h.committer->confirm(ws, "alice", v1.request).status, ConfirmStatus::Success);
    const auto oldKey = v1.request.syncActions[0].storageKey;
    ASSERT_TRUE(h.blobs->contains(oldKey));

    const auto v2 = prepare("alice", 2, {{"/a.py", "v2"}});
    ASSERT_EQ(h.committer->confirm(ws, "alice", v2.request).status, ConfirmStatus::Success);

    EXPECT_FALSE(h.blobs->contains(oldKey));
    EXPECT_TRUE(h.blobs->contains(v2.request.syncActions[0].storageKey));
    EXPECT_EQ(h.blobs->deletedKeys(), std::vector<std::string>{oldKey});
}

TEST_F(CommitterTest, FailedBlobDeleteAfterCommitLeavesManifestIntact) {
    const auto v1 = prepare("alice", 1, {{"/a.py", "a"}, {"/b.py", "b"}});
    ASSERT_EQ(h.committer->confirm(ws, "alice", v1.request).status, ConfirmStatus::Success);
    const auto keyA = h.store->snapshot(ws).entries.at(0).storageKey.value();
    const auto keyB = h.store->snapshot(ws).entries.at(1).storageKey.value();

    const auto p = prepareDeletes("alice", 2, {"/a.py", "/b.py"});
    h.blobs->failDeletesMatching(keyB);

    const auto resp = h.committer->confirm(ws, "alice", p.request);

    EXPECT_EQ(resp.status, ConfirmStatus::Success);
    EXPECT_EQ(resp.finalWorkspaceVersion, 3u);
    EXPECT_TRUE(h.store->snapshot(ws).entries.empty());
    EXPECT_FALSE(h.blobs->contains(keyA));
    EXPECT_TRUE(h.blobs->contains(keyB));   // orphaned, unreferenced
}

TEST_F(CommitterTest, FailedDeleteOfReplacedContentKeepsEveryManifestBlob) {
    const auto v1 = prepare("alice", 1, {{"/a.py", "v1"}, {"/b.py", "b"}});
    ASSERT_EQ(h.committer->confirm(ws, "alice", v1.request).status, ConfirmStatus::Success);

    const auto v2 = prepare("alice", 2, {{"/a.py", "v2"}});
    h.blobs->failDeletesMatching("");

    ASSERT_EQ(h.committer->confirm(ws, "alice", v2.request).status, ConfirmStatus::Success);

    const auto snap = h.store->snapshot(ws);
    EXPECT_EQ(snap.version, 3u);
    for (const auto& e : snap.entries) {
        ASSERT_TRUE(e.storageKey);
        EXPECT_TRUE(h.blobs->contains(*e.storageKey)) << e.filePath;
    }
    EXPECT_TRUE(h.blobs->deletedKeys().empty());
}

TEST_F(CommitterTest, RacingConfirmsLoseWithConflictNotError) {
    constexpr int racers = 8;

    std::vector<Prepared> prepared;
    for (int i = 0; i < racers; ++i)
        prepared.push_back(prepare(i % 2 ? "bob" : "alice", 1, {{"/f" + std::to_string(i) + ".py", std::to_string(i)}}));

    std::vector<ConfirmResponse> results(racers);
    std::vector<std::thread> threads;
    for (int i = 0; i < racers; ++i)
        threads.emplace_back([&, i] { results[i] = h.committer->confirm(ws, i % 2 ? "bob" : "alice", prepared[i].request); });
    for (auto& t : threads) t.join();

    int wins = 0;
    for (const auto& r : results) {
        if (r.status == ConfirmStatus::Success) {
            ++wins;
            continue;
        }
        EXPECT_EQ(r.status, ConfirmStatus::Conflict);
        ASSERT_TRUE(r.reason);
        EXPECT_TRUE(*r.reason == ConflictReason::Superseded || *r.reason == ConflictReason::VersionMoved);
        EXPECT_EQ(r.currentVersion, 2u);
    }
    EXPECT_EQ(wins, 1);
    EXPECT_EQ(h.store->snapshot(ws).version, 2u);
}

TEST_F(CommitterTest, NonMemberCannotConfirm) {
    const auto p = prepare("alice", 1, {{"/a.py", "a"}});
    EXPECT_THROW(h.committer->confirm(ws, "mallory", p.request), ForbiddenError);
}

#include <gtest/gtest.h>
#include "SyncHarness.hpp"
#include "crypto/util/hash.hpp"

using namespace cs;
using namespace cs::test;
using namespace cs::sync;
using namespace cs::sync::client;
using namespace cs::sync::model;
using crypto::hash::blake2b;

class SyncRoundTest : public ::testing::Test {
protected:
    SyncHarness h;
    std::string ws = h.workspace("alice", {"bob"});

    // Leaves the workspace at version 3 holding /a.py (H1) and /b.py
    void seedVersion3() {
        auto c = h.client("alice", ws);
        ASSERT_TRUE(c.save({file("/a.py", "H1")}).committed());
        ASSERT_TRUE(c.save({file("/a.py", "H1"), file("/b.py", "old b")}).committed());
        ASSERT_EQ(h.store->snapshot(ws).version, 3u);
    }

    std::map<std::string, ManifestEntry> committed() const {
        std::map<std::string, ManifestEntry> out;
        for (const auto& e : h.store->snapshot(ws).entries) out.emplace(e.filePath, e);
        return out;
    }
};

TEST_F(SyncRoundTest, ModifyAndAddCommitsNextVersion) {
    seedVersion3();
    auto c = h.client("bob", ws);

    const auto r = c.save({file("/a.py", "H2"), file("/b.py", "old b"), file("/c.py", "H2c")});

    ASSERT_TRUE(r.committed()) << r.error.value_or("");
    EXPECT_EQ(r.workspaceVersion, 4u);
    EXPECT_EQ(r.history, (std::vector{RoundState::Idle, RoundState::Diffing, RoundState::Syncing,
                                      RoundState::Uploading, RoundState::Confirming, RoundState::Execute}));

    ASSERT_EQ(r.changes.size(), 2u);
    EXPECT_EQ(r.changes[0].action, ChangeAction::Modified);
    EXPECT_EQ(r.changes[1].action, ChangeAction::New);

    const auto m = committed();
    ASSERT_EQ(m.size(), 3u);
    EXPECT_EQ(m.at("/a.py").contentHash, blake2b("H2"));
    EXPECT_EQ(m.at("/c.py").contentHash, blake2b("H2c"));
    EXPECT_EQ(m.at("/c.py").size, 3u);
    EXPECT_EQ(h.blobs->read(*m.at("/a.py").storageKey), "H2");

    EXPECT_EQ(c.cache->version(), 4u);
    EXPECT_FALSE(c.cache->stale());
    EXPECT_EQ(c.cache->find("/c.py")->contentHash, blake2b("H2c"));
}

TEST_F(SyncRoundTest, LosingConfirmLeavesWinnersVersion) {
    seedVersion3();
    auto first = h.client("alice", ws);
    auto second = h.client("bob", ws);

    // bob commits while alice is between phase 1 and phase 2
    first.api->beforeConfirm = [&] {
        const auto won = second.save({file("/a.py", "bob's"), file("/b.py", "old b")});
        ASSERT_TRUE(won.committed());
    };

    const auto r = first.save({file("/a.py", "H2"), file("/b.py", "old b"), file("/c.py", "H2c")});

    EXPECT_EQ(r.finalState, RoundState::Aborted);
    EXPECT_EQ(r.userMessage, "your view is stale, reloading");
    EXPECT_TRUE(first.cache->stale());

    const auto m = committed();
    EXPECT_EQ(h.store->snapshot(ws).version, 4u);
    EXPECT_EQ(m.size(), 2u);
    EXPECT_EQ(m.at("/a.py").contentHash, blake2b("bob's"));
    EXPECT_FALSE(m.contains("/c.py"));
}

TEST_F(SyncRoundTest, DeleteRemovesEntryAndBlob) {
    seedVersion3();
    const auto bKey = *committed().at("/b.py").storageKey;
    auto c = h.client("alice", ws);

    const auto r = c.save({file("/a.py", "H1")});

    ASSERT_TRUE(r.committed());
    ASSERT_EQ(r.changes.size(), 1u);
    EXPECT_EQ(r.changes[0].action, ChangeAction::Deleted);
    EXPECT_EQ(r.workspaceVersion, 4u);
    EXPECT_FALSE(committed().contains("/b.py"));
    EXPECT_FALSE(h.blobs->contains(bKey));
}

TEST_F(SyncRoundTest, StaleClientGetsConflictThenRecovers) {
    auto alice = h.client("alice", ws);
    auto bob = h.client("bob", ws);

    ASSERT_TRUE(bob.save({}).committed());   // bob's cache now at version 1
    ASSERT_TRUE(alice.save({file("/a.py", "1")}).committed());

    const auto stale = bob.save({file("/b.py", "2")});
    EXPECT_EQ(stale.finalState, RoundState::Aborted);
    EXPECT_EQ(stale.userMessage, "your view is stale, reloading");
    EXPECT_TRUE(bob.cache->stale());

    // next round refetches, sees /a.py, and keeps it
    const auto fetches = bob.api->manifestFetches;
    const auto retry = bob.save({file("/a.py", "1"), file("/b.py", "2")});
    ASSERT_TRUE(retry.committed());
    EXPECT_EQ(bob.api->manifestFetches, fetches + 1);
    EXPECT_EQ(retry.workspaceVersion, 3u);
    EXPECT_EQ(committed().size(), 2u);
}

TEST_F(SyncRoundTest, FailedUploadLeavesVersionUnchanged) {
    auto c = h.client("alice", ws);
    ASSERT_TRUE(c.save({file("/keep.py", "k")}).committed());
    const auto before = h.store->snapshot(ws);

    h.blobs->failUploadsMatching(blake2b("broken"));
    const auto r = c.save({file("/keep.py", "k"), file("/ok.py", "fine"), file("/bad.py", "broken")});

    EXPECT_EQ(r.finalState, RoundState::Aborted);
    EXPECT_EQ(r.history.back(), RoundState::Aborted);
    EXPECT_EQ(r.history[r.history.size() - 2], RoundState::Uploading);
    EXPECT_EQ(r.userMessage, "changes not saved, please retry");
    EXPECT_EQ(c.api->confirmCalls, 1u);

    const auto after = h.store->snapshot(ws);
    EXPECT_EQ(after.version, before.version);
    EXPECT_EQ(after.entries.size(), before.entries.size());
}

TEST_F(SyncRoundTest, CancelledUploadsAbortWithoutConfirm) {
    auto api = h.api("alice");
    WorkspaceCache cache(ws);
    auto transport = std::make_shared<HookedTransport>(h.blobs);
    SyncRound round(api, transport, cache, 1);
    transport->afterPut = [&round] { round.cancel(); };

    const std::vector local{file("/a.py", "a"), file("/b.py", "b"), file("/c.py", "c")};
    const auto r = round.run(local);

    EXPECT_EQ(r.finalState, RoundState::Aborted);
    EXPECT_EQ(r.history[r.history.size() - 2], RoundState::Uploading);
    EXPECT_EQ(r.userMessage, "changes not saved, please retry");
    EXPECT_EQ(api->confirmCalls, 0u);
    EXPECT_EQ(h.store->snapshot(ws).version, 1u);
    EXPECT_TRUE(h.store->snapshot(ws).entries.empty());

    // The cancel belonged to that round only
    transport->afterPut = nullptr;
    const auto retry = round.run(local);
    ASSERT_TRUE(retry.committed()) << retry.error.value_or("");
    EXPECT_EQ(retry.workspaceVersion, 2u);
    EXPECT_EQ(retry.uploads.files, 3u);
    EXPECT_EQ(retry.uploads.bytes, 3u);
}

TEST_F(SyncRoundTest, EmptyDiffGoesStraightToExecute) {
    auto c = h.client("alice", ws);
    const auto r = c.save({});

    EXPECT_TRUE(r.committed());
    EXPECT_EQ(r.history, (std::vector{RoundState::Idle, RoundState::Diffing, RoundState::Execute}));
    EXPECT_EQ(c.api->syncCalls, 0u);
    EXPECT_EQ(h.store->snapshot(ws).version, 1u);
}

TEST_F(SyncRoundTest, ManifestMatchesCommittedActions) {
    auto c = h.client("alice", ws);
    ASSERT_TRUE(c.save({folder("/src"), file("/src/a.py", "a"), file("/src/b.py", "bb"), file("/x.txt", "x")}).committed());
    ASSERT_TRUE(c.save({folder("/src"), file("/src/a.py", "a2"), file("/y.txt", "yyy")}).committed());

    const auto manifest = h.workspaces->manifest(ws, "bob");
    EXPECT_EQ(manifest.workspaceVersion, 3u);

    std::map<std::string, ManifestItem> byPath;
    for (const auto& item : manifest.manifest) byPath.emplace(item.entry.filePath, item);

    ASSERT_EQ(byPath.size(), 3u);
    EXPECT_EQ(byPath.at("/src").entry.kind, EntryKind::Folder);
    EXPECT_FALSE(byPath.at("/src").contentUrl);
    EXPECT_EQ(byPath.at("/src/a.py").entry.contentHash, blake2b("a2"));
    EXPECT_EQ(byPath.at("/src/a.py").entry.size, 2u);
    EXPECT_EQ(byPath.at("/y.txt").entry.size, 3u);
    EXPECT_EQ(h.blobs->get(*byPath.at("/y.txt").contentUrl), "yyy");

    // a fresh client sees no changes against the same tree
    auto other = h.client("bob", ws);
    const auto r = other.save({folder("/src"), file("/src/a.py", "a2"), file("/y.txt", "yyy")});
    EXPECT_TRUE(r.committed());
    EXPECT_TRUE(r.changes.empty());
}

TEST_F(SyncRoundTest, KindSwapCommits) {
    auto c = h.client("alice", ws);
    ASSERT_TRUE(c.save({file("/thing", "x")}).committed());
    const auto r = c.save({folder("/thing"), file("/thing/inner.py", "i")});

    ASSERT_TRUE(r.committed()) << r.error.value_or("");
    const auto m = committed();
    EXPECT_EQ(m.at("/thing").kind, EntryKind::Folder);
    EXPECT_EQ(m.at("/thing/inner.py").contentHash, blake2b("i"));
}

TEST_F(SyncRoundTest, InvalidLocalPathIsRejected) {
    auto c = h.client("alice", ws);
    const auto r = c.save({file("/a/../b.py", "x")});

    EXPECT_EQ(r.finalState, RoundState::Aborted);
    ASSERT_TRUE(r.userMessage);
    EXPECT_TRUE(r.userMessage->starts_with("changes rejected: "));
}

TEST_F(SyncRoundTest, ExecutionIsPinnedToCommittedVersion) {
    auto c = h.client("alice", ws);
    RoundOptions opts;
    opts.entrypoint = "/main.py";
    opts.input = "42";

    const auto r = c.save({file("/main.py", "print(input())"), file("/lib.py", "")}, opts);

    ASSERT_TRUE(r.committed());
    ASSERT_TRUE(r.job);
    EXPECT_EQ(r.job->workspaceVersion, 2u);
    EXPECT_FALSE(r.error);

    ASSERT_EQ(h.jobs->submitted.size(), 1u);
    const auto& payload = h.jobs->submitted[0];
    EXPECT_EQ(payload.jobId, r.job->jobId);
    EXPECT_EQ(payload.workspaceVersion, 2u);
    EXPECT_EQ(payload.entrypointFile, "/main.py");
    EXPECT_EQ(payload.language, "python");
    EXPECT_EQ(payload.input, "42");
    EXPECT_EQ(payload.bucket, "cosync-test");
    EXPECT_EQ(payload.files.size(), 2u);
}

TEST_F(SyncRoundTest, FailedExecutionKeepsCommit) {
    auto c = h.client("alice", ws);
    RoundOptions opts;
    opts.entrypoint = "/missing.py";

    const auto r = c.save({file("/main.py", "x")}, opts);

    EXPECT_TRUE(r.committed());
    EXPECT_EQ(r.workspaceVersion, 2u);
    EXPECT_FALSE(r.job);
    EXPECT_TRUE(r.error);
    EXPECT_EQ(r.userMessage, "saved, but execution could not be started");
    EXPECT_EQ(h.store->snapshot(ws).version, 2u);
}

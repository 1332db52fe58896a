#include "sync/server/Committer.hpp"
#include "sync/server/access.hpp"
#include "sync/model/Reservation.hpp"
#include "database/WorkspaceStore.hpp"
#include "storage/BlobStore.hpp"
#include "logging/LogRegistry.hpp"

#include <map>

using namespace cs::sync;
using namespace cs::sync::server;
using namespace cs::sync::model;
using namespace cs::database;
using namespace cs::storage;
using namespace cs::logging;

namespace {

ConfirmResponse conflict(const ConflictReason reason, const uint64_t current, std::string message) {
    ConfirmResponse r;
    r.status = ConfirmStatus::Conflict;
    r.reason = reason;
    r.currentVersion = current;
    r.errorMessage = std::move(message);
    return r;
}

ConfirmResponse success(const uint64_t version) {
    ConfirmResponse r;
    r.status = ConfirmStatus::Success;
    r.finalWorkspaceVersion = version;
    return r;
}

}

Committer::Committer(std::shared_ptr<WorkspaceStore> store, std::shared_ptr<BlobStore> blobs,
                     config::SyncConfig cfg, util::Clock clock)
    : store_(std::move(store)), blobs_(std::move(blobs)), cfg_(std::move(cfg)), clock_(std::move(clock)) {}

ConfirmResponse Committer::confirm(const std::string& workspaceId, const std::string& userId,
                                   const ConfirmRequest& request) const {
    const auto ws = requireMember(*store_, workspaceId, userId);

    if (request.reservationId.empty()) throw ValidationError("reservationId is required");

    const auto reservation = store_->getReservation(request.reservationId);
    if (!reservation || reservation->workspace_id != workspaceId)
        return conflict(ConflictReason::ReservationExpired, ws.version, "Reservation is unknown or has been purged");

    if (reservation->provisional_version != request.workspaceVersion)
        throw ValidationError("workspaceVersion " + std::to_string(request.workspaceVersion) +
                              " does not match the reserved version " + std::to_string(reservation->provisional_version));

    if (const auto* c = std::get_if<Committed>(&reservation->state)) {
        LogRegistry::sync()->info("[Committer] Replayed confirm for reservation {} (version {})", reservation->id, c->version);
        return success(c->version);
    }
    if (reservation->isSuperseded())
        return conflict(ConflictReason::Superseded, ws.version, "Another confirm on the same version won");

    const auto now = clock_();
    if (reservation->isExpired(now))
        return conflict(ConflictReason::ReservationExpired, ws.version, "Reservation expired before confirm");

    CommitPlan plan;
    plan.workspace_id = workspaceId;
    plan.reservation_id = reservation->id;
    plan.base_version = reservation->base_version;
    plan.actions = reconcile(*reservation, request.syncActions);
    plan.now = now;

    const auto outcome = store_->commit(plan);

    using Kind = CommitOutcome::Kind;
    switch (outcome.kind) {
    case Kind::Committed: {
        const auto deleted = deleteObsolete(workspaceId, outcome.version, outcome.obsolete_keys);
        LogRegistry::sync()->info("[Committer] Workspace {} committed at version {} by {}", workspaceId, outcome.version, userId);
        LogRegistry::audit()->info("workspace={} version={} user={} reservation={} actions={} blobs_deleted={} blobs_orphaned={}",
                                   workspaceId, outcome.version, userId, reservation->id, plan.actions.size(),
                                   deleted, outcome.obsolete_keys.size() - deleted);
        return success(outcome.version);
    }
    case Kind::AlreadyCommitted:
        return success(outcome.version);
    case Kind::VersionMoved:
        LogRegistry::sync()->info("[Committer] Version moved under reservation {} (workspace {} now at {})",
                                  reservation->id, workspaceId, outcome.version);
        return conflict(ConflictReason::VersionMoved, outcome.version, "Workspace version moved before confirm");
    case Kind::Superseded:
        return conflict(ConflictReason::Superseded, outcome.version, "Another confirm on the same version won");
    case Kind::Expired:
        return conflict(ConflictReason::ReservationExpired, outcome.version, "Reservation expired before confirm");
    }

    throw std::logic_error("Unhandled commit outcome: " + to_string(outcome.kind));
}

size_t Committer::deleteObsolete(const std::string& workspaceId, const uint64_t version,
                                 const std::vector<std::string>& keys) const {
    size_t deleted = 0;
    for (const auto& key : keys) {
        try {
            blobs_->deleteObject(key);
            ++deleted;
        } catch (const std::exception& e) {
            LogRegistry::sync()->warn("[Committer] Left orphaned blob {} after workspace {} v{}: {}",
                                      key, workspaceId, version, e.what());
        }
    }
    return deleted;
}

std::vector<FinalizedAction> Committer::reconcile(const Reservation& reservation,
                                                  const std::vector<FinalizedAction>& finalized) const {
    const auto& pending = reservation.pending().actions;

    if (finalized.size() != pending.size())
        throw ValidationError("Expected " + std::to_string(pending.size()) + " finalized actions, got " +
                              std::to_string(finalized.size()));

    // keyed by (path, fileId); a kind swap puts two actions on one path
    std::map<std::pair<std::string, std::string>, const FinalizedAction*> byKey;
    for (const auto& f : finalized)
        if (!byKey.emplace(std::make_pair(f.filePath, f.fileId), &f).second)
            throw ValidationError("Duplicate finalized action for " + f.filePath);

    std::vector<FinalizedAction> out;
    out.reserve(pending.size());

    for (const auto& p : pending) {
        const auto it = byKey.find({p.filePath, p.fileId});
        if (it == byKey.end()) throw ValidationError("Missing finalized action for " + p.filePath);
        const auto& f = *it->second;

        if (f.kind != p.kind) throw ValidationError("Kind mismatch for " + p.filePath);
        if (f.storageKey != p.storageKey) throw ValidationError("Storage key mismatch for " + p.filePath);

        FinalizedAction a;
        a.filePath = p.filePath;
        a.fileId = p.fileId;
        a.storageKey = p.storageKey;
        a.kind = p.kind;

        if (p.actionRequired == ActionRequired::Delete) {
            if (f.op != ConfirmOp::Delete) throw ValidationError("Expected delete for " + p.filePath);
            a.op = ConfirmOp::Delete;
        } else {
            if (f.op != ConfirmOp::Upsert) throw ValidationError("Expected upsert for " + p.filePath);
            a.op = ConfirmOp::Upsert;

            if (p.kind == EntryKind::File) {
                if (!f.clientHash || f.clientHash != p.expectedHash)
                    throw ValidationError("Content hash for " + p.filePath + " differs from the one declared at sync");
                if (!f.size) throw ValidationError("size is required for file " + p.filePath);
                if (*f.size > cfg_.max_file_size_bytes)
                    throw ValidationError("File " + p.filePath + " exceeds the maximum size of " +
                                          std::to_string(cfg_.max_file_size_bytes) + " bytes");
                a.clientHash = p.expectedHash;
                a.size = f.size;
            }
        }

        out.push_back(std::move(a));
    }

    return out;
}

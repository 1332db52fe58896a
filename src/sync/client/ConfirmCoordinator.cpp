#include "sync/client/ConfirmCoordinator.hpp"
#include "sync/client/ServerApi.hpp"
#include "sync/Errors.hpp"
#include "crypto/util/hash.hpp"
#include "logging/LogRegistry.hpp"

using namespace cs::sync;
using namespace cs::sync::client;
using namespace cs::sync::model;
using namespace cs::logging;

ConfirmCoordinator::ConfirmCoordinator(std::shared_ptr<ServerApi> api) : api_(std::move(api)) {}

std::vector<FinalizedAction> ConfirmCoordinator::finalize(const std::vector<SyncAction>& actions,
                                                          const std::unordered_map<std::string, std::string>& contents) {
    std::vector<FinalizedAction> out;

    for (const auto& a : actions) {
        if (a.actionRequired == ActionRequired::None) continue;

        FinalizedAction f;
        f.filePath = a.filePath;
        f.fileId = a.fileId;
        f.storageKey = a.storageKey;
        f.kind = a.kind;
        f.op = a.actionRequired == ActionRequired::Delete ? ConfirmOp::Delete : ConfirmOp::Upsert;

        if (f.op == ConfirmOp::Upsert && a.kind == EntryKind::File) {
            const auto it = contents.find(a.filePath);
            if (it == contents.end()) throw ValidationError("no local content for " + a.filePath);

            f.clientHash = crypto::hash::blake2b(it->second);
            f.size = it->second.size();
            if (a.expectedHash && f.clientHash != a.expectedHash)
                throw ValidationError(a.filePath + " changed after it was diffed");
        }

        out.push_back(std::move(f));
    }

    return out;
}

uint64_t ConfirmCoordinator::confirm(const std::string& workspaceId, const SyncResponse& accepted,
                                     const std::vector<FinalizedAction>& finalized) const {
    if (!accepted.provisionalVersion || !accepted.reservationId)
        throw SyncError("cannot confirm without a reservation");

    ConfirmRequest req;
    req.workspaceVersion = *accepted.provisionalVersion;
    req.reservationId = *accepted.reservationId;
    req.syncActions = finalized;

    const auto resp = api_->confirm(workspaceId, req);

    switch (resp.status) {
    case ConfirmStatus::Success: {
        const auto version = resp.finalWorkspaceVersion.value_or(req.workspaceVersion);
        LogRegistry::client()->info("[ConfirmCoordinator] Workspace {} committed at version {}", workspaceId, version);
        return version;
    }
    case ConfirmStatus::Conflict: {
        const auto reason = resp.reason.value_or(ConflictReason::VersionMoved);
        const auto current = resp.currentVersion.value_or(0);
        const auto msg = resp.errorMessage.value_or("confirm lost: " + to_string(reason));
        if (reason == ConflictReason::VersionMoved) throw VersionConflict(current, msg);
        throw ConfirmRaceLost(reason, current, msg);
    }
    case ConfirmStatus::Error:
        break;
    }

    throw SyncError(resp.errorMessage.value_or("confirm rejected by server"));
}

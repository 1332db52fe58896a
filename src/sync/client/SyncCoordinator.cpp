#include "sync/client/SyncCoordinator.hpp"
#include "sync/client/ServerApi.hpp"
#include "sync/Errors.hpp"
#include "logging/LogRegistry.hpp"

using namespace cs::sync;
using namespace cs::sync::client;
using namespace cs::sync::model;
using namespace cs::logging;

SyncCoordinator::SyncCoordinator(std::shared_ptr<ServerApi> api) : api_(std::move(api)) {}

SyncResponse SyncCoordinator::requestSync(const std::string& workspaceId, const uint64_t clientVersion,
                                          const std::vector<SyncFileClientState>& changes) const {
    SyncRequest req;
    req.workspaceVersion = clientVersion;
    req.files = changes;

    auto resp = api_->sync(workspaceId, req);

    switch (resp.status) {
    case SyncStatus::WorkspaceConflict: {
        const auto current = resp.currentVersion.value_or(0);
        throw VersionConflict(current, resp.errorMessage.value_or(
            "Workspace is at version " + std::to_string(current) + ", not " + std::to_string(clientVersion)));
    }
    case SyncStatus::Error:
        throw SyncError(resp.errorMessage.value_or("sync rejected by server"));
    case SyncStatus::Ok:
        if (!resp.provisionalVersion || !resp.reservationId)
            throw SyncError("sync accepted without a reservation");
        LogRegistry::client()->info("[SyncCoordinator] Reserved version {} ({} actions)",
                                    *resp.provisionalVersion, resp.actions.size());
        break;
    case SyncStatus::NoChanges:
        break;
    }

    return resp;
}

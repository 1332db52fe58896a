#pragma once

#include "sync/model/Messages.hpp"

#include <memory>
#include <string>
#include <vector>

namespace cs::sync::client {

class ServerApi;

// Phase 1 from the client side. Returns an Ok or NoChanges response;
// throws VersionConflict on workspace_conflict and SyncError on error.
class SyncCoordinator {
public:
    explicit SyncCoordinator(std::shared_ptr<ServerApi> api);

    model::SyncResponse requestSync(const std::string& workspaceId, uint64_t clientVersion,
                                    const std::vector<model::SyncFileClientState>& changes) const;

private:
    std::shared_ptr<ServerApi> api_;
};

}

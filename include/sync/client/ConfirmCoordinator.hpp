#pragma once

#include "sync/model/Messages.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace cs::sync::client {

class ServerApi;

// Phase 2 from the client side
class ConfirmCoordinator {
public:
    explicit ConfirmCoordinator(std::shared_ptr<ServerApi> api);

    // Restates every upload/delete action with the hash and size recomputed
    // from the uploaded bytes
    static std::vector<model::FinalizedAction> finalize(const std::vector<model::SyncAction>& actions,
                                                        const std::unordered_map<std::string, std::string>& contents);

    // Returns the committed version. Throws VersionConflict (version_moved),
    // ConfirmRaceLost (superseded, reservation_expired) or SyncError.
    uint64_t confirm(const std::string& workspaceId, const model::SyncResponse& accepted,
                     const std::vector<model::FinalizedAction>& finalized) const;

private:
    std::shared_ptr<ServerApi> api_;
};

}

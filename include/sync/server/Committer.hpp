#pragma once

#include "config/Config.hpp"
#include "sync/model/Messages.hpp"
#include "util/timestamp.hpp"

#include <memory>
#include <string>
#include <vector>

namespace cs::database {
class WorkspaceStore;
}

namespace cs::storage {
class BlobStore;
}

namespace cs::sync::model {
struct Reservation;
}

namespace cs::sync::server {

// Phase 2. Checks the finalized actions against the reservation they claim,
// then hands the store one atomic commit: compare-and-swap on the workspace
// version, manifest changes and reservation resolution. Blobs the new manifest
// dropped are deleted server-side only after that commit; a failed delete
// leaves an unreferenced object, never a dangling manifest entry.
class Committer {
public:
    Committer(std::shared_ptr<database::WorkspaceStore> store,
              std::shared_ptr<storage::BlobStore> blobs,
              config::SyncConfig cfg,
              util::Clock clock = util::systemNow);

    model::ConfirmResponse confirm(const std::string& workspaceId, const std::string& userId,
                                   const model::ConfirmRequest& request) const;

private:
    std::shared_ptr<database::WorkspaceStore> store_;
    std::shared_ptr<storage::BlobStore> blobs_;
    config::SyncConfig cfg_;
    util::Clock clock_;

    // Best effort; returns how many of `keys` were removed
    size_t deleteObsolete(const std::string& workspaceId, uint64_t version,
                          const std::vector<std::string>& keys) const;

    // Pending actions merged with the client's recomputed hash and size.
    // Throws ValidationError if the two sets disagree.
    std::vector<model::FinalizedAction> reconcile(const model::Reservation& reservation,
                                                  const std::vector<model::FinalizedAction>& finalized) const;
};

}

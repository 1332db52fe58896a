#pragma once

#include "config/Config.hpp"
#include "sync/model/Messages.hpp"
#include "util/timestamp.hpp"

#include <memory>
#include <string>

namespace cs::database {
class WorkspaceStore;
}

namespace cs::storage {
class BlobStore;
}

namespace cs::sync::server {

// Phase 1. Turns a client's change list into a prescribed action set and
// parks it as a Pending reservation on provisionalVersion = version + 1.
// Nothing durable besides that reservation is written.
class SyncValidator {
public:
    SyncValidator(std::shared_ptr<database::WorkspaceStore> store,
                  std::shared_ptr<storage::BlobStore> blobs,
                  config::SyncConfig cfg,
                  util::Clock clock = util::systemNow);

    model::SyncResponse validate(const std::string& workspaceId, const std::string& userId,
                                 const model::SyncRequest& request) const;

private:
    std::shared_ptr<database::WorkspaceStore> store_;
    std::shared_ptr<storage::BlobStore> blobs_;
    config::SyncConfig cfg_;
    util::Clock clock_;
};

}

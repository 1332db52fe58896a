#pragma once

#include "config/Config.hpp"
#include "sync/model/Messages.hpp"
#include "sync/model/Workspace.hpp"

#include <memory>
#include <string>
#include <vector>

namespace cs::database {
class WorkspaceStore;
}

namespace cs::storage {
class BlobStore;
}

namespace cs::sync::server {

// Workspace lifecycle and the read path: create, list, membership, manifest.
class WorkspaceService {
public:
    WorkspaceService(std::shared_ptr<database::WorkspaceStore> store,
                     std::shared_ptr<storage::BlobStore> blobs,
                     config::SyncConfig cfg);

    // The caller becomes the owner. Starts empty at version 1.
    model::Workspace create(const std::string& userId, const std::string& name) const;

    std::vector<model::WorkspaceSummary> list(const std::string& userId) const;

    // Owner only; re-adding a member updates the role
    void addMember(const std::string& workspaceId, const std::string& callerId,
                   const model::WorkspaceMember& member) const;

    // Committed manifest with a download capability per file
    model::ManifestResponse manifest(const std::string& workspaceId, const std::string& userId) const;

private:
    std::shared_ptr<database::WorkspaceStore> store_;
    std::shared_ptr<storage::BlobStore> blobs_;
    config::SyncConfig cfg_;
};

}

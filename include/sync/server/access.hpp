#pragma once

#include "sync/model/Workspace.hpp"

#include <string>

namespace cs::database {
class WorkspaceStore;
}

namespace cs::sync::server {

// Loads the workspace and checks the caller belongs to it.
// NotFoundError for an unknown workspace, ForbiddenError for a non-member.
model::Workspace requireMember(database::WorkspaceStore& store, const std::string& workspaceId,
                               const std::string& userId);

model::Workspace requireOwner(database::WorkspaceStore& store, const std::string& workspaceId,
                              const std::string& userId);

}

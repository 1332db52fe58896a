#include "sync/server/access.hpp"
#include "sync/Errors.hpp"
#include "database/WorkspaceStore.hpp"

using namespace cs::sync;
using namespace cs::sync::model;

Workspace cs::sync::server::requireMember(database::WorkspaceStore& store, const std::string& workspaceId,
                                          const std::string& userId) {
    if (userId.empty()) throw ForbiddenError("Missing caller identity");

    auto ws = store.getWorkspace(workspaceId);
    if (!ws) throw NotFoundError("Workspace not found: " + workspaceId);
    if (!ws->isMember(userId)) throw ForbiddenError("User " + userId + " is not a member of workspace " + workspaceId);
    return *ws;
}

Workspace cs::sync::server::requireOwner(database::WorkspaceStore& store, const std::string& workspaceId,
                                         const std::string& userId) {
    auto ws = requireMember(store, workspaceId, userId);
    if (!ws.isOwner(userId)) throw ForbiddenError("Only an owner can manage members of workspace " + workspaceId);
    return ws;
}

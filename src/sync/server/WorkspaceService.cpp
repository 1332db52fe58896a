#include "sync/server/WorkspaceService.hpp"
#include "sync/server/access.hpp"
#include "database/WorkspaceStore.hpp"
#include "storage/BlobStore.hpp"
#include "crypto/util/uuid.hpp"
#include "logging/LogRegistry.hpp"

using namespace cs::sync;
using namespace cs::sync::server;
using namespace cs::sync::model;
using namespace cs::database;
using namespace cs::storage;
using namespace cs::logging;

namespace {
constexpr size_t MAX_WORKSPACE_NAME_LENGTH = 255;
}

WorkspaceService::WorkspaceService(std::shared_ptr<WorkspaceStore> store, std::shared_ptr<BlobStore> blobs,
                                   config::SyncConfig cfg)
    : store_(std::move(store)), blobs_(std::move(blobs)), cfg_(std::move(cfg)) {}

Workspace WorkspaceService::create(const std::string& userId, const std::string& name) const {
    if (userId.empty()) throw ForbiddenError("Missing caller identity");
    if (name.empty()) throw ValidationError("Workspace name is required");
    if (name.size() > MAX_WORKSPACE_NAME_LENGTH) throw ValidationError("Workspace name is too long");

    auto ws = store_->createWorkspace(crypto::util::uuid4_hex(), name, userId);
    LogRegistry::sync()->info("[WorkspaceService] Created workspace {} ('{}') for {}", ws.id, ws.name, userId);
    return ws;
}

std::vector<WorkspaceSummary> WorkspaceService::list(const std::string& userId) const {
    if (userId.empty()) throw ForbiddenError("Missing caller identity");
    return store_->listWorkspaces(userId);
}

void WorkspaceService::addMember(const std::string& workspaceId, const std::string& callerId,
                                 const WorkspaceMember& member) const {
    requireOwner(*store_, workspaceId, callerId);

    if (member.user_id.empty()) throw ValidationError("userId is required");
    if (member.role != ROLE_OWNER && member.role != ROLE_EDITOR)
        throw ValidationError("Unknown role: " + member.role);

    store_->addMember(workspaceId, member);
    LogRegistry::sync()->info("[WorkspaceService] {} added {} to workspace {} as {}",
                              callerId, member.user_id, workspaceId, member.role);
}

ManifestResponse WorkspaceService::manifest(const std::string& workspaceId, const std::string& userId) const {
    requireMember(*store_, workspaceId, userId);

    auto snap = store_->snapshot(workspaceId);

    ManifestResponse resp;
    resp.workspaceVersion = snap.version;
    resp.manifest.reserve(snap.entries.size());

    for (auto& e : snap.entries) {
        ManifestItem item;
        if (e.isFile() && e.storageKey) item.contentUrl = blobs_->presignGet(*e.storageKey, cfg_.download_capability_ttl);
        item.entry = std::move(e);
        resp.manifest.push_back(std::move(item));
    }

    return resp;
}

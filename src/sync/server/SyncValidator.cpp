#include "sync/server/SyncValidator.hpp"
#include "sync/server/access.hpp"
#include "sync/model/path.hpp"
#include "sync/model/Reservation.hpp"
#include "database/WorkspaceStore.hpp"
#include "storage/BlobStore.hpp"
#include "crypto/util/uuid.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <unordered_set>

using namespace cs::sync;
using namespace cs::sync::server;
using namespace cs::sync::model;
using namespace cs::database;
using namespace cs::storage;
using namespace cs::logging;

namespace {

constexpr size_t MAX_HASH_LENGTH = 128;

// The hash becomes the last segment of a storage key
bool isHexDigest(const std::string& h) {
    if (h.empty() || h.size() > MAX_HASH_LENGTH) return false;
    return std::all_of(h.begin(), h.end(), [](const unsigned char c) {
        return std::isdigit(c) || (c >= 'a' && c <= 'f');
    });
}

SyncAction noneAction(const SyncFileClientState& change, const ManifestEntry* entry, std::string message) {
    SyncAction a;
    a.filePath = change.filePath;
    a.kind = change.kind;
    a.actionRequired = ActionRequired::None;
    if (entry) {
        a.fileId = entry->fileId;
        a.storageKey = entry->storageKey.value_or("");
    }
    a.message = std::move(message);
    return a;
}

// A path may carry at most one delete and one add, and only as a kind swap
void checkDuplicates(const std::vector<SyncFileClientState>& files) {
    struct Seen { const SyncFileClientState* removal = nullptr; const SyncFileClientState* addition = nullptr; };
    std::unordered_map<std::string, Seen> seen;

    for (const auto& f : files) {
        auto& s = seen[f.filePath];
        auto& slot = f.action == ChangeAction::Deleted ? s.removal : s.addition;
        if (slot) throw ValidationError("Duplicate change for path: " + f.filePath);
        slot = &f;
        if (s.removal && s.addition && s.removal->kind == s.addition->kind)
            throw ValidationError("Delete and re-add of the same kind at: " + f.filePath);
    }
}

}

SyncValidator::SyncValidator(std::shared_ptr<WorkspaceStore> store, std::shared_ptr<BlobStore> blobs,
                             config::SyncConfig cfg, util::Clock clock)
    : store_(std::move(store)), blobs_(std::move(blobs)), cfg_(std::move(cfg)), clock_(std::move(clock)) {}

SyncResponse SyncValidator::validate(const std::string& workspaceId, const std::string& userId,
                                     const SyncRequest& request) const {
    requireMember(*store_, workspaceId, userId);

    for (const auto& f : request.files) validatePath(f.filePath);
    checkDuplicates(request.files);

    const auto snap = store_->snapshot(workspaceId);

    SyncResponse resp;
    if (request.workspaceVersion != snap.version) {
        LogRegistry::sync()->info("[SyncValidator] Stale sync on workspace {}: client at {}, current {}",
                                  workspaceId, request.workspaceVersion, snap.version);
        resp.status = SyncStatus::WorkspaceConflict;
        resp.currentVersion = snap.version;
        resp.errorMessage = "Workspace has moved to version " + std::to_string(snap.version);
        return resp;
    }

    std::unordered_map<std::string, const ManifestEntry*> byPath;
    for (const auto& e : snap.entries) byPath.emplace(e.filePath, &e);

    std::unordered_set<std::string> replaced;
    for (const auto& f : request.files) {
        if (f.action != ChangeAction::Deleted) continue;
        if (const auto it = byPath.find(f.filePath); it != byPath.end() && it->second->kind == f.kind)
            replaced.insert(f.filePath);
    }

    bool anyWork = false;

    for (const auto& change : request.files) {
        const auto it = byPath.find(change.filePath);
        const ManifestEntry* entry = it == byPath.end() ? nullptr : it->second;

        if (change.action == ChangeAction::Unchanged) {
            resp.actions.push_back(noneAction(change, entry, "unchanged"));
            continue;
        }

        if (change.action == ChangeAction::Deleted) {
            if (!entry) {
                resp.actions.push_back(noneAction(change, nullptr, "not in manifest"));
                continue;
            }
            if (entry->kind != change.kind)
                throw ValidationError("Kind mismatch for " + change.filePath + ": manifest has " + to_string(entry->kind));

            SyncAction a;
            a.filePath = change.filePath;
            a.fileId = entry->fileId;
            a.storageKey = entry->storageKey.value_or("");
            a.kind = entry->kind;
            a.actionRequired = ActionRequired::Delete;
            resp.actions.push_back(std::move(a));
            anyWork = true;
            continue;
        }

        // New or Modified. An entry being deleted in the same request no longer counts.
        if (entry && replaced.contains(change.filePath)) entry = nullptr;

        if (change.kind == EntryKind::Folder && change.action == ChangeAction::Modified)
            throw ValidationError("Folders cannot be modified: " + change.filePath);

        if (entry && entry->kind != change.kind)
            throw ValidationError("Kind mismatch for " + change.filePath + ": manifest has " + to_string(entry->kind));

        if (change.kind == EntryKind::Folder) {
            if (entry) {
                resp.actions.push_back(noneAction(change, entry, "folder exists"));
                continue;
            }
            SyncAction a;
            a.filePath = change.filePath;
            a.fileId = crypto::util::uuid4_hex();
            a.kind = EntryKind::Folder;
            a.actionRequired = ActionRequired::Upload;
            resp.actions.push_back(std::move(a));
            anyWork = true;
            continue;
        }

        if (!change.clientHash) throw ValidationError("clientHash is required for file " + change.filePath);
        if (!isHexDigest(*change.clientHash))
            throw ValidationError("clientHash is not a hex digest for file " + change.filePath);

        if (entry && entry->contentHash == change.clientHash) {
            resp.actions.push_back(noneAction(change, entry, "hash matches"));
            continue;
        }

        SyncAction a;
        a.filePath = change.filePath;
        a.fileId = entry ? entry->fileId : crypto::util::uuid4_hex();
        a.storageKey = fileObjectKey(workspaceId, a.fileId, *change.clientHash);
        a.kind = EntryKind::File;
        a.actionRequired = ActionRequired::Upload;
        a.expectedHash = change.clientHash;
        a.uploadCapability = blobs_->presignPut(a.storageKey, cfg_.upload_capability_ttl);
        resp.actions.push_back(std::move(a));
        anyWork = true;
    }

    if (!anyWork) {
        resp.status = SyncStatus::NoChanges;
        resp.currentVersion = snap.version;
        return resp;
    }

    const auto now = clock_();

    Reservation r;
    r.id = crypto::util::uuid4_hex();
    r.workspace_id = workspaceId;
    r.base_version = snap.version;
    r.provisional_version = snap.version + 1;
    r.created_by = userId;
    r.created_at = now;

    Pending pending;
    pending.expires_at = now + cfg_.reservation_ttl.count();
    for (const auto& a : resp.actions) {
        if (a.actionRequired == ActionRequired::None) continue;
        auto stored = a;
        stored.uploadCapability.reset();
        pending.actions.push_back(std::move(stored));
    }
    r.state = std::move(pending);

    store_->saveReservation(r);

    LogRegistry::sync()->info("[SyncValidator] Reserved version {} on workspace {} for {} ({} actions, reservation {})",
                              r.provisional_version, workspaceId, userId, r.pending().actions.size(), r.id);

    resp.status = SyncStatus::Ok;
    resp.provisionalVersion = r.provisional_version;
    resp.reservationId = r.id;
    return resp;
}

#include "sync/client/WorkspaceCache.hpp"
#include "logging/LogRegistry.hpp"

using namespace cs::sync::client;
using namespace cs::sync::model;
using namespace cs::logging;

WorkspaceCache::WorkspaceCache(std::string workspaceId) : workspace_id_(std::move(workspaceId)) {}

void WorkspaceCache::load(const ManifestResponse& manifest) {
    entries_.clear();
    for (const auto& item : manifest.manifest) entries_[item.entry.filePath] = item.entry;
    version_ = manifest.workspaceVersion;
    stale_ = false;
    LogRegistry::client()->debug("[WorkspaceCache] Loaded {} entries at version {}", entries_.size(), version_);
}

void WorkspaceCache::applyCommitted(const uint64_t version, const std::vector<FinalizedAction>& actions) {
    for (const auto& a : actions)
        if (a.op == ConfirmOp::Delete) entries_.erase(a.filePath);

    for (const auto& a : actions) {
        if (a.op != ConfirmOp::Upsert) continue;

        ManifestEntry e;
        e.filePath = a.filePath;
        e.fileId = a.fileId;
        e.kind = a.kind;
        if (a.kind == EntryKind::File) {
            e.storageKey = a.storageKey;
            e.contentHash = a.clientHash;
            e.size = a.size;
        }
        entries_[a.filePath] = std::move(e);
    }

    version_ = version;
    stale_ = false;
}

std::vector<ManifestEntry> WorkspaceCache::entries() const {
    std::vector<ManifestEntry> out;
    out.reserve(entries_.size());
    for (const auto& [_, e] : entries_) out.push_back(e);
    return out;
}

std::optional<ManifestEntry> WorkspaceCache::find(const std::string& path) const {
    const auto it = entries_.find(path);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

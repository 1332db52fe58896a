#include "sync/Differ.hpp"
#include "sync/Errors.hpp"
#include "sync/model/path.hpp"
#include "crypto/util/hash.hpp"

#include <algorithm>
#include <map>

using namespace cs::sync;
using namespace cs::sync::model;

std::vector<SyncFileClientState> Differ::diff(const std::vector<ClientFileState>& local,
                                              const std::vector<ManifestEntry>& manifest) {
    std::map<std::string, const ClientFileState*> L;
    std::map<std::string, const ManifestEntry*> R;

    for (const auto& f : local) {
        validatePath(f.filePath);
        if (!L.emplace(f.filePath, &f).second)
            throw ValidationError("Duplicate client path: " + f.filePath);
    }
    for (const auto& e : manifest) R.emplace(e.filePath, &e);

    std::vector<SyncFileClientState> out;

    const auto added = [&](const ClientFileState& f) {
        SyncFileClientState c{ .filePath = f.filePath, .kind = f.kind, .action = ChangeAction::New, .clientHash = std::nullopt };
        if (f.kind == EntryKind::File) c.clientHash = crypto::hash::blake2b(f.content);
        out.push_back(std::move(c));
    };

    const auto removed = [&](const ManifestEntry& e) {
        out.push_back({ .filePath = e.filePath, .kind = e.kind, .action = ChangeAction::Deleted, .clientHash = std::nullopt });
    };

    for (const auto& [path, f] : L) {
        const auto it = R.find(path);
        if (it == R.end()) {
            added(*f);
            continue;
        }

        const auto& e = *it->second;
        if (e.kind != f->kind) {
            removed(e);
            added(*f);
            continue;
        }

        if (f->kind == EntryKind::Folder) continue;

        auto hash = crypto::hash::blake2b(f->content);
        if (e.contentHash && *e.contentHash == hash) continue;

        out.push_back({ .filePath = path, .kind = EntryKind::File, .action = ChangeAction::Modified, .clientHash = std::move(hash) });
    }

    for (const auto& [path, e] : R)
        if (!L.contains(path)) removed(*e);

    std::ranges::sort(out, [](const SyncFileClientState& a, const SyncFileClientState& b) {
        if (a.filePath != b.filePath) return a.filePath < b.filePath;
        return a.action == ChangeAction::Deleted && b.action != ChangeAction::Deleted;
    });

    return out;
}

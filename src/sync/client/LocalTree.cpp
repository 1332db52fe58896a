#include "sync/client/LocalTree.hpp"
#include "sync/model/path.hpp"
#include "sync/Errors.hpp"
#include "storage/BlobTransport.hpp"
#include "crypto/util/hash.hpp"
#include "logging/LogRegistry.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace cs::sync;
using namespace cs::sync::client;
using namespace cs::sync::model;
using namespace cs::logging;
namespace fs = std::filesystem;

namespace {

bool isHidden(const fs::path& p) {
    const auto name = p.filename().string();
    return !name.empty() && name.front() == '.';
}

std::string readFile(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in) throw std::runtime_error("Failed to open file: " + p.string());
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

fs::path localPath(const fs::path& root, const std::string& workspacePath) {
    return root / fs::path(workspacePath).relative_path();
}

}

std::vector<ClientFileState> LocalTree::scan(const fs::path& root) {
    if (!fs::is_directory(root)) throw std::runtime_error("Not a directory: " + root.string());

    std::vector<ClientFileState> out;
    for (auto it = fs::recursive_directory_iterator(root); it != fs::recursive_directory_iterator(); ++it) {
        if (isHidden(it->path())) {
            if (it->is_directory()) it.disable_recursion_pending();
            continue;
        }

        ClientFileState s;
        s.filePath = toWorkspacePath(fs::relative(it->path(), root).generic_string());

        if (it->is_directory()) s.kind = EntryKind::Folder;
        else if (it->is_regular_file()) {
            s.kind = EntryKind::File;
            s.content = readFile(it->path());
        } else continue;

        out.push_back(std::move(s));
    }

    LogRegistry::client()->debug("[LocalTree] Scanned {} entries under {}", out.size(), root.string());
    return out;
}

size_t LocalTree::materialize(const fs::path& root, const ManifestResponse& manifest, storage::BlobTransport& transport) {
    size_t written = 0;

    // Folders first so every file has a parent
    for (const auto& item : manifest.manifest)
        if (item.entry.kind == EntryKind::Folder) fs::create_directories(localPath(root, item.entry.filePath));

    for (const auto& item : manifest.manifest) {
        const auto& e = item.entry;
        if (e.kind != EntryKind::File) continue;
        if (!item.contentUrl) throw SyncError("No content URL for " + e.filePath);

        const auto bytes = transport.get(*item.contentUrl);
        if (e.contentHash && crypto::hash::blake2b(bytes) != *e.contentHash)
            throw SyncError("Downloaded content for " + e.filePath + " does not match its hash");

        const auto target = localPath(root, e.filePath);
        fs::create_directories(target.parent_path());
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out) throw std::runtime_error("Failed to write file: " + target.string());
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        ++written;
    }

    LogRegistry::client()->info("[LocalTree] Wrote {} files at version {} into {}",
                                written, manifest.workspaceVersion, root.string());
    return written;
}

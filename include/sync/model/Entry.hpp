#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace pqxx {
class row;
}

namespace cs::sync::model {

enum class EntryKind { File, Folder };

std::string to_string(EntryKind k);
EntryKind entryKindFromString(const std::string& s);

// One committed path in a workspace. Folders carry no storage key, hash or size.
struct ManifestEntry {
    std::string filePath;
    std::string fileId;
    EntryKind kind{EntryKind::File};
    std::optional<std::string> storageKey;
    std::optional<std::string> contentHash;
    std::optional<uint64_t> size;
    std::time_t created_at{};
    std::time_t updated_at{};

    ManifestEntry() = default;
    explicit ManifestEntry(const pqxx::row& row);

    [[nodiscard]] bool isFile() const { return kind == EntryKind::File; }
};

// Local mirror of one path as the client currently sees it.
struct ClientFileState {
    std::string filePath;
    EntryKind kind{EntryKind::File};
    std::string content;                        // raw bytes, files only
    std::optional<std::string> lastKnownHash;   // hash at the last successful sync
};

void to_json(nlohmann::json& j, const ManifestEntry& e);
void from_json(const nlohmann::json& j, ManifestEntry& e);

}

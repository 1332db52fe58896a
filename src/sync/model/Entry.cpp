#include "sync/model/Entry.hpp"
#include "util/json.hpp"
#include "util/timestamp.hpp"

#include <pqxx/row>
#include <nlohmann/json.hpp>

using namespace cs::sync::model;
using namespace cs::util;

std::string cs::sync::model::to_string(const EntryKind k) {
    switch (k) {
        case EntryKind::File: return "file";
        case EntryKind::Folder: return "folder";
        default: throw std::invalid_argument("Unknown entry kind");
    }
}

EntryKind cs::sync::model::entryKindFromString(const std::string& s) {
    if (s == "file") return EntryKind::File;
    if (s == "folder") return EntryKind::Folder;
    throw std::invalid_argument("Unknown entry kind: " + s);
}

ManifestEntry::ManifestEntry(const pqxx::row& row)
    : filePath(row.at("file_path").as<std::string>()),
      fileId(row.at("file_id").as<std::string>()),
      kind(entryKindFromString(row.at("kind").as<std::string>())),
      created_at(parsePostgresTimestamp(row.at("created_at").as<std::string>())),
      updated_at(parsePostgresTimestamp(row.at("updated_at").as<std::string>())) {
    if (!row.at("storage_key").is_null()) storageKey = row.at("storage_key").as<std::string>();
    if (!row.at("content_hash").is_null()) contentHash = row.at("content_hash").as<std::string>();
    if (!row.at("size_bytes").is_null()) size = row.at("size_bytes").as<uint64_t>();
}

void cs::sync::model::to_json(nlohmann::json& j, const ManifestEntry& e) {
    j = {
        {"filePath", e.filePath},
        {"fileId", e.fileId},
        {"kind", to_string(e.kind)},
        {"createdAt", timestampToString(e.created_at)},
        {"updatedAt", timestampToString(e.updated_at)}
    };
    put_optional(j, "storageKey", e.storageKey);
    put_optional(j, "contentHash", e.contentHash);
    put_optional(j, "size", e.size);
}

void cs::sync::model::from_json(const nlohmann::json& j, ManifestEntry& e) {
    e.filePath = j.at("filePath").get<std::string>();
    e.fileId = j.at("fileId").get<std::string>();
    e.kind = entryKindFromString(j.at("kind").get<std::string>());
    e.storageKey = get_optional<std::string>(j, "storageKey");
    e.contentHash = get_optional<std::string>(j, "contentHash");
    e.size = get_optional<uint64_t>(j, "size");
    if (j.contains("createdAt")) e.created_at = parseTimestampFromString(j.at("createdAt").get<std::string>());
    if (j.contains("updatedAt")) e.updated_at = parseTimestampFromString(j.at("updatedAt").get<std::string>());
}

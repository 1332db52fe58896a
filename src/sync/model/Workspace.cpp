#include "sync/model/Workspace.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <pqxx/row>
#include <nlohmann/json.hpp>

using namespace cs::sync::model;
using namespace cs::util;

Workspace::Workspace(const pqxx::row& row)
    : id(row.at("id").as<std::string>()),
      name(row.at("name").as<std::string>()),
      version(row.at("version").as<uint64_t>()),
      created_by(row.at("created_by").as<std::string>()),
      created_at(parsePostgresTimestamp(row.at("created_at").as<std::string>())) {}

bool Workspace::isMember(const std::string& userId) const {
    return std::ranges::any_of(members, [&](const WorkspaceMember& m) { return m.user_id == userId; });
}

bool Workspace::isOwner(const std::string& userId) const {
    return std::ranges::any_of(members, [&](const WorkspaceMember& m) {
        return m.user_id == userId && m.role == ROLE_OWNER;
    });
}

void cs::sync::model::to_json(nlohmann::json& j, const Workspace& w) {
    j = {
        {"workspaceId", w.id},
        {"name", w.name},
        {"createdBy", w.created_by},
        {"createdAt", timestampToString(w.created_at)},
        {"version", w.version}
    };
}

void cs::sync::model::to_json(nlohmann::json& j, const WorkspaceSummary& s) {
    j = {
        {"workspaceId", s.id},
        {"name", s.name},
        {"createdBy", s.created_by},
        {"createdAt", timestampToString(s.created_at)},
        {"userRole", s.user_role}
    };
}

void cs::sync::model::from_json(const nlohmann::json& j, WorkspaceSummary& s) {
    s.id = j.at("workspaceId").get<std::string>();
    s.name = j.at("name").get<std::string>();
    s.created_by = j.value("createdBy", "");
    if (j.contains("createdAt")) s.created_at = parseTimestampFromString(j.at("createdAt").get<std::string>());
    s.user_role = j.value("userRole", "");
}

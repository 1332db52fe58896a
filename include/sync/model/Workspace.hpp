#pragma once

#include <cstdint>
#include <ctime>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace pqxx {
class row;
}

namespace cs::sync::model {

inline constexpr uint64_t INITIAL_WORKSPACE_VERSION = 1;

inline constexpr auto ROLE_OWNER = "owner";
inline constexpr auto ROLE_EDITOR = "editor";

struct WorkspaceMember {
    std::string user_id;
    std::string role;
};

struct Workspace {
    std::string id;
    std::string name;
    uint64_t version{INITIAL_WORKSPACE_VERSION};
    std::string created_by;
    std::time_t created_at{};
    std::vector<WorkspaceMember> members;

    Workspace() = default;
    explicit Workspace(const pqxx::row& row);

    [[nodiscard]] bool isMember(const std::string& userId) const;
    [[nodiscard]] bool isOwner(const std::string& userId) const;
};

// Listing view: one workspace plus the caller's role in it
struct WorkspaceSummary {
    std::string id;
    std::string name;
    std::string created_by;
    std::time_t created_at{};
    std::string user_role;
};

void to_json(nlohmann::json& j, const Workspace& w);
void to_json(nlohmann::json& j, const WorkspaceSummary& s);
void from_json(const nlohmann::json& j, WorkspaceSummary& s);

}

#include "sync/model/Change.hpp"
#include "util/json.hpp"

#include <nlohmann/json.hpp>

using namespace cs::sync::model;
using namespace cs::util;

std::string cs::sync::model::to_string(const ChangeAction a) {
    switch (a) {
        case ChangeAction::New: return "new";
        case ChangeAction::Modified: return "modified";
        case ChangeAction::Deleted: return "deleted";
        case ChangeAction::Unchanged: return "unchanged";
        default: throw std::invalid_argument("Unknown change action");
    }
}

ChangeAction cs::sync::model::changeActionFromString(const std::string& s) {
    if (s == "new") return ChangeAction::New;
    if (s == "modified") return ChangeAction::Modified;
    if (s == "deleted") return ChangeAction::Deleted;
    if (s == "unchanged") return ChangeAction::Unchanged;
    throw std::invalid_argument("Unknown change action: " + s);
}

void cs::sync::model::to_json(nlohmann::json& j, const SyncFileClientState& c) {
    j = {
        {"filePath", c.filePath},
        {"kind", to_string(c.kind)},
        {"action", to_string(c.action)}
    };
    put_optional(j, "clientHash", c.clientHash);
}

void cs::sync::model::from_json(const nlohmann::json& j, SyncFileClientState& c) {
    c.filePath = j.at("filePath").get<std::string>();
    c.kind = entryKindFromString(j.at("kind").get<std::string>());
    c.action = changeActionFromString(j.at("action").get<std::string>());
    c.clientHash = get_optional<std::string>(j, "clientHash");
}

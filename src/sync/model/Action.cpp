#include "sync/model/Action.hpp"
#include "util/json.hpp"

#include <pqxx/row>
#include <nlohmann/json.hpp>

using namespace cs::sync::model;
using namespace cs::util;

std::string cs::sync::model::to_string(const ActionRequired a) {
    switch (a) {
        case ActionRequired::Upload: return "upload";
        case ActionRequired::Delete: return "delete";
        case ActionRequired::None: return "none";
        default: throw std::invalid_argument("Unknown action");
    }
}

ActionRequired cs::sync::model::actionRequiredFromString(const std::string& s) {
    if (s == "upload") return ActionRequired::Upload;
    if (s == "delete") return ActionRequired::Delete;
    if (s == "none") return ActionRequired::None;
    throw std::invalid_argument("Unknown action: " + s);
}

std::string cs::sync::model::to_string(const ConfirmOp op) {
    switch (op) {
        case ConfirmOp::Upsert: return "upsert";
        case ConfirmOp::Delete: return "delete";
        default: throw std::invalid_argument("Unknown confirm op");
    }
}

ConfirmOp cs::sync::model::confirmOpFromString(const std::string& s) {
    if (s == "upsert") return ConfirmOp::Upsert;
    if (s == "delete") return ConfirmOp::Delete;
    throw std::invalid_argument("Unknown confirm op: " + s);
}

// reservation_actions row; capabilities are never persisted
SyncAction::SyncAction(const pqxx::row& row)
    : filePath(row.at("file_path").as<std::string>()),
      fileId(row.at("file_id").as<std::string>()),
      storageKey(row.at("storage_key").as<std::string>("")),
      kind(entryKindFromString(row.at("kind").as<std::string>())),
      actionRequired(actionRequiredFromString(row.at("action_required").as<std::string>())) {
    if (!row.at("expected_hash").is_null()) expectedHash = row.at("expected_hash").as<std::string>();
}

void cs::sync::model::to_json(nlohmann::json& j, const SyncAction& a) {
    j = {
        {"filePath", a.filePath},
        {"fileId", a.fileId},
        {"storageKey", a.storageKey},
        {"kind", to_string(a.kind)},
        {"actionRequired", to_string(a.actionRequired)}
    };
    put_optional(j, "uploadCapability", a.uploadCapability);
    put_optional(j, "expectedHash", a.expectedHash);
    put_optional(j, "message", a.message);
}

void cs::sync::model::from_json(const nlohmann::json& j, SyncAction& a) {
    a.filePath = j.at("filePath").get<std::string>();
    a.fileId = j.at("fileId").get<std::string>();
    a.storageKey = j.value("storageKey", "");
    a.kind = entryKindFromString(j.at("kind").get<std::string>());
    a.actionRequired = actionRequiredFromString(j.at("actionRequired").get<std::string>());
    a.uploadCapability = get_optional<std::string>(j, "uploadCapability");
    a.expectedHash = get_optional<std::string>(j, "expectedHash");
    a.message = get_optional<std::string>(j, "message");
}

void cs::sync::model::to_json(nlohmann::json& j, const FinalizedAction& a) {
    j = {
        {"filePath", a.filePath},
        {"fileId", a.fileId},
        {"storageKey", a.storageKey},
        {"action", to_string(a.op)},
        {"kind", to_string(a.kind)}
    };
    put_optional(j, "clientHash", a.clientHash);
    put_optional(j, "size", a.size);
}

void cs::sync::model::from_json(const nlohmann::json& j, FinalizedAction& a) {
    a.filePath = j.at("filePath").get<std::string>();
    a.fileId = j.at("fileId").get<std::string>();
    a.storageKey = j.value("storageKey", "");
    a.op = confirmOpFromString(j.at("action").get<std::string>());
    a.kind = entryKindFromString(j.at("kind").get<std::string>());
    a.clientHash = get_optional<std::string>(j, "clientHash");
    a.size = get_optional<uint64_t>(j, "size");
}

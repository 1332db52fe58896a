#include "sync/model/Messages.hpp"
#include "util/json.hpp"

#include <nlohmann/json.hpp>

using namespace cs::sync;
using namespace cs::sync::model;
using namespace cs::util;

std::string cs::sync::model::to_string(const SyncStatus s) {
    switch (s) {
        case SyncStatus::Ok: return "ok";
        case SyncStatus::NoChanges: return "no_changes";
        case SyncStatus::WorkspaceConflict: return "workspace_conflict";
        case SyncStatus::Error: return "error";
        default: throw std::invalid_argument("Unknown sync status");
    }
}

SyncStatus cs::sync::model::syncStatusFromString(const std::string& s) {
    if (s == "ok") return SyncStatus::Ok;
    if (s == "no_changes") return SyncStatus::NoChanges;
    if (s == "workspace_conflict") return SyncStatus::WorkspaceConflict;
    if (s == "error") return SyncStatus::Error;
    throw std::invalid_argument("Unknown sync status: " + s);
}

std::string cs::sync::model::to_string(const ConfirmStatus s) {
    switch (s) {
        case ConfirmStatus::Success: return "success";
        case ConfirmStatus::Conflict: return "conflict";
        case ConfirmStatus::Error: return "error";
        default: throw std::invalid_argument("Unknown confirm status");
    }
}

ConfirmStatus cs::sync::model::confirmStatusFromString(const std::string& s) {
    if (s == "success") return ConfirmStatus::Success;
    if (s == "conflict") return ConfirmStatus::Conflict;
    if (s == "error") return ConfirmStatus::Error;
    throw std::invalid_argument("Unknown confirm status: " + s);
}

void cs::sync::model::to_json(nlohmann::json& j, const SyncRequest& r) {
    j = {
        {"workspaceVersion", r.workspaceVersion},
        {"files", r.files}
    };
}

void cs::sync::model::from_json(const nlohmann::json& j, SyncRequest& r) {
    r.workspaceVersion = j.at("workspaceVersion").get<uint64_t>();
    r.files = j.at("files").get<std::vector<SyncFileClientState>>();
}

void cs::sync::model::to_json(nlohmann::json& j, const SyncResponse& r) {
    j = {
        {"status", to_string(r.status)},
        {"actions", r.actions}
    };
    put_optional(j, "provisionalVersion", r.provisionalVersion);
    put_optional(j, "reservationId", r.reservationId);
    put_optional(j, "currentVersion", r.currentVersion);
    put_optional(j, "errorMessage", r.errorMessage);
}

void cs::sync::model::from_json(const nlohmann::json& j, SyncResponse& r) {
    r.status = syncStatusFromString(j.at("status").get<std::string>());
    if (j.contains("actions")) r.actions = j.at("actions").get<std::vector<SyncAction>>();
    r.provisionalVersion = get_optional<uint64_t>(j, "provisionalVersion");
    r.reservationId = get_optional<std::string>(j, "reservationId");
    r.currentVersion = get_optional<uint64_t>(j, "currentVersion");
    r.errorMessage = get_optional<std::string>(j, "errorMessage");
}

void cs::sync::model::to_json(nlohmann::json& j, const ConfirmRequest& r) {
    j = {
        {"workspaceVersion", r.workspaceVersion},
        {"reservationId", r.reservationId},
        {"syncActions", r.syncActions}
    };
}

void cs::sync::model::from_json(const nlohmann::json& j, ConfirmRequest& r) {
    r.workspaceVersion = j.at("workspaceVersion").get<uint64_t>();
    r.reservationId = j.at("reservationId").get<std::string>();
    r.syncActions = j.at("syncActions").get<std::vector<FinalizedAction>>();
}

void cs::sync::model::to_json(nlohmann::json& j, const ConfirmResponse& r) {
    j = {{"status", to_string(r.status)}};
    if (r.reason) j["reason"] = to_string(*r.reason);
    put_optional(j, "finalWorkspaceVersion", r.finalWorkspaceVersion);
    put_optional(j, "currentVersion", r.currentVersion);
    put_optional(j, "errorMessage", r.errorMessage);
}

void cs::sync::model::from_json(const nlohmann::json& j, ConfirmResponse& r) {
    r.status = confirmStatusFromString(j.at("status").get<std::string>());
    if (const auto reason = get_optional<std::string>(j, "reason")) r.reason = conflictReasonFromString(*reason);
    r.finalWorkspaceVersion = get_optional<uint64_t>(j, "finalWorkspaceVersion");
    r.currentVersion = get_optional<uint64_t>(j, "currentVersion");
    r.errorMessage = get_optional<std::string>(j, "errorMessage");
}

void cs::sync::model::to_json(nlohmann::json& j, const ManifestItem& m) {
    to_json(j, m.entry);
    put_optional(j, "contentUrl", m.contentUrl);
}

void cs::sync::model::from_json(const nlohmann::json& j, ManifestItem& m) {
    from_json(j, m.entry);
    m.contentUrl = get_optional<std::string>(j, "contentUrl");
}

void cs::sync::model::to_json(nlohmann::json& j, const ManifestResponse& r) {
    j = {
        {"manifest", r.manifest},
        {"workspaceVersion", r.workspaceVersion}
    };
}

void cs::sync::model::from_json(const nlohmann::json& j, ManifestResponse& r) {
    r.manifest = j.at("manifest").get<std::vector<ManifestItem>>();
    r.workspaceVersion = j.at("workspaceVersion").get<uint64_t>();
}

#pragma once

#include "sync/Errors.hpp"
#include "sync/model/Action.hpp"
#include "sync/model/Change.hpp"
#include "sync/model/Entry.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace cs::sync::model {

// ---- phase 1 -------------------------------------------------------------

struct SyncRequest {
    uint64_t workspaceVersion{};
    std::vector<SyncFileClientState> files;
};

enum class SyncStatus { Ok, NoChanges, WorkspaceConflict, Error };

std::string to_string(SyncStatus s);
SyncStatus syncStatusFromString(const std::string& s);

struct SyncResponse {
    SyncStatus status{SyncStatus::Ok};
    std::vector<SyncAction> actions;
    std::optional<uint64_t> provisionalVersion;
    std::optional<std::string> reservationId;
    std::optional<uint64_t> currentVersion;
    std::optional<std::string> errorMessage;
};

// ---- phase 2 -------------------------------------------------------------

struct ConfirmRequest {
    uint64_t workspaceVersion{};     // the provisional version
    std::string reservationId;
    std::vector<FinalizedAction> syncActions;
};

enum class ConfirmStatus { Success, Conflict, Error };

std::string to_string(ConfirmStatus s);
ConfirmStatus confirmStatusFromString(const std::string& s);

struct ConfirmResponse {
    ConfirmStatus status{ConfirmStatus::Success};
    std::optional<ConflictReason> reason;
    std::optional<uint64_t> finalWorkspaceVersion;
    std::optional<uint64_t> currentVersion;
    std::optional<std::string> errorMessage;
};

// ---- read path -----------------------------------------------------------

struct ManifestItem {
    ManifestEntry entry;
    std::optional<std::string> contentUrl;   // short-lived download capability
};

struct ManifestResponse {
    std::vector<ManifestItem> manifest;
    uint64_t workspaceVersion{};
};

void to_json(nlohmann::json& j, const SyncRequest& r);
void from_json(const nlohmann::json& j, SyncRequest& r);
void to_json(nlohmann::json& j, const SyncResponse& r);
void from_json(const nlohmann::json& j, SyncResponse& r);
void to_json(nlohmann::json& j, const ConfirmRequest& r);
void from_json(const nlohmann::json& j, ConfirmRequest& r);
void to_json(nlohmann::json& j, const ConfirmResponse& r);
void from_json(const nlohmann::json& j, ConfirmResponse& r);
void to_json(nlohmann::json& j, const ManifestItem& m);
void from_json(const nlohmann::json& j, ManifestItem& m);
void to_json(nlohmann::json& j, const ManifestResponse& r);
void from_json(const nlohmann::json& j, ManifestResponse& r);

}

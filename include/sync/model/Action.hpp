#pragma once

#include "sync/model/Entry.hpp"

#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace pqxx {
class row;
}

namespace cs::sync::model {

enum class ActionRequired { Upload, Delete, None };

std::string to_string(ActionRequired a);
ActionRequired actionRequiredFromString(const std::string& s);

// The server's prescription for one changed path.
struct SyncAction {
    std::string filePath;
    std::string fileId;
    std::string storageKey;                       // empty for folders
    EntryKind kind{EntryKind::File};
    ActionRequired actionRequired{ActionRequired::None};
    std::optional<std::string> uploadCapability;  // only for upload + file
    std::optional<std::string> expectedHash;      // clientHash seen in phase 1
    std::optional<std::string> message;           // why the action is none

    SyncAction() = default;
    explicit SyncAction(const pqxx::row& row);

    [[nodiscard]] bool needsUpload() const {
        return actionRequired == ActionRequired::Upload && kind == EntryKind::File;
    }
};

enum class ConfirmOp { Upsert, Delete };

std::string to_string(ConfirmOp op);
ConfirmOp confirmOpFromString(const std::string& s);

// Phase-2 restatement of an action, with hash and size recomputed after upload.
struct FinalizedAction {
    std::string filePath;
    std::string fileId;
    std::string storageKey;
    ConfirmOp op{ConfirmOp::Upsert};
    EntryKind kind{EntryKind::File};
    std::optional<std::string> clientHash;
    std::optional<uint64_t> size;
};

void to_json(nlohmann::json& j, const SyncAction& a);
void from_json(const nlohmann::json& j, SyncAction& a);
void to_json(nlohmann::json& j, const FinalizedAction& a);
void from_json(const nlohmann::json& j, FinalizedAction& a);

}

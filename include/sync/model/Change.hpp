#pragma once

#include "sync/model/Entry.hpp"

#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace cs::sync::model {

enum class ChangeAction { New, Modified, Deleted, Unchanged };

std::string to_string(ChangeAction a);
ChangeAction changeActionFromString(const std::string& s);

// One differing path, as submitted in a phase-1 request.
struct SyncFileClientState {
    std::string filePath;
    EntryKind kind{EntryKind::File};
    ChangeAction action{ChangeAction::New};
    std::optional<std::string> clientHash;   // files only; absent for deletes and folders

    friend bool operator==(const SyncFileClientState&, const SyncFileClientState&) = default;
};

void to_json(nlohmann::json& j, const SyncFileClientState& c);
void from_json(const nlohmann::json& j, SyncFileClientState& c);

}

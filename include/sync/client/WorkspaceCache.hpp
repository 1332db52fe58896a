#pragma once

#include "sync/model/Action.hpp"
#include "sync/model/Entry.hpp"
#include "sync/model/Messages.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cs::sync::client {

// The client's last known committed manifest and version. Changes only after
// a confirmed success or a fresh manifest fetch; a stale cache must be
// reloaded before the next diff.
class WorkspaceCache {
public:
    explicit WorkspaceCache(std::string workspaceId);

    [[nodiscard]] const std::string& workspaceId() const { return workspace_id_; }
    [[nodiscard]] uint64_t version() const { return version_; }
    [[nodiscard]] bool stale() const { return stale_; }

    void markStale() { stale_ = true; }

    void load(const model::ManifestResponse& manifest);

    // Applies a committed action set locally instead of refetching
    void applyCommitted(uint64_t version, const std::vector<model::FinalizedAction>& actions);

    [[nodiscard]] std::vector<model::ManifestEntry> entries() const;

    [[nodiscard]] std::optional<model::ManifestEntry> find(const std::string& path) const;

private:
    std::string workspace_id_;
    uint64_t version_{};
    bool stale_{true};
    std::map<std::string, model::ManifestEntry> entries_;
};

}

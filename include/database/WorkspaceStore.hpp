#pragma once

#include "sync/model/Action.hpp"
#include "sync/model/Entry.hpp"
#include "sync/model/Reservation.hpp"
#include "sync/model/Workspace.hpp"

#include <chrono>
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace cs::database {

// Version and manifest read together, so they always describe the same commit
struct ManifestSnapshot {
    uint64_t version{};
    std::vector<sync::model::ManifestEntry> entries;
};

// Everything the store needs to apply one confirmed round
struct CommitPlan {
    std::string workspace_id;
    std::string reservation_id;
    uint64_t base_version{};
    std::vector<sync::model::FinalizedAction> actions;
    std::time_t now{};
};

struct CommitOutcome {
    enum class Kind {
        Committed,          // this call advanced the version
        AlreadyCommitted,   // replay of a confirm that already won
        VersionMoved,       // the conditional write found another version
        Superseded,
        Expired             // expired or unknown reservation
    };

    Kind kind{Kind::Committed};
    uint64_t version{};                       // new version, or the current one on conflict
    std::vector<std::string> obsolete_keys;   // blobs the committed manifest no longer references
};

std::string to_string(CommitOutcome::Kind k);

class WorkspaceStore {
public:
    virtual ~WorkspaceStore() = default;

    virtual sync::model::Workspace createWorkspace(const std::string& id, const std::string& name,
                                                   const std::string& ownerId) = 0;

    // Workspace with its members, or nullopt
    virtual std::optional<sync::model::Workspace> getWorkspace(const std::string& id) = 0;

    virtual std::vector<sync::model::WorkspaceSummary> listWorkspaces(const std::string& userId) = 0;

    virtual void addMember(const std::string& workspaceId, const sync::model::WorkspaceMember& member) = 0;

    // Throws NotFoundError for an unknown workspace
    virtual ManifestSnapshot snapshot(const std::string& workspaceId) = 0;

    virtual void saveReservation(const sync::model::Reservation& reservation) = 0;

    // Pending reservations come back with their action set
    virtual std::optional<sync::model::Reservation> getReservation(const std::string& id) = 0;

    // Atomically: lock the workspace, re-check the reservation, compare-and-swap
    // the version from plan.base_version, apply the manifest changes, resolve
    // the reservation and supersede its siblings. Touches no blobs; the caller
    // deletes obsolete_keys once this has returned.
    virtual CommitOutcome commit(const CommitPlan& plan) = 0;

    // Drops expired pending reservations and resolved ones older than `retention`
    virtual size_t purgeReservations(std::time_t now, std::chrono::seconds retention) = 0;
};

}

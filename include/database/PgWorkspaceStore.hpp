#pragma once

#include "database/WorkspaceStore.hpp"

namespace cs::database {

// WorkspaceStore over PostgreSQL through the shared Transactions pool.
// The commit critical section is the conditional version UPDATE, so any
// number of server processes can share one database.
class PgWorkspaceStore final : public WorkspaceStore {
public:
    sync::model::Workspace createWorkspace(const std::string& id, const std::string& name,
                                           const std::string& ownerId) override;
    std::optional<sync::model::Workspace> getWorkspace(const std::string& id) override;
    std::vector<sync::model::WorkspaceSummary> listWorkspaces(const std::string& userId) override;
    void addMember(const std::string& workspaceId, const sync::model::WorkspaceMember& member) override;

    ManifestSnapshot snapshot(const std::string& workspaceId) override;

    void saveReservation(const sync::model::Reservation& reservation) override;
    std::optional<sync::model::Reservation> getReservation(const std::string& id) override;

    CommitOutcome commit(const CommitPlan& plan) override;

    size_t purgeReservations(std::time_t now, std::chrono::seconds retention) override;
};

}

#include "database/WorkspaceStore.hpp"

#include <stdexcept>

std::string cs::database::to_string(const CommitOutcome::Kind k) {
    switch (k) {
        case CommitOutcome::Kind::Committed: return "committed";
        case CommitOutcome::Kind::AlreadyCommitted: return "already_committed";
        case CommitOutcome::Kind::VersionMoved: return "version_moved";
        case CommitOutcome::Kind::Superseded: return "superseded";
        case CommitOutcome::Kind::Expired: return "expired";
        default: throw std::invalid_argument("Unknown commit outcome");
    }
}

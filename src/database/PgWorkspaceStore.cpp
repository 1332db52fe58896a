#include "database/PgWorkspaceStore.hpp"
#include "database/Transactions.hpp"
#include "sync/Errors.hpp"
#include "logging/LogRegistry.hpp"
#include "util/timestamp.hpp"
#include "crypto/util/uuid.hpp"

using namespace cs::database;
using namespace cs::sync;
using namespace cs::sync::model;
using namespace cs::logging;
using namespace cs::util;

namespace {

uint64_t currentVersion(pqxx::work& txn, const std::string& workspaceId) {
    const auto res = txn.exec(pqxx::prepped{"get_workspace_version"}, pqxx::params{workspaceId});
    if (res.empty()) throw NotFoundError("Workspace not found: " + workspaceId);
    return res.one_field().as<uint64_t>();
}

std::vector<WorkspaceMember> loadMembers(pqxx::work& txn, const std::string& workspaceId) {
    std::vector<WorkspaceMember> members;
    for (const auto& row : txn.exec(pqxx::prepped{"get_workspace_members"}, pqxx::params{workspaceId}))
        members.push_back({ row.at("user_id").as<std::string>(), row.at("role").as<std::string>() });
    return members;
}

std::optional<std::string> nonEmpty(const std::string& s) {
    if (s.empty()) return std::nullopt;
    return s;
}

}

Workspace PgWorkspaceStore::createWorkspace(const std::string& id, const std::string& name, const std::string& ownerId) {
    return Transactions::exec("PgWorkspaceStore::createWorkspace", [&](pqxx::work& txn) {
        const auto row = txn.exec(pqxx::prepped{"insert_workspace"},
                                  pqxx::params{id, name, INITIAL_WORKSPACE_VERSION, ownerId}).one_row();
        txn.exec(pqxx::prepped{"insert_workspace_member"}, pqxx::params{id, ownerId, std::string(ROLE_OWNER)});

        Workspace ws(row);
        ws.members = loadMembers(txn, id);
        return ws;
    });
}

std::optional<Workspace> PgWorkspaceStore::getWorkspace(const std::string& id) {
    // ids are uuid columns; anything else cannot name a row
    if (!crypto::util::is_uuid(id)) return std::nullopt;

    return Transactions::exec("PgWorkspaceStore::getWorkspace", [&](pqxx::work& txn) -> std::optional<Workspace> {
        const auto res = txn.exec(pqxx::prepped{"get_workspace"}, pqxx::params{id});
        if (res.empty()) return std::nullopt;

        Workspace ws(res.one_row());
        ws.members = loadMembers(txn, id);
        return ws;
    });
}

std::vector<WorkspaceSummary> PgWorkspaceStore::listWorkspaces(const std::string& userId) {
    return Transactions::exec("PgWorkspaceStore::listWorkspaces", [&](pqxx::work& txn) {
        std::vector<WorkspaceSummary> out;
        for (const auto& row : txn.exec(pqxx::prepped{"list_workspaces_for_user"}, pqxx::params{userId})) {
            out.push_back({
                .id = row.at("id").as<std::string>(),
                .name = row.at("name").as<std::string>(),
                .created_by = row.at("created_by").as<std::string>(),
                .created_at = parsePostgresTimestamp(row.at("created_at").as<std::string>()),
                .user_role = row.at("role").as<std::string>()
            });
        }
        return out;
    });
}

void PgWorkspaceStore::addMember(const std::string& workspaceId, const WorkspaceMember& member) {
    Transactions::exec("PgWorkspaceStore::addMember", [&](pqxx::work& txn) {
        txn.exec(pqxx::prepped{"insert_workspace_member"}, pqxx::params{workspaceId, member.user_id, member.role});
    });
}

ManifestSnapshot PgWorkspaceStore::snapshot(const std::string& workspaceId) {
    return Transactions::exec("PgWorkspaceStore::snapshot", [&](pqxx::work& txn) {
        // version and rows must come from the same commit
        txn.exec("SET TRANSACTION ISOLATION LEVEL REPEATABLE READ READ ONLY");

        ManifestSnapshot snap;
        snap.version = currentVersion(txn, workspaceId);
        for (const auto& row : txn.exec(pqxx::prepped{"list_manifest_entries"}, pqxx::params{workspaceId}))
            snap.entries.emplace_back(row);
        return snap;
    });
}

void PgWorkspaceStore::saveReservation(const Reservation& reservation) {
    const auto* pending = std::get_if<Pending>(&reservation.state);
    if (!pending) throw std::invalid_argument("Only pending reservations can be saved");

    Transactions::exec("PgWorkspaceStore::saveReservation", [&](pqxx::work& txn) {
        txn.exec(pqxx::prepped{"insert_reservation"}, pqxx::params{
            reservation.id,
            reservation.workspace_id,
            reservation.base_version,
            reservation.provisional_version,
            reservation.created_by,
            static_cast<int64_t>(pending->expires_at)
        });

        int ordinal = 0;
        for (const auto& a : pending->actions) {
            txn.exec(pqxx::prepped{"insert_reservation_action"}, pqxx::params{
                reservation.id,
                ordinal++,
                a.filePath,
                a.fileId,
                nonEmpty(a.storageKey),
                to_string(a.kind),
                to_string(a.actionRequired),
                a.expectedHash
            });
        }
    });
}

std::optional<Reservation> PgWorkspaceStore::getReservation(const std::string& id) {
    if (!crypto::util::is_uuid(id)) return std::nullopt;

    return Transactions::exec("PgWorkspaceStore::getReservation", [&](pqxx::work& txn) -> std::optional<Reservation> {
        const auto res = txn.exec(pqxx::prepped{"get_reservation"}, pqxx::params{id});
        if (res.empty()) return std::nullopt;

        Reservation r(res.one_row());
        if (auto* pending = std::get_if<Pending>(&r.state))
            for (const auto& row : txn.exec(pqxx::prepped{"get_reservation_actions"}, pqxx::params{id}))
                pending->actions.emplace_back(row);
        return r;
    });
}

CommitOutcome PgWorkspaceStore::commit(const CommitPlan& plan) {
    using Kind = CommitOutcome::Kind;

    return Transactions::exec("PgWorkspaceStore::commit", [&](pqxx::work& txn) -> CommitOutcome {
        // Lock order is workspace row, then reservation rows. A losing confirm
        // waits here and then finds its reservation superseded.
        const auto locked = txn.exec(pqxx::prepped{"lock_workspace"}, pqxx::params{plan.workspace_id});
        if (locked.empty()) throw NotFoundError("Workspace not found: " + plan.workspace_id);
        const auto current = locked.one_field().as<uint64_t>();

        const auto res = txn.exec(pqxx::prepped{"lock_reservation"}, pqxx::params{plan.reservation_id});
        if (res.empty()) return { Kind::Expired, current, {} };

        const Reservation r(res.one_row());
        if (r.workspace_id != plan.workspace_id) return { Kind::Expired, current, {} };

        if (const auto* c = std::get_if<Committed>(&r.state)) return { Kind::AlreadyCommitted, c->version, {} };
        if (r.isSuperseded()) return { Kind::Superseded, current, {} };
        if (r.isExpired(plan.now)) return { Kind::Expired, current, {} };
        if (current != plan.base_version) return { Kind::VersionMoved, current, {} };

        const auto advanced = txn.exec(pqxx::prepped{"advance_workspace_version"},
                                       pqxx::params{plan.workspace_id, plan.base_version});
        if (advanced.empty()) return { Kind::VersionMoved, current, {} };
        const auto newVersion = advanced.one_field().as<uint64_t>();

        std::vector<std::string> obsolete;

        // Deletes first, so a kind change at one path frees the slot for its upsert
        for (const auto& a : plan.actions) {
            if (a.op != ConfirmOp::Delete) continue;
            const auto del = txn.exec(pqxx::prepped{"delete_manifest_entry"}, pqxx::params{plan.workspace_id, a.filePath});
            if (!del.empty() && !del.one_field().is_null()) obsolete.push_back(del.one_field().as<std::string>());
        }

        for (const auto& a : plan.actions) {
            if (a.op != ConfirmOp::Upsert) continue;

            const auto prior = txn.exec(pqxx::prepped{"get_manifest_entry"}, pqxx::params{plan.workspace_id, a.filePath});
            if (!prior.empty()) {
                const auto key = prior.one_row().at("storage_key");
                if (!key.is_null() && key.as<std::string>() != a.storageKey) obsolete.push_back(key.as<std::string>());
            }

            const bool isFile = a.kind == EntryKind::File;
            txn.exec(pqxx::prepped{"upsert_manifest_entry"}, pqxx::params{
                plan.workspace_id,
                a.filePath,
                a.fileId,
                to_string(a.kind),
                isFile ? nonEmpty(a.storageKey) : std::nullopt,
                isFile ? a.clientHash : std::nullopt,
                isFile ? a.size : std::nullopt
            });
        }

        txn.exec(pqxx::prepped{"mark_reservation_committed"}, pqxx::params{plan.reservation_id, newVersion});
        const auto superseded = txn.exec(pqxx::prepped{"supersede_pending_reservations"},
                                         pqxx::params{plan.workspace_id, plan.base_version, newVersion, plan.reservation_id});

        LogRegistry::db()->debug("[PgWorkspaceStore] Workspace {} -> v{} ({} actions, {} blobs obsolete, {} reservations superseded)",
                                 plan.workspace_id, newVersion, plan.actions.size(), obsolete.size(), superseded.affected_rows());

        return { Kind::Committed, newVersion, std::move(obsolete) };
    });
}

size_t PgWorkspaceStore::purgeReservations(const std::time_t now, const std::chrono::seconds retention) {
    return Transactions::exec("PgWorkspaceStore::purgeReservations", [&](pqxx::work& txn) {
        const auto res = txn.exec(pqxx::prepped{"purge_reservations"},
                                  pqxx::params{static_cast<int64_t>(now), static_cast<int64_t>(retention.count())});
        return static_cast<size_t>(res.affected_rows());
    });
}

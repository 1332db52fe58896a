#include "database/DBConnection.hpp"

using namespace cs::database;

void DBConnection::initPreparedWorkspaces() const {
    conn_->prepare("insert_workspace",
                   "INSERT INTO workspaces (id, name, version, created_by) "
                   "VALUES ($1, $2, $3, $4) RETURNING *");

    conn_->prepare("get_workspace", "SELECT * FROM workspaces WHERE id = $1");

    conn_->prepare("get_workspace_version", "SELECT version FROM workspaces WHERE id = $1");

    // Serialises confirms on one workspace; taken before any reservation row
    conn_->prepare("lock_workspace", "SELECT version FROM workspaces WHERE id = $1 FOR UPDATE");

    // Compare-and-swap on the OCC token. Zero rows means another commit won.
    conn_->prepare("advance_workspace_version",
                   "UPDATE workspaces SET version = version + 1 "
                   "WHERE id = $1 AND version = $2 RETURNING version");

    conn_->prepare("insert_workspace_member",
                   "INSERT INTO workspace_members (workspace_id, user_id, role) VALUES ($1, $2, $3) "
                   "ON CONFLICT (workspace_id, user_id) DO UPDATE SET role = EXCLUDED.role");

    conn_->prepare("get_workspace_members",
                   "SELECT user_id, role FROM workspace_members WHERE workspace_id = $1 ORDER BY joined_at, user_id");

    conn_->prepare("list_workspaces_for_user",
                   "SELECT w.id, w.name, w.created_by, w.created_at, m.role "
                   "FROM workspaces w JOIN workspace_members m ON m.workspace_id = w.id "
                   "WHERE m.user_id = $1 ORDER BY w.created_at DESC, w.id");
}

#include "database/DBConnection.hpp"

using namespace cs::database;

void DBConnection::initPreparedManifest() const {
    conn_->prepare("list_manifest_entries",
                   "SELECT * FROM manifest_entries WHERE workspace_id = $1 ORDER BY file_path");

    conn_->prepare("get_manifest_entry",
                   "SELECT * FROM manifest_entries WHERE workspace_id = $1 AND file_path = $2");

    conn_->prepare("upsert_manifest_entry",
                   "INSERT INTO manifest_entries (workspace_id, file_path, file_id, kind, storage_key, content_hash, size_bytes) "
                   "VALUES ($1, $2, $3, $4, $5, $6, $7) "
                   "ON CONFLICT (workspace_id, file_path) DO UPDATE SET "
                   "file_id = EXCLUDED.file_id, "
                   "kind = EXCLUDED.kind, "
                   "storage_key = EXCLUDED.storage_key, "
                   "content_hash = EXCLUDED.content_hash, "
                   "size_bytes = EXCLUDED.size_bytes, "
                   "updated_at = NOW()");

    conn_->prepare("delete_manifest_entry",
                   "DELETE FROM manifest_entries WHERE workspace_id = $1 AND file_path = $2 RETURNING storage_key");
}

#include "database/DBConnection.hpp"

using namespace cs::database;

void DBConnection::initPreparedReservations() const {
    conn_->prepare("insert_reservation",
                   "INSERT INTO reservations (id, workspace_id, base_version, provisional_version, created_by, state, expires_at) "
                   "VALUES ($1, $2, $3, $4, $5, 'pending', $6)");

    conn_->prepare("insert_reservation_action",
                   "INSERT INTO reservation_actions "
                   "(reservation_id, ordinal, file_path, file_id, storage_key, kind, action_required, expected_hash) "
                   "VALUES ($1, $2, $3, $4, $5, $6, $7, $8)");

    conn_->prepare("get_reservation", "SELECT * FROM reservations WHERE id = $1");

    conn_->prepare("lock_reservation", "SELECT * FROM reservations WHERE id = $1 FOR UPDATE");

    conn_->prepare("get_reservation_actions",
                   "SELECT * FROM reservation_actions WHERE reservation_id = $1 ORDER BY ordinal");

    conn_->prepare("mark_reservation_committed",
                   "UPDATE reservations SET state = 'committed', resolved_version = $2 WHERE id = $1");

    conn_->prepare("supersede_pending_reservations",
                   "UPDATE reservations SET state = 'superseded', resolved_version = $3 "
                   "WHERE workspace_id = $1 AND base_version = $2 AND state = 'pending' AND id <> $4");

    // Expired pending ones go right away; resolved ones are kept for replayed confirms
    conn_->prepare("purge_reservations",
                   "DELETE FROM reservations WHERE "
                   "(state = 'pending' AND expires_at <= $1) OR "
                   "(state <> 'pending' AND created_at < to_timestamp($1 - $2))");
}

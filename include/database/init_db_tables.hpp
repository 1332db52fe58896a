#pragma once

#include "database/Transactions.hpp"

namespace cs::database::seed {

inline void init_workspaces() {
    Transactions::exec("init_db_tables::init_workspaces", [&](pqxx::work& txn) {
        txn.exec(R"(
CREATE TABLE IF NOT EXISTS workspaces
(
    id          UUID         PRIMARY KEY,
    name        VARCHAR(255) NOT NULL,
    version     BIGINT       NOT NULL DEFAULT 1 CHECK (version >= 1),
    created_by  TEXT         NOT NULL,
    created_at  TIMESTAMP    DEFAULT CURRENT_TIMESTAMP
);
        )");

        txn.exec(R"(
CREATE TABLE IF NOT EXISTS workspace_members
(
    workspace_id  UUID        REFERENCES workspaces (id) ON DELETE CASCADE,
    user_id       TEXT        NOT NULL,
    role          VARCHAR(16) NOT NULL DEFAULT 'editor',
    joined_at     TIMESTAMP   DEFAULT CURRENT_TIMESTAMP,
    PRIMARY KEY (workspace_id, user_id)
);
        )");

        txn.exec(R"(
CREATE TABLE IF NOT EXISTS manifest_entries
(
    workspace_id  UUID        NOT NULL REFERENCES workspaces (id) ON DELETE CASCADE,
    file_path     TEXT        NOT NULL,
    file_id       UUID        NOT NULL,
    kind          VARCHAR(8)  NOT NULL CHECK (kind IN ('file', 'folder')),
    storage_key   TEXT,
    content_hash  VARCHAR(128),
    size_bytes    BIGINT,
    created_at    TIMESTAMP   DEFAULT CURRENT_TIMESTAMP,
    updated_at    TIMESTAMP   DEFAULT CURRENT_TIMESTAMP,
    PRIMARY KEY (workspace_id, file_path),
    UNIQUE (workspace_id, file_id)
);
        )");
    });
}

inline void init_reservations() {
    Transactions::exec("init_db_tables::init_reservations", [&](pqxx::work& txn) {
        txn.exec(R"(
CREATE TABLE IF NOT EXISTS reservations
(
    id                   UUID        PRIMARY KEY,
    workspace_id         UUID        NOT NULL REFERENCES workspaces (id) ON DELETE CASCADE,
    base_version         BIGINT      NOT NULL,
    provisional_version  BIGINT      NOT NULL,
    created_by           TEXT        NOT NULL,
    state                VARCHAR(16) NOT NULL DEFAULT 'pending'
                                     CHECK (state IN ('pending', 'committed', 'superseded')),
    expires_at           BIGINT      NOT NULL,
    resolved_version     BIGINT,
    created_at           TIMESTAMP   DEFAULT CURRENT_TIMESTAMP
);
        )");

        txn.exec(R"(
CREATE INDEX IF NOT EXISTS reservations_ws_base_idx ON reservations (workspace_id, base_version, state);
        )");

        txn.exec(R"(
CREATE TABLE IF NOT EXISTS reservation_actions
(
    reservation_id   UUID        NOT NULL REFERENCES reservations (id) ON DELETE CASCADE,
    ordinal          INTEGER     NOT NULL,
    file_path        TEXT        NOT NULL,
    file_id          UUID        NOT NULL,
    storage_key      TEXT,
    kind             VARCHAR(8)  NOT NULL,
    action_required  VARCHAR(8)  NOT NULL,
    expected_hash    VARCHAR(128),
    PRIMARY KEY (reservation_id, ordinal)
);
        )");
    });
}

inline void init_tables() {
    init_workspaces();
    init_reservations();
}

}

#pragma once

#include "database/DBConnection.hpp"

namespace re::database::seed {

inline void init_tables_if_not_exists(const DBConnection& conn) {
    conn.exec(R"(
CREATE TABLE IF NOT EXISTS tracked_files
(
    path             TEXT       PRIMARY KEY,
    needs_processing INTEGER    NOT NULL CHECK (needs_processing IN (0, 1)),
    modtime          INTEGER    NOT NULL,
    write_seq        INTEGER    NOT NULL DEFAULT 0
);
    )");

    conn.exec("CREATE INDEX IF NOT EXISTS idx_tracked_files_pending ON tracked_files (needs_processing);");

    // Keeps the next write_seq lookup a single index probe.
    conn.exec("CREATE INDEX IF NOT EXISTS idx_tracked_files_write_seq ON tracked_files (write_seq);");
}

}

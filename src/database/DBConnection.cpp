#include "database/DBConnection.hpp"
#include "logging/LogRegistry.hpp"
#include "types/Errors.hpp"

#include <sqlite3.h>

using namespace re::logging;

namespace re::database {

DBConnection::DBConnection(const std::filesystem::path& path, const unsigned int busyTimeoutMs) : path_(path) {
    if (path_.has_parent_path() && !std::filesystem::exists(path_.parent_path()))
        std::filesystem::create_directories(path_.parent_path());

    constexpr int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
    if (const int rc = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr); rc != SQLITE_OK) {
        const std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        throw types::StoreIoError("DBConnection", rc, "Failed to open store " + path_.string() + ": " + msg);
    }

    sqlite3_extended_result_codes(db_, 1);
    sqlite3_busy_timeout(db_, static_cast<int>(busyTimeoutMs));

    try {
        exec("PRAGMA journal_mode=WAL;");
        exec("PRAGMA synchronous=NORMAL;");
        exec("PRAGMA foreign_keys=ON;");
    } catch (const types::StoreIoError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }

    LogRegistry::db()->debug("[DBConnection] Opened {}", path_.string());
}

DBConnection::~DBConnection() {
    finalizePrepared();
    if (db_ && sqlite3_close(db_) != SQLITE_OK)
        LogRegistry::db()->warn("[DBConnection] Failed to close {}: {}", path_.string(), sqlite3_errmsg(db_));
}

sqlite3* DBConnection::get() const { return db_; }

void DBConnection::exec(const std::string& sql) const {
    char* err = nullptr;
    if (const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err); rc != SQLITE_OK) {
        const std::string msg = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        throw types::StoreIoError("DBConnection::exec", sqlite3_extended_errcode(db_), msg);
    }
}

void DBConnection::initPrepared() {
    if (!db_) throw std::runtime_error("Database connection is not open");
    finalizePrepared();
    initPreparedTrackedFiles();
}

sqlite3_stmt* DBConnection::prepared(const std::string& name) const {
    const auto it = prepared_.find(name);
    if (it == prepared_.end()) throw std::out_of_range("No prepared statement named " + name);
    return it->second;
}

void DBConnection::prepare(const std::string& name, const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    if (const int rc = sqlite3_prepare_v3(db_, sql.c_str(), -1, SQLITE_PREPARE_PERSISTENT, &stmt, nullptr);
        rc != SQLITE_OK)
        throw types::StoreIoError("DBConnection::prepare(" + name + ")", sqlite3_extended_errcode(db_),
                                  sqlite3_errmsg(db_));
    prepared_[name] = stmt;
}

void DBConnection::finalizePrepared() {
    for (auto& [_, stmt] : prepared_) sqlite3_finalize(stmt);
    prepared_.clear();
}

void DBConnection::initPreparedTrackedFiles() {
    // Every row write takes the next store-wide write sequence number.
    static constexpr auto NEXT_SEQ = "(SELECT COALESCE((SELECT MAX(write_seq) FROM tracked_files), 0) + 1)";

    prepare("insert_tracked_file",
            std::string("INSERT INTO tracked_files (path, needs_processing, modtime, write_seq) "
                        "VALUES (?1, ?2, ?3, ") + NEXT_SEQ + ")");

    prepare("mark_tracked_file_processed",
            std::string("UPDATE tracked_files SET needs_processing = 0, modtime = ?2, write_seq = ") + NEXT_SEQ +
            " WHERE path = ?1");

    prepare("refresh_tracked_file",
            std::string("UPDATE tracked_files SET needs_processing = ?2, modtime = ?3, write_seq = ") + NEXT_SEQ +
            " WHERE path = ?1");

    prepare("tracked_file_exists", "SELECT EXISTS(SELECT 1 FROM tracked_files WHERE path = ?1)");

    prepare("get_tracked_file", "SELECT path, needs_processing, modtime, write_seq FROM tracked_files WHERE path = ?1");

    prepare("get_tracked_file_modtime", "SELECT modtime FROM tracked_files WHERE path = ?1");

    prepare("list_pending", "SELECT path FROM tracked_files WHERE needs_processing = 1");

    prepare("list_pending_under",
            "SELECT path FROM tracked_files WHERE needs_processing = 1 "
            "AND substr(path, 1, length(?1)) = ?1");

    prepare("count_pending", "SELECT COUNT(*) FROM tracked_files WHERE needs_processing = 1");

    prepare("count_pending_under",
            "SELECT COUNT(*) FROM tracked_files WHERE needs_processing = 1 "
            "AND substr(path, 1, length(?1)) = ?1");

    prepare("list_tracked_paths", "SELECT path FROM tracked_files");

    prepare("list_tracked_files_for_dedupe", "SELECT path, write_seq FROM tracked_files");

    prepare("delete_tracked_file", "DELETE FROM tracked_files WHERE path = ?1");

    prepare("rename_tracked_file", "UPDATE tracked_files SET path = ?2 WHERE path = ?1");
}

}

#include "database/Work.hpp"
#include "logging/LogRegistry.hpp"
#include "types/Errors.hpp"

#include <memory>
#include <sqlite3.h>

using namespace re::logging;

namespace re::database {

Work::Work(DBConnection& conn, std::string ctx, const Mode mode) : conn_(conn), ctx_(std::move(ctx)) {
    conn_.exec(mode == Mode::Immediate ? "BEGIN IMMEDIATE" : "BEGIN DEFERRED");
    open_ = true;
}

Work::~Work() {
    if (!open_) return;
    if (sqlite3_exec(conn_.get(), "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK)
        LogRegistry::db()->error("[Work] Rollback failed in '{}': {}", ctx_, sqlite3_errmsg(conn_.get()));
    else
        LogRegistry::db()->trace("[Work] Rolled back '{}'", ctx_);
}

Result Work::exec(const std::string& sql) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(conn_.get(), sql.c_str(), -1, &raw, nullptr) != SQLITE_OK)
        throw types::StoreIoError(ctx_, sqlite3_extended_errcode(conn_.get()), sqlite3_errmsg(conn_.get()));
    const std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)> stmt(raw, &sqlite3_finalize);
    return step(stmt.get(), sql);
}

void Work::commit() {
    if (!open_) throw std::logic_error("[Work] commit() on a closed transaction: " + ctx_);
    conn_.exec("COMMIT");
    open_ = false;
}

Result Work::step(sqlite3_stmt* stmt, const std::string& what) {
    // Leave the statement reusable whatever happens below.
    const std::unique_ptr<sqlite3_stmt, void (*)(sqlite3_stmt*)> guard(stmt, [](sqlite3_stmt* s) {
        sqlite3_reset(s);
        sqlite3_clear_bindings(s);
    });

    const int cols = sqlite3_column_count(stmt);
    auto names = std::make_shared<std::vector<std::string>>();
    names->reserve(static_cast<size_t>(cols));
    for (int i = 0; i < cols; ++i) names->emplace_back(sqlite3_column_name(stmt, i));

    std::vector<Row> rows;
    while (true) {
        const int rc = sqlite3_step(stmt);
        if (rc == SQLITE_DONE) break;
        if (rc != SQLITE_ROW)
            throw types::StoreIoError(ctx_ + ": " + what, sqlite3_extended_errcode(conn_.get()),
                                      sqlite3_errmsg(conn_.get()));

        std::vector<Field> fields;
        fields.reserve(static_cast<size_t>(cols));
        for (int i = 0; i < cols; ++i) fields.emplace_back(stmt, i);
        rows.emplace_back(names, std::move(fields));
    }

    const uint64_t affected = sqlite3_stmt_readonly(stmt) ? 0 : static_cast<uint64_t>(sqlite3_changes(conn_.get()));
    return {std::move(rows), affected};
}

void Work::bindText(sqlite3_stmt* stmt, const int idx, const std::string& value) const {
    if (sqlite3_bind_text(stmt, idx, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT) != SQLITE_OK)
        throw types::StoreIoError(ctx_, sqlite3_extended_errcode(conn_.get()), sqlite3_errmsg(conn_.get()));
}

void Work::bindInt(sqlite3_stmt* stmt, const int idx, const int64_t value) const {
    if (sqlite3_bind_int64(stmt, idx, value) != SQLITE_OK)
        throw types::StoreIoError(ctx_, sqlite3_extended_errcode(conn_.get()), sqlite3_errmsg(conn_.get()));
}

}

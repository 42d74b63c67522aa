#pragma once

#include "database/DBConnection.hpp"
#include "database/Result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <type_traits>

struct sqlite3_stmt;

namespace re::database {

// Names a statement registered in DBConnection::initPrepared().
struct prepped {
    std::string name;
};

// A single SQLite transaction on a pooled connection. Rolls back on destruction
// unless commit() was called.
class Work {
  public:
    enum class Mode { Deferred, Immediate };

    Work(DBConnection& conn, std::string ctx, Mode mode = Mode::Immediate);
    ~Work();

    Work(const Work&) = delete;
    Work& operator=(const Work&) = delete;

    template <typename... Args>
    Result exec(const prepped& stmt, const Args&... args) {
        sqlite3_stmt* s = conn_.prepared(stmt.name);
        int idx = 1;
        (bindOne(s, idx++, args), ...);
        return step(s, stmt.name);
    }

    // Ad hoc statement without parameters.
    Result exec(const std::string& sql);

    void commit();

  private:
    DBConnection& conn_;
    std::string ctx_;
    bool open_{false};

    Result step(sqlite3_stmt* stmt, const std::string& what);

    void bindText(sqlite3_stmt* stmt, int idx, const std::string& value) const;
    void bindInt(sqlite3_stmt* stmt, int idx, int64_t value) const;

    template <typename T>
    void bindOne(sqlite3_stmt* stmt, const int idx, const T& value) const {
        if constexpr (std::is_same_v<T, bool>) bindInt(stmt, idx, value ? 1 : 0);
        else if constexpr (std::is_integral_v<T>) bindInt(stmt, idx, static_cast<int64_t>(value));
        else if constexpr (std::is_same_v<T, std::filesystem::path>) bindText(stmt, idx, value.string());
        else bindText(stmt, idx, std::string(value));
    }
};

}

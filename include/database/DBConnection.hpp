#pragma once

#include <filesystem>
#include <string>
#include <unordered_map>

struct sqlite3;
struct sqlite3_stmt;

namespace re::database {

// One open handle on the store file plus its prepared statements.
class DBConnection {
  public:
    DBConnection(const std::filesystem::path& path, unsigned int busyTimeoutMs);
    ~DBConnection();

    DBConnection(const DBConnection&) = delete;
    DBConnection& operator=(const DBConnection&) = delete;

    [[nodiscard]] sqlite3* get() const;

    // Runs one or more statements that take no parameters and return no rows.
    void exec(const std::string& sql) const;

    void initPrepared();

    // Throws std::out_of_range for a name that was never prepared.
    [[nodiscard]] sqlite3_stmt* prepared(const std::string& name) const;

  private:
    std::filesystem::path path_;
    sqlite3* db_{nullptr};
    std::unordered_map<std::string, sqlite3_stmt*> prepared_;

    void prepare(const std::string& name, const std::string& sql);
    void finalizePrepared();

    void initPreparedTrackedFiles();
};

}

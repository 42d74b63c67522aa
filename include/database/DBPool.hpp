#pragma once

#include "database/DBConnection.hpp"

#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <queue>

namespace re::database {

class DBPool {
  public:
    DBPool(const std::filesystem::path& path, size_t size = 4, unsigned int busyTimeoutMs = 5000);

    std::unique_ptr<DBConnection> acquire();
    void release(std::unique_ptr<DBConnection> conn);

    // Prepares statements on every pooled connection; the schema must exist.
    void initPreparedStatements();

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }
    [[nodiscard]] size_t size() const { return size_; }

  private:
    std::filesystem::path path_;
    size_t size_;
    std::queue<std::unique_ptr<DBConnection>> pool_;
    std::mutex mtx_;
    std::condition_variable cv_;
};

}

#include "database/DBPool.hpp"
#include "logging/LogRegistry.hpp"

#include <vector>

using namespace re::logging;

namespace re::database {

DBPool::DBPool(const std::filesystem::path& path, const size_t size, const unsigned int busyTimeoutMs)
    : path_(path), size_(size == 0 ? 1 : size) {
    for (size_t i = 0; i < size_; ++i) pool_.push(std::make_unique<DBConnection>(path_, busyTimeoutMs));
    LogRegistry::db()->debug("[DBPool] Opened {} connections on {}", size_, path_.string());
}

std::unique_ptr<DBConnection> DBPool::acquire() {
    std::unique_lock lock(mtx_);
    cv_.wait(lock, [&]() { return !pool_.empty(); });
    auto conn = std::move(pool_.front());
    pool_.pop();
    return conn;
}

void DBPool::release(std::unique_ptr<DBConnection> conn) {
    std::lock_guard lock(mtx_);
    pool_.push(std::move(conn));
    cv_.notify_one();
}

void DBPool::initPreparedStatements() {
    std::vector<std::unique_ptr<DBConnection>> all;
    all.reserve(size_);
    for (size_t i = 0; i < size_; ++i) all.push_back(acquire());

    try {
        for (const auto& conn : all) conn->initPrepared();
    } catch (const std::exception& e) {
        LogRegistry::db()->error("[DBPool] Failed to prepare statements: {}", e.what());
        for (auto& conn : all) release(std::move(conn));
        throw;
    }

    for (auto& conn : all) release(std::move(conn));
}

}

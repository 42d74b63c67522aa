#pragma once

#include "database/DBPool.hpp"
#include "database/Work.hpp"
#include "logging/LogRegistry.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <utility>

namespace re::database {

class Transactions {
  public:
    static inline std::shared_ptr<DBPool> dbPool_;

    // Opens the pool, creates the schema if needed and prepares statements.
    static void init(const std::filesystem::path& storePath, size_t poolSize = 4, unsigned int busyTimeoutMs = 5000);

    static void shutdown() { dbPool_.reset(); }

    // Runs func inside a BEGIN IMMEDIATE transaction and commits if it returns.
    template <typename Func>
    static auto exec(const std::string& ctx, Func&& func) -> decltype(func(std::declval<Work&>())) {
        return transact(ctx, Work::Mode::Immediate, std::forward<Func>(func));
    }

    // Read-only variant; does not take the write lock up front.
    template <typename Func>
    static auto read(const std::string& ctx, Func&& func) -> decltype(func(std::declval<Work&>())) {
        return transact(ctx, Work::Mode::Deferred, std::forward<Func>(func));
    }

    // Hands out a bare connection for statements that must run outside a transaction.
    template <typename Func>
    static auto run(const std::string& ctx, Func&& func) -> decltype(func(std::declval<DBConnection&>())) {
        if (!dbPool_) throw std::runtime_error("Transactions not initialized!");

        logging::LogRegistry::db()->trace("[Transactions::run] Acquiring connection: {}", ctx);
        auto conn = dbPool_->acquire();

        try {
            if constexpr (std::is_void_v<decltype(func(*conn))>) {
                func(*conn);
                dbPool_->release(std::move(conn));
            } else {
                auto result = func(*conn);
                dbPool_->release(std::move(conn));
                return result;
            }
        } catch (const std::exception& e) {
            logging::LogRegistry::db()->debug("[Transactions::run] '{}' failed: {}", ctx, e.what());
            dbPool_->release(std::move(conn));
            throw;
        }
    }

  private:
    template <typename Func>
    static auto transact(const std::string& ctx, const Work::Mode mode, Func&& func)
        -> decltype(func(std::declval<Work&>())) {
        using R = decltype(func(std::declval<Work&>()));

        return run(ctx, [&](DBConnection& conn) -> R {
            logging::LogRegistry::db()->trace("[Transactions::exec] Starting transaction: {}", ctx);
            Work txn(conn, ctx, mode);

            if constexpr (std::is_void_v<R>) {
                func(txn);
                txn.commit();
                logging::LogRegistry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
            } else {
                auto result = func(txn);
                txn.commit();
                logging::LogRegistry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
                return result;
            }
        });
    }
};

}

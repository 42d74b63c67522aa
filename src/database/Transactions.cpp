#include "database/Transactions.hpp"
#include "database/seed/init_db_tables.hpp"

namespace re::database {

void Transactions::init(const std::filesystem::path& storePath, const size_t poolSize, const unsigned int busyTimeoutMs) {
    auto pool = std::make_shared<DBPool>(storePath, poolSize, busyTimeoutMs);

    {
        auto conn = pool->acquire();
        try {
            seed::init_tables_if_not_exists(*conn);
        } catch (const std::exception& e) {
            logging::LogRegistry::db()->error("[Transactions] Failed to create schema in {}: {}", storePath.string(), e.what());
            pool->release(std::move(conn));
            throw;
        }
        pool->release(std::move(conn));
    }

    pool->initPreparedStatements();
    dbPool_ = std::move(pool);
    logging::LogRegistry::db()->debug("[Transactions] Store ready at {}", storePath.string());
}

}

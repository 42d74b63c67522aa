#include "database/Queries/TrackedFileQueries.hpp"
#include "database/Transactions.hpp"
#include "types/Errors.hpp"
#include "util/files.hpp"

#include <algorithm>
#include <map>

namespace re::database {

namespace {

std::string key(const std::filesystem::path& file) { return util::canonicalPath(file).string(); }

std::vector<std::filesystem::path> toPaths(const Result& res) {
    std::vector<std::filesystem::path> out;
    out.reserve(res.size());
    for (const auto& row : res) out.emplace_back(row.at("path").as<std::string>());
    return out;
}

}

void TrackedFileQueries::upsertNew(const path& file, const bool needsProcessing, const uint64_t modtime) {
    const auto p = key(file);
    Transactions::exec("TrackedFileQueries::upsertNew", [&](Work& txn) {
        if (txn.exec(prepped{"tracked_file_exists"}, p).one_field().as<bool>()) throw types::AlreadyExists(p);
        txn.exec(prepped{"insert_tracked_file"}, p, needsProcessing, modtime);
    });
}

void TrackedFileQueries::markProcessed(const path& file, const uint64_t modtime) {
    const auto p = key(file);
    Transactions::exec("TrackedFileQueries::markProcessed", [&](Work& txn) {
        if (txn.exec(prepped{"mark_tracked_file_processed"}, p, modtime).affected_rows() == 0)
            throw types::NotFound(p);
    });
}

void TrackedFileQueries::refresh(const path& file, const bool needsProcessing, const uint64_t modtime) {
    const auto p = key(file);
    Transactions::exec("TrackedFileQueries::refresh", [&](Work& txn) {
        if (txn.exec(prepped{"refresh_tracked_file"}, p, needsProcessing, modtime).affected_rows() == 0)
            throw types::NotFound(p);
    });
}

bool TrackedFileQueries::exists(const path& file) {
    const auto p = key(file);
    return Transactions::read("TrackedFileQueries::exists", [&](Work& txn) {
        return txn.exec(prepped{"tracked_file_exists"}, p).one_field().as<bool>();
    });
}

std::optional<uint64_t> TrackedFileQueries::modtimeOf(const path& file) {
    const auto p = key(file);
    return Transactions::read("TrackedFileQueries::modtimeOf", [&](Work& txn) -> std::optional<uint64_t> {
        const auto res = txn.exec(prepped{"get_tracked_file_modtime"}, p);
        if (res.empty()) return std::nullopt;
        return res.one_field().as<uint64_t>();
    });
}

std::optional<types::TrackedFile> TrackedFileQueries::get(const path& file) {
    const auto p = key(file);
    return Transactions::read("TrackedFileQueries::get", [&](Work& txn) -> std::optional<types::TrackedFile> {
        const auto res = txn.exec(prepped{"get_tracked_file"}, p);
        if (res.empty()) return std::nullopt;
        return types::TrackedFile(res.one_row());
    });
}

std::vector<std::filesystem::path> TrackedFileQueries::pending(const std::optional<path>& under) {
    return Transactions::read("TrackedFileQueries::pending", [&](Work& txn) {
        if (under) return toPaths(txn.exec(prepped{"list_pending_under"}, util::subtreePrefix(*under)));
        return toPaths(txn.exec(prepped{"list_pending"}));
    });
}

uint64_t TrackedFileQueries::pendingCount(const std::optional<path>& under) {
    return Transactions::read("TrackedFileQueries::pendingCount", [&](Work& txn) {
        if (under) return txn.exec(prepped{"count_pending_under"}, util::subtreePrefix(*under)).one_field().as<uint64_t>();
        return txn.exec(prepped{"count_pending"}).one_field().as<uint64_t>();
    });
}

std::vector<std::filesystem::path> TrackedFileQueries::allPaths() {
    return Transactions::read("TrackedFileQueries::allPaths", [&](Work& txn) {
        return toPaths(txn.exec(prepped{"list_tracked_paths"}));
    });
}

bool TrackedFileQueries::remove(const path& file) {
    const auto p = key(file);
    return Transactions::exec("TrackedFileQueries::remove", [&](Work& txn) {
        return txn.exec(prepped{"delete_tracked_file"}, p).affected_rows() > 0;
    });
}

uint64_t TrackedFileQueries::dedupe() {
    return Transactions::exec("TrackedFileQueries::dedupe", [&](Work& txn) {
        struct Stored {
            std::string path;
            uint64_t write_seq;
        };

        std::map<std::string, std::vector<Stored>> groups;
        for (const auto& row : txn.exec(prepped{"list_tracked_files_for_dedupe"})) {
            auto stored = row.at("path").as<std::string>();
            groups[key(stored)].push_back({std::move(stored), row.at("write_seq").as<uint64_t>()});
        }

        uint64_t deleted = 0;
        for (const auto& [canonical, rows] : groups) {
            const auto survivor = std::ranges::max_element(rows, {}, &Stored::write_seq);

            for (auto it = rows.begin(); it != rows.end(); ++it) {
                if (it == survivor) continue;
                deleted += txn.exec(prepped{"delete_tracked_file"}, it->path).affected_rows();
            }

            if (survivor->path != canonical)
                txn.exec(prepped{"rename_tracked_file"}, survivor->path, canonical);
        }

        if (deleted > 0)
            logging::LogRegistry::db()->info("[TrackedFileQueries] Dedupe removed {} stale rows", deleted);
        return deleted;
    });
}

void TrackedFileQueries::compact() {
    Transactions::run("TrackedFileQueries::compact", [](DBConnection& conn) {
        conn.exec("VACUUM;");
    });
}

}

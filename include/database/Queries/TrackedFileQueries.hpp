#pragma once

#include "types/TrackedFile.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

namespace re::database {

// Durable path -> {needs_processing, modtime} table. Every call canonicalizes its path
// argument and runs in its own transaction.
struct TrackedFileQueries {
    using path = std::filesystem::path;

    // Throws types::AlreadyExists if the path is already tracked.
    static void upsertNew(const path& file, bool needsProcessing, uint64_t modtime);

    // Clears the flag and stores modtime. Throws types::NotFound if the path is untracked.
    static void markProcessed(const path& file, uint64_t modtime);

    // Overwrites flag and modtime. Throws types::NotFound if the path is untracked.
    static void refresh(const path& file, bool needsProcessing, uint64_t modtime);

    [[nodiscard]] static bool exists(const path& file);
    [[nodiscard]] static std::optional<uint64_t> modtimeOf(const path& file);
    [[nodiscard]] static std::optional<types::TrackedFile> get(const path& file);

    [[nodiscard]] static std::vector<path> pending(const std::optional<path>& under = std::nullopt);
    [[nodiscard]] static uint64_t pendingCount(const std::optional<path>& under = std::nullopt);
    [[nodiscard]] static std::vector<path> allPaths();

    // Returns whether a row was deleted.
    static bool remove(const path& file);

    // Collapses rows that share a canonical path onto the most recently written one and
    // rewrites its key to the canonical spelling. Returns the number of rows deleted.
    static uint64_t dedupe();

    static void compact();
};

}

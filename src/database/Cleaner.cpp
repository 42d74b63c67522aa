#include "database/Cleaner.hpp"
#include "database/Queries/TrackedFileQueries.hpp"
#include "concurrency/Dispatcher.hpp"
#include "concurrency/FileTask.hpp"
#include "logging/LogRegistry.hpp"

#include <system_error>

namespace fs = std::filesystem;

using namespace re::database;
using namespace re::concurrency;
using namespace re::logging;
using namespace re::types;

namespace {

struct Prune final : FileTask {
    using FileTask::FileTask;

protected:
    FileOutcome process() override {
        std::error_code ec;
        const bool present = fs::exists(file, ec);
        if (ec) throw std::system_error(ec, "cannot check " + file.string());
        if (present) return {file, FileOutcome::Status::Kept};

        TrackedFileQueries::remove(file);
        LogRegistry::db()->debug("[Cleaner] Dropped vanished file {}", file.string());
        return {file, FileOutcome::Status::Removed};
    }

    [[nodiscard]] std::string name() const override { return "Cleaner"; }
    [[nodiscard]] std::shared_ptr<spdlog::logger> logger() const override { return LogRegistry::db(); }
};

}

Cleaner::Cleaner(const unsigned int maxConcurrency) : maxConcurrency_(maxConcurrency) {}

CleanReport Cleaner::clean(const std::shared_ptr<std::atomic<bool>>& cancel) const {
    CleanReport report;

    report.duplicates_removed = TrackedFileQueries::dedupe();

    {
        Dispatcher dispatcher(cancel, maxConcurrency_);
        for (const auto& file : TrackedFileQueries::allPaths()) {
            auto lease = dispatcher.reserve();
            if (!lease) {
                report.cancelled = true;
                break;
            }
            dispatcher.push(std::make_shared<Prune>(file, std::move(*lease), progress_));
        }

        for (const auto& outcome : dispatcher.processFutures()) report.record(outcome);
        if (dispatcher.isInterrupted()) report.cancelled = true;
    }

    if (report.cancelled) {
        LogRegistry::reencoder()->warn("[Cleaner] Cancelled before compaction");
    } else {
        TrackedFileQueries::compact();
        report.compacted = true;
    }

    LogRegistry::reencoder()->info("[Cleaner] {} duplicates, {} vanished files removed, {} kept, {} errors",
                                   report.duplicates_removed, report.missing_removed, report.kept, report.errored);
    return report;
}

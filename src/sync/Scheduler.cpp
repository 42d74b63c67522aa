#include "sync/Scheduler.hpp"
#include "sync/tasks/Reencode.hpp"
#include "concurrency/Dispatcher.hpp"
#include "database/Queries/TrackedFileQueries.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>

using namespace re::sync;
using namespace re::concurrency;
using namespace re::database;
using namespace re::logging;
using namespace re::types;

RunReport Scheduler::run(const transcode::Transcoder& transcoder,
                         const unsigned int maxWorkers,
                         const std::shared_ptr<std::atomic<bool>>& cancel,
                         const std::optional<std::filesystem::path>& under) const {
    const auto workers = std::max(1u, maxWorkers);
    const auto snapshot = TrackedFileQueries::pending(under);

    LogRegistry::sync()->info("[Scheduler] {} pending files{}, {} workers", snapshot.size(),
                              under ? " under " + under->string() : std::string(), workers);

    RunReport report;
    Dispatcher dispatcher(cancel, workers);

    size_t dispatched = 0;
    for (const auto& file : snapshot) {
        auto lease = dispatcher.reserve();
        if (!lease) {
            report.cancelled = true;
            break;
        }
        dispatcher.push(std::make_shared<tasks::Reencode>(file, std::move(*lease), transcoder, progress_));
        ++dispatched;
    }

    for (const auto& outcome : dispatcher.processFutures()) report.record(outcome);
    // A cancel that lands after the last dispatch still counts.
    if (dispatcher.isInterrupted()) report.cancelled = true;
    report.pending_due_to_cancel = snapshot.size() - dispatched;
    lastPeak_.store(dispatcher.peakInFlight());

    if (report.cancelled)
        LogRegistry::sync()->warn("[Scheduler] Cancelled: {} files left pending", report.pending_due_to_cancel);

    LogRegistry::sync()->info("[Scheduler] {} succeeded, {} failed, {} missing, {} unrecorded",
                              report.succeeded, report.failed, report.skipped_missing, report.unrecorded);
    return report;
}

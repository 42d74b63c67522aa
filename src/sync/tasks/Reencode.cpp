#include "sync/tasks/Reencode.hpp"
#include "database/Queries/TrackedFileQueries.hpp"
#include "logging/LogRegistry.hpp"
#include "transcode/Transcoder.hpp"
#include "util/files.hpp"

using namespace re::sync::tasks;
using namespace re::concurrency;
using namespace re::database;
using namespace re::logging;
using namespace re::types;

Reencode::Reencode(std::filesystem::path f, WorkerSlots::Lease l, const transcode::Transcoder& t, ProgressCallback cb)
    : FileTask(std::move(f), std::move(l), std::move(cb)), transcoder(t) {}

std::shared_ptr<spdlog::logger> Reencode::logger() const { return LogRegistry::sync(); }

FileOutcome Reencode::process() {
    std::error_code ec;
    if (!std::filesystem::exists(file, ec) && !ec) {
        TrackedFileQueries::remove(file);
        LogRegistry::sync()->info("[Reencode] {} no longer exists, dropped from store", file.string());
        return {file, FileOutcome::Status::Missing};
    }

    const auto result = transcoder.transform(file);

    // The file is already replaced at this point; a store failure only means it gets
    // picked up again next run.
    try {
        TrackedFileQueries::markProcessed(file, util::modtimeSeconds(file));
    } catch (const std::exception& e) {
        LogRegistry::sync()->error("[Reencode] {} transformed but not recorded: {}", file.string(), e.what());
        return {file, FileOutcome::Status::Unrecorded, e.what()};
    }

    LogRegistry::sync()->debug("[Reencode] {} done ({} -> {} bytes)", file.string(), result.bytes_before, result.bytes_after);
    return {file, FileOutcome::Status::Transformed};
}

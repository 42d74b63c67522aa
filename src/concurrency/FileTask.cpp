#include "concurrency/FileTask.hpp"

#include <spdlog/spdlog.h>

using namespace re::concurrency;
using namespace re::types;

FileTask::FileTask(std::filesystem::path f, WorkerSlots::Lease l, ProgressCallback cb)
    : file(std::move(f)), lease(std::move(l)), progress(std::move(cb)) {}

void FileTask::operator()() {
    FileOutcome outcome{file, FileOutcome::Status::Failed, {}};

    try {
        outcome = process();
    } catch (const std::exception& e) {
        logger()->error("[{}] {}: {}", name(), file.string(), e.what());
        outcome = {file, FileOutcome::Status::Failed, e.what()};
    } catch (...) {
        logger()->error("[{}] {}: non-standard exception", name(), file.string());
        outcome = {file, FileOutcome::Status::Failed, "unknown error"};
    }

    lease.release();

    if (progress) {
        try {
            progress(outcome);
        } catch (const std::exception& e) {
            logger()->warn("[{}] Progress callback threw for {}: {}", name(), file.string(), e.what());
        }
    }

    promise.set_value(std::move(outcome));
}

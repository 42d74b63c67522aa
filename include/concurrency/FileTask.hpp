#pragma once

#include "concurrency/Task.hpp"
#include "concurrency/WorkerSlots.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace spdlog { class logger; }

namespace re::concurrency {

// A PromisedTask over a single file. The outcome of process() (or Failed, when it throws)
// is reported to the progress callback and fulfils the promise. The slot lease is given
// back before either happens.
struct FileTask : PromisedTask {
    std::filesystem::path file;
    WorkerSlots::Lease lease;
    types::ProgressCallback progress;

    FileTask(std::filesystem::path f, WorkerSlots::Lease l, types::ProgressCallback cb = {});

    void operator()() final;

protected:
    virtual types::FileOutcome process() = 0;

    [[nodiscard]] virtual std::string name() const = 0;
    [[nodiscard]] virtual std::shared_ptr<spdlog::logger> logger() const = 0;
};

}

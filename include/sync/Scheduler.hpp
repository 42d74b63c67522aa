#pragma once

#include "types/Reports.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>

namespace re::transcode { class Transcoder; }

namespace re::sync {

// Runs the transcoder over a snapshot of the pending set with bounded parallelism.
// Cancellation stops further dispatch; in-flight files always finish.
class Scheduler {
public:
    Scheduler() = default;

    void setProgressCallback(types::ProgressCallback cb) { progress_ = std::move(cb); }

    // maxWorkers == 0 runs a single worker. Only files under `under` are considered when set.
    types::RunReport run(const transcode::Transcoder& transcoder,
                         unsigned int maxWorkers,
                         const std::shared_ptr<std::atomic<bool>>& cancel,
                         const std::optional<std::filesystem::path>& under = std::nullopt) const;

    // Peak number of files in flight during the last run.
    [[nodiscard]] unsigned int lastPeakInFlight() const { return lastPeak_.load(); }

private:
    types::ProgressCallback progress_;
    mutable std::atomic<unsigned int> lastPeak_{0};
};

}

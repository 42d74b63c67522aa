#pragma once

#include "types/Reports.hpp"

#include <atomic>
#include <memory>

namespace re::database {

// Store maintenance: collapse duplicate rows, drop rows whose file is gone, then VACUUM.
class Cleaner {
public:
    explicit Cleaner(unsigned int maxConcurrency = 8);

    void setProgressCallback(types::ProgressCallback cb) { progress_ = std::move(cb); }

    // Store errors from the dedupe and compaction steps propagate. Cancellation stops the
    // existence checks and skips compaction.
    types::CleanReport clean(const std::shared_ptr<std::atomic<bool>>& cancel = {}) const;

private:
    unsigned int maxConcurrency_;
    types::ProgressCallback progress_;
};

}

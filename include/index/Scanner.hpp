#pragma once

#include "config/Config.hpp"
#include "types/Reports.hpp"

#include <atomic>
#include <filesystem>
#include <memory>

namespace re::transcode { class Classifier; }

namespace re::index {

// Reconciles a directory tree against the tracked-file store: new files are inserted,
// files whose modtime drifted are re-classified, everything else is left alone.
class Scanner {
public:
    explicit Scanner(const transcode::Classifier& classifier, config::IndexConfig options = {});

    void setProgressCallback(types::ProgressCallback cb) { progress_ = std::move(cb); }

    // Throws types::InvalidRoot unless root is an existing directory. Per-file failures
    // are collected in the report. Returns once every dispatched file has completed.
    types::ScanReport scan(const std::filesystem::path& root,
                           const std::shared_ptr<std::atomic<bool>>& cancel = {}) const;


private:
    const transcode::Classifier& classifier_;
    config::IndexConfig options_;
    types::ProgressCallback progress_;
};

}

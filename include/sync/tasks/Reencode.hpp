#pragma once

#include "concurrency/FileTask.hpp"

namespace re::transcode { class Transcoder; }

namespace re::sync::tasks {

// Transforms one pending file and clears its flag. A file that vanished since the scan
// only loses its row.
struct Reencode final : concurrency::FileTask {
    const transcode::Transcoder& transcoder;

    Reencode(std::filesystem::path f,
             concurrency::WorkerSlots::Lease l,
             const transcode::Transcoder& t,
             types::ProgressCallback cb = {});

protected:
    types::FileOutcome process() override;

    [[nodiscard]] std::string name() const override { return "Reencode"; }
    [[nodiscard]] std::shared_ptr<spdlog::logger> logger() const override;
};

}

#pragma once

#include <cstdint>
#include <filesystem>

namespace re::transcode {

struct TransformOutcome {
    std::filesystem::path path;
    uint64_t bytes_before{0};
    uint64_t bytes_after{0};
};

// The per-file transformation driven by the scheduler. Implementations replace the file
// atomically on success and throw types::TransformError, leaving it untouched, on failure.
class Transcoder {
public:
    virtual ~Transcoder() = default;

    virtual TransformOutcome transform(const std::filesystem::path& file) const = 0;
};

}

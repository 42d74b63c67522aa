#pragma once

#include "transcode/Transcoder.hpp"

#include <string>
#include <vector>

namespace re::transcode {

// Re-encodes a file in place by running the flac encoder as a child process:
//   <binary> <args...> --force --output-name=<file>.tmp <file>
// then renaming the temp file over the original.
class FlacCliTranscoder final : public Transcoder {
public:
    FlacCliTranscoder(std::string binary, std::vector<std::string> args);

    TransformOutcome transform(const std::filesystem::path& file) const override;

    [[nodiscard]] static std::filesystem::path tempPathFor(const std::filesystem::path& file);

private:
    std::string binary_;
    std::vector<std::string> args_;

    // Returns the child's exit status; stderr output is appended to errOut.
    int runEncoder(const std::filesystem::path& file, const std::filesystem::path& tmp, std::string& errOut) const;
};

}

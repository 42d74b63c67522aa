#pragma once

#include <filesystem>

namespace re::transcode {

class Classifier {
public:
    virtual ~Classifier() = default;

    // True if the file already matches the target signature. Throws on unreadable input.
    [[nodiscard]] virtual bool conforms(const std::filesystem::path& file) const = 0;
};

}

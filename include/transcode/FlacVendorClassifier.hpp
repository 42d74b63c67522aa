#pragma once

#include "transcode/Classifier.hpp"

#include <string>

namespace re::transcode {

// A FLAC file conforms when its encoder vendor string equals the target encoder's.
class FlacVendorClassifier final : public Classifier {
public:
    explicit FlacVendorClassifier(std::string targetVendor);

    [[nodiscard]] bool conforms(const std::filesystem::path& file) const override;


private:
    std::string targetVendor_;
};

}

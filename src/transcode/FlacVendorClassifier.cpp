#include "transcode/FlacVendorClassifier.hpp"
#include "transcode/flac/VendorTag.hpp"
#include "logging/LogRegistry.hpp"

using namespace re::transcode;
using namespace re::logging;

FlacVendorClassifier::FlacVendorClassifier(std::string targetVendor) : targetVendor_(std::move(targetVendor)) {}

bool FlacVendorClassifier::conforms(const std::filesystem::path& file) const {
    const auto vendor = flac::readVendorString(file);
    if (!vendor) {
        LogRegistry::transcode()->debug("[FlacVendorClassifier] No vendor tag in {}", file.string());
        return false;
    }
    return *vendor == targetVendor_;
}

#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>

namespace re::transcode::flac {

inline constexpr uint8_t BLOCK_STREAMINFO = 0;
inline constexpr uint8_t BLOCK_VORBIS_COMMENT = 4;

// Vendor string of the VORBIS_COMMENT metadata block, or nullopt if the stream has none.
// Throws std::runtime_error if the stream is not FLAC or its metadata is truncated.
std::optional<std::string> readVendorString(std::istream& in);
std::optional<std::string> readVendorString(const std::filesystem::path& file);

}

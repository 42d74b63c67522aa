#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace re::util {

// Absolute, symlink-resolved form of path. Paths that no longer exist are resolved as far
// as possible and normalized lexically for the rest.
std::filesystem::path canonicalPath(const std::filesystem::path& path);

// Modification time in whole seconds since the epoch. Throws std::system_error on failure.
uint64_t modtimeSeconds(const std::filesystem::path& path);

// Case-insensitive extension match; extensions are given without the leading dot.
// An empty list matches every file.
bool hasExtension(const std::filesystem::path& path, const std::vector<std::string>& extensions);

// Key prefix selecting every stored path beneath root.
std::string subtreePrefix(const std::filesystem::path& root);

}

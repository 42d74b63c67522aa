#include "util/files.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <system_error>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace re::util {

fs::path canonicalPath(const fs::path& path) {
    std::error_code ec;
    if (auto canonical = fs::canonical(path, ec); !ec) return canonical;
    const auto absolute = fs::absolute(path);
    if (auto weak = fs::weakly_canonical(absolute, ec); !ec) return weak.lexically_normal();
    // Not even a prefix resolves (ENAMETOOLONG and the like); keep the spelling.
    return absolute.lexically_normal();
}

uint64_t modtimeSeconds(const fs::path& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0)
        throw std::system_error(errno, std::generic_category(), "stat " + path.string());
    return static_cast<uint64_t>(st.st_mtim.tv_sec);
}

static std::string lower(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return std::tolower(c); });
    return s;
}

bool hasExtension(const fs::path& path, const std::vector<std::string>& extensions) {
    if (extensions.empty()) return true;
    auto ext = path.extension().string();
    if (ext.empty()) return false;
    ext = lower(ext.substr(1));
    return std::ranges::any_of(extensions, [&](const std::string& e) {
        return lower(e.starts_with(".") ? e.substr(1) : e) == ext;
    });
}

std::string subtreePrefix(const fs::path& root) {
    auto prefix = canonicalPath(root).string();
    if (!prefix.ends_with('/')) prefix += '/';
    return prefix;
}

}

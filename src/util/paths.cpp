#include "util/paths.hpp"

#include <cstdlib>
#include <pwd.h>
#include <stdexcept>
#include <unistd.h>

namespace fs = std::filesystem;

namespace re::paths {

static fs::path homeDir() {
    if (const char* home = std::getenv("HOME"); home && *home) return home;
    if (const passwd* pw = getpwuid(getuid()); pw && pw->pw_dir) return pw->pw_dir;
    throw std::runtime_error("Failed to locate home directory");
}

static fs::path xdgDir(const char* var, const fs::path& fallback) {
    if (const char* dir = std::getenv(var); dir && *dir && fs::path(dir).is_absolute()) return fs::path(dir) / "reencoder";
    return homeDir() / fallback / "reencoder";
}

fs::path getDataDir() { return xdgDir("XDG_DATA_HOME", ".local/share"); }

fs::path getConfigDir() { return xdgDir("XDG_CONFIG_HOME", ".config"); }

fs::path getStorePath() { return getDataDir() / "reencoder.db"; }

fs::path getConfigPath() { return getConfigDir() / "config.yaml"; }

fs::path getLogDir() { return getDataDir() / "logs"; }

}

#pragma once

#include <filesystem>

namespace re::paths {

// $XDG_DATA_HOME/reencoder, falling back to ~/.local/share/reencoder
std::filesystem::path getDataDir();

// $XDG_CONFIG_HOME/reencoder, falling back to ~/.config/reencoder
std::filesystem::path getConfigDir();

std::filesystem::path getStorePath();
std::filesystem::path getConfigPath();
std::filesystem::path getLogDir();

}

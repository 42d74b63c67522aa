#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "util/paths.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace re::config {

std::filesystem::path StoreConfig::resolvedPath() const {
    return path.empty() ? paths::getStorePath() : path;
}

std::filesystem::path LoggingConfig::resolvedLogDir() const {
    return log_dir.empty() ? paths::getLogDir() : log_dir;
}

template <typename T>
static void decodeSection(const YAML::Node& root, const char* key, T& out) {
    const auto node = root[key];
    if (!node) return;
    if (!YAML::convert<T>::decode(node, out))
        throw std::runtime_error(std::string("Invalid '") + key + "' section in config");
}

Config loadConfig(const std::string& path) {
    Config cfg;
    const YAML::Node root = YAML::LoadFile(path);

    decodeSection(root, "store", cfg.store);
    decodeSection(root, "index", cfg.index);
    decodeSection(root, "scheduler", cfg.scheduler);
    decodeSection(root, "transcoder", cfg.transcoder);
    decodeSection(root, "logging", cfg.logging);

    return cfg;
}

}

#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace re::config;

inline std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<StoreConfig> {
    static Node encode(const StoreConfig& rhs) {
        Node node;
        node["path"] = rhs.path.string();
        node["pool_size"] = rhs.pool_size;
        node["busy_timeout_ms"] = rhs.busy_timeout_ms;
        return node;
    }

    static bool decode(const Node& node, StoreConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.path = node["path"].as<std::string>("");
        rhs.pool_size = node["pool_size"].as<unsigned int>(4);
        rhs.busy_timeout_ms = node["busy_timeout_ms"].as<unsigned int>(5000);
        return true;
    }
};

template<>
struct convert<IndexConfig> {
    static Node encode(const IndexConfig& rhs) {
        Node node;
        node["extensions"] = rhs.extensions;
        node["max_concurrency"] = rhs.max_concurrency;
        return node;
    }

    static bool decode(const Node& node, IndexConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["extensions"]) rhs.extensions = node["extensions"].as<std::vector<std::string>>();
        rhs.max_concurrency = node["max_concurrency"].as<unsigned int>(8);
        return true;
    }
};

template<>
struct convert<SchedulerConfig> {
    static Node encode(const SchedulerConfig& rhs) {
        Node node;
        node["max_workers"] = rhs.max_workers;
        return node;
    }

    static bool decode(const Node& node, SchedulerConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.max_workers = node["max_workers"].as<unsigned int>(4);
        return true;
    }
};

template<>
struct convert<TranscoderConfig> {
    static Node encode(const TranscoderConfig& rhs) {
        Node node;
        node["binary"] = rhs.binary;
        node["args"] = rhs.args;
        node["target_vendor"] = rhs.target_vendor;
        return node;
    }

    static bool decode(const Node& node, TranscoderConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.binary = node["binary"].as<std::string>("flac");
        if (node["args"]) rhs.args = node["args"].as<std::vector<std::string>>();
        rhs.target_vendor = node["target_vendor"].as<std::string>(DEFAULT_TARGET_VENDOR);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["reencoder"] = to_std_string(spdlog::level::to_string_view(rhs.reencoder));
        node["db"]        = to_std_string(spdlog::level::to_string_view(rhs.db));
        node["index"]     = to_std_string(spdlog::level::to_string_view(rhs.index));
        node["sync"]      = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["transcode"] = to_std_string(spdlog::level::to_string_view(rhs.transcode));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.reencoder = spdlog::level::from_str(node["reencoder"].as<std::string>("info"));
        rhs.db = spdlog::level::from_str(node["db"].as<std::string>("warn"));
        rhs.index = spdlog::level::from_str(node["index"].as<std::string>("info"));
        rhs.sync = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.transcode = spdlog::level::from_str(node["transcode"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (node["levels"]) rhs.levels = node["levels"].as<LogLevelsConfig>();
        return true;
    }
};

}

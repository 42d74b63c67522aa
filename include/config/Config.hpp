#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace re::config {

inline constexpr auto DEFAULT_TARGET_VENDOR = "reference libFLAC 1.5.0 20250211";

struct StoreConfig {
    std::filesystem::path path;     // empty resolves to paths::getStorePath()
    unsigned int pool_size = 4;
    unsigned int busy_timeout_ms = 5000;

    [[nodiscard]] std::filesystem::path resolvedPath() const;
};

struct IndexConfig {
    std::vector<std::string> extensions = {"flac"};
    unsigned int max_concurrency = 8;
};

struct SchedulerConfig {
    unsigned int max_workers = 4;
};

struct TranscoderConfig {
    std::string binary = "flac";
    std::vector<std::string> args = {"-8", "--silent"};
    std::string target_vendor = DEFAULT_TARGET_VENDOR;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum reencoder = spdlog::level::info;   // startup, shutdown, operation summaries
    spdlog::level::level_enum db        = spdlog::level::warn;   // failed transactions, lock contention
    spdlog::level::level_enum index     = spdlog::level::info;   // per-file scan failures
    spdlog::level::level_enum sync      = spdlog::level::info;   // per-file transform failures
    spdlog::level::level_enum transcode = spdlog::level::warn;   // encoder exit codes
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;  // empty resolves to paths::getLogDir()
    LogLevelsConfig levels;

    [[nodiscard]] std::filesystem::path resolvedLogDir() const;
};

struct Config {
    StoreConfig store;
    IndexConfig index;
    SchedulerConfig scheduler;
    TranscoderConfig transcoder;
    LoggingConfig logging;
};

Config loadConfig(const std::string& path);

}

#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace re::logging {

class LogRegistry {
public:
    // Initialize all loggers with sinks/levels from ConfigRegistry.
    static void init(const std::filesystem::path& logDir);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> reencoder() { return get("reencoder"); }
    static std::shared_ptr<spdlog::logger> db()        { return get("db"); }
    static std::shared_ptr<spdlog::logger> index()     { return get("index"); }
    static std::shared_ptr<spdlog::logger> sync()      { return get("sync"); }
    static std::shared_ptr<spdlog::logger> transcode() { return get("transcode"); }

    // Raise the console sink to at least the given verbosity.
    static void setConsoleLevel(spdlog::level::level_enum level);

    [[nodiscard]] static bool isInitialized();

private:
    static inline bool initialized_ = false;
    static inline std::filesystem::path log_dir_;
    static inline spdlog::sink_ptr console_sink_;
    static inline spdlog::sink_ptr main_file_sink_;

    static constexpr size_t main_max_bytes_ = 1024 * 1024 * 10;  // 10MB
    static constexpr size_t main_max_files_ = 5;
    static constexpr auto LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";
};

}

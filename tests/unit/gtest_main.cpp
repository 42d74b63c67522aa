#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>
#include <unistd.h>

#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        const auto logDir = fs::temp_directory_path() / ("reencoder-tests-" + std::to_string(getpid())) / "logs";

        re::config::Config cfg;
        cfg.logging.log_dir = logDir;
        cfg.logging.levels.console_log_level = spdlog::level::critical;
        cfg.logging.levels.subsystem_levels.db = spdlog::level::debug;
        re::config::ConfigRegistry::init(cfg);
        re::logging::LogRegistry::init(logDir);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize reencoder test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}

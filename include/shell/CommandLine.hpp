#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace re::shell {

enum class Command { Scan, Run, Clean, Count, List };

struct CommandLine {
    Command command = Command::Count;
    std::optional<std::filesystem::path> root;

    std::optional<std::filesystem::path> config_path;
    std::optional<std::filesystem::path> db_path;
    std::optional<unsigned int> threads;
    bool json = false;
    bool verbose = false;
    bool help = false;
};

// Throws std::invalid_argument describing the first problem found.
CommandLine parseCommandLine(int argc, const char* const* argv);

std::string usage(const std::string& prog = "reencoder");

std::string to_string(Command command);

}

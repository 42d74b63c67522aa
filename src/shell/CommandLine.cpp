#include "shell/CommandLine.hpp"

#include <charconv>
#include <stdexcept>
#include <string_view>
#include <vector>
#include <fmt/core.h>

namespace re::shell {

namespace {

std::optional<Command> commandFromString(const std::string_view name) {
    if (name == "scan") return Command::Scan;
    if (name == "run") return Command::Run;
    if (name == "clean") return Command::Clean;
    if (name == "count") return Command::Count;
    if (name == "list") return Command::List;
    return std::nullopt;
}

std::optional<unsigned int> parseUnsigned(const std::string_view s) {
    unsigned int value = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

// Splits "--key=value" into its parts; plain flags get no inline value.
std::pair<std::string, std::optional<std::string>> splitFlag(const std::string& arg) {
    if (const auto eq = arg.find('='); eq != std::string::npos && arg.starts_with("--"))
        return {arg.substr(0, eq), arg.substr(eq + 1)};
    return {arg, std::nullopt};
}

}

CommandLine parseCommandLine(const int argc, const char* const* argv) {
    CommandLine cli;
    std::vector<std::string> positionals;
    bool stopFlags = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (!stopFlags && arg == "--") {
            stopFlags = true;
            continue;
        }

        if (stopFlags || arg.empty() || arg[0] != '-' || arg == "-") {
            positionals.push_back(arg);
            continue;
        }

        const auto split = splitFlag(arg);
        const auto& key = split.first;
        const auto& inlineValue = split.second;

        const auto value = [&]() -> std::string {
            if (inlineValue) return *inlineValue;
            if (i + 1 >= argc) throw std::invalid_argument(fmt::format("Option {} requires a value", key));
            return argv[++i];
        };

        if (key == "--config") cli.config_path = value();
        else if (key == "--db") cli.db_path = value();
        else if (key == "--threads") {
            const auto raw = value();
            const auto n = parseUnsigned(raw);
            if (!n) throw std::invalid_argument(fmt::format("Invalid thread count '{}'", raw));
            cli.threads = *n;
        }
        else if (key == "--json" && !inlineValue) cli.json = true;
        else if ((key == "-v" || key == "--verbose") && !inlineValue) cli.verbose = true;
        else if ((key == "-h" || key == "--help") && !inlineValue) cli.help = true;
        else throw std::invalid_argument(fmt::format("Unknown option '{}'", arg));
    }

    if (cli.help) return cli;

    auto pos = positionals.begin();
    if (pos != positionals.end()) {
        const auto cmd = commandFromString(*pos);
        if (!cmd) throw std::invalid_argument(fmt::format("Unknown command '{}'", *pos));
        cli.command = *cmd;
        ++pos;
    }

    if (pos != positionals.end()) {
        if (cli.command == Command::Clean)
            throw std::invalid_argument("clean takes no arguments");
        cli.root = *pos++;
    }

    if (pos != positionals.end())
        throw std::invalid_argument(fmt::format("Unexpected argument '{}'", *pos));

    if (cli.command == Command::Scan && !cli.root)
        throw std::invalid_argument("scan requires a root directory");

    return cli;
}

std::string usage(const std::string& prog) {
    return fmt::format(
        "usage: {} [--config FILE] [--db FILE] [--threads N] [--json] [-v] <command> [args]\n"
        "\n"
        "commands:\n"
        "  scan  <root>     index files under root\n"
        "  run   [root]     reencode pending files (optionally only under root)\n"
        "  clean            dedupe, prune vanished files, vacuum\n"
        "  count [root]     print the number of pending files (default)\n"
        "  list  [root]     print the pending paths\n"
        "\n"
        "options:\n"
        "  --config FILE    configuration file (default $XDG_CONFIG_HOME/reencoder/config.yaml)\n"
        "  --db FILE        store file, overrides store.path\n"
        "  --threads N      worker count for run, overrides scheduler.max_workers\n"
        "  --json           print the report as JSON\n"
        "  -v, --verbose    debug logging on the console\n"
        "  -h, --help       show this help\n",
        prog);
}

std::string to_string(const Command command) {
    switch (command) {
        case Command::Scan: return "scan";
        case Command::Run: return "run";
        case Command::Clean: return "clean";
        case Command::Count: return "count";
        case Command::List: return "list";
    }
    return "unknown";
}

}

// Core
#include "index/Scanner.hpp"
#include "sync/Scheduler.hpp"
#include "database/Cleaner.hpp"

// Database
#include "database/Transactions.hpp"
#include "database/Queries/TrackedFileQueries.hpp"

// Transcoding
#include "transcode/FlacCliTranscoder.hpp"
#include "transcode/FlacVendorClassifier.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"
#include "shell/CommandLine.hpp"
#include "util/paths.hpp"

// Libraries
#include <csignal>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace re;
using namespace re::config;
using namespace re::database;
using namespace re::logging;
using namespace re::shell;

namespace {

constexpr int EXIT_USAGE = 2;
constexpr int EXIT_RUN_FAILURES = 3;

std::shared_ptr<std::atomic<bool>> cancelFlag = std::make_shared<std::atomic<bool>>(false);

void signalHandler(int) {
    // Later signals change nothing; in-flight files are always allowed to finish.
    cancelFlag->store(true);
}

Config buildConfig(const CommandLine& cli) {
    const auto path = cli.config_path.value_or(paths::getConfigPath());
    if (cli.config_path && !std::filesystem::exists(path))
        throw std::runtime_error("Config file not found: " + path.string());

    Config cfg = std::filesystem::exists(path) ? loadConfig(path.string()) : Config{};
    if (cli.db_path) cfg.store.path = *cli.db_path;
    if (cli.threads) cfg.scheduler.max_workers = *cli.threads;
    return cfg;
}

template <typename Report>
void printJson(const Report& report) {
    fmt::print("{}\n", nlohmann::json(report).dump(2));
}

void printErrors(const std::vector<types::FileError>& errors) {
    for (const auto& e : errors) fmt::print(stderr, "  {}: {}\n", e.path.string(), e.message);
}

int doScan(const CommandLine& cli, const Config& cfg) {
    const transcode::FlacVendorClassifier classifier(cfg.transcoder.target_vendor);
    re::index::Scanner scanner(classifier, cfg.index);

    const auto report = scanner.scan(*cli.root, cancelFlag);
    if (cli.json) printJson(report);
    else {
        fmt::print("Scanned {}: {} new, {} changed, {} unchanged, {} errors{}\n",
                   report.root.string(), report.inserted, report.updated, report.unchanged, report.errored,
                   report.cancelled ? " (cancelled)" : "");
        printErrors(report.errors);
    }
    return EXIT_SUCCESS;
}

int doRun(const CommandLine& cli, const Config& cfg) {
    const transcode::FlacCliTranscoder transcoder(cfg.transcoder.binary, cfg.transcoder.args);
    const re::sync::Scheduler scheduler{};

    const auto report = scheduler.run(transcoder, cfg.scheduler.max_workers, cancelFlag, cli.root);
    if (cli.json) printJson(report);
    else {
        fmt::print("Reencoded {} files, {} failed, {} missing{}\n",
                   report.succeeded, report.failed, report.skipped_missing,
                   report.cancelled ? fmt::format(", {} left pending (cancelled)", report.pending_due_to_cancel) : "");
        if (report.unrecorded > 0)
            fmt::print("{} files were reencoded but could not be recorded; they will be retried\n", report.unrecorded);
        printErrors(report.errors);
    }
    return report.failed > 0 ? EXIT_RUN_FAILURES : EXIT_SUCCESS;
}

int doClean(const CommandLine& cli, const Config& cfg) {
    const Cleaner cleaner(cfg.index.max_concurrency);

    const auto report = cleaner.clean(cancelFlag);
    if (cli.json) printJson(report);
    else {
        fmt::print("Removed {} duplicate and {} vanished entries, kept {}{}\n",
                   report.duplicates_removed, report.missing_removed, report.kept,
                   report.compacted ? ", store compacted" : "");
        printErrors(report.errors);
    }
    return EXIT_SUCCESS;
}

int doCount(const CommandLine& cli) {
    const auto count = TrackedFileQueries::pendingCount(cli.root);
    if (cli.json) fmt::print("{}\n", nlohmann::json{{"pending", count}}.dump(2));
    else fmt::print("{}\n", count);
    return EXIT_SUCCESS;
}

int doList(const CommandLine& cli) {
    const auto files = TrackedFileQueries::pending(cli.root);
    if (cli.json) {
        auto arr = nlohmann::json::array();
        for (const auto& f : files) arr.push_back(f.string());
        fmt::print("{}\n", arr.dump(2));
    } else {
        for (const auto& f : files) fmt::print("{}\n", f.string());
    }
    return EXIT_SUCCESS;
}

}

int main(const int argc, char** argv) {
    CommandLine cli;
    try {
        cli = parseCommandLine(argc, argv);
    } catch (const std::invalid_argument& e) {
        fmt::print(stderr, "{}\n\n{}", e.what(), usage());
        return EXIT_USAGE;
    }

    if (cli.help) {
        fmt::print("{}", usage());
        return EXIT_SUCCESS;
    }

    try {
        const auto cfg = buildConfig(cli);
        ConfigRegistry::init(cfg);
        LogRegistry::init(cfg.logging.resolvedLogDir());
        if (cli.verbose) LogRegistry::setConsoleLevel(spdlog::level::debug);

        LogRegistry::reencoder()->debug("[*] Opening store {}", cfg.store.resolvedPath().string());
        Transactions::init(cfg.store.resolvedPath(), cfg.store.pool_size, cfg.store.busy_timeout_ms);

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        int rc = EXIT_SUCCESS;
        switch (cli.command) {
            case Command::Scan: rc = doScan(cli, cfg); break;
            case Command::Run: rc = doRun(cli, cfg); break;
            case Command::Clean: rc = doClean(cli, cfg); break;
            case Command::Count: rc = doCount(cli); break;
            case Command::List: rc = doList(cli); break;
        }

        if (cancelFlag->load()) LogRegistry::reencoder()->info("[!] Interrupted, {} stopped early", to_string(cli.command));

        Transactions::shutdown();
        return rc;
    } catch (const std::exception& e) {
        if (LogRegistry::isInitialized()) LogRegistry::reencoder()->error("[-] {} failed: {}", to_string(cli.command), e.what());
        else fmt::print(stderr, "reencoder: {}\n", e.what());
        return EXIT_FAILURE;
    }
}

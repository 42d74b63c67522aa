#include "index/Scanner.hpp"
#include "concurrency/Dispatcher.hpp"
#include "concurrency/FileTask.hpp"
#include "database/Queries/TrackedFileQueries.hpp"
#include "logging/LogRegistry.hpp"
#include "transcode/Classifier.hpp"
#include "types/Errors.hpp"
#include "util/files.hpp"

#include <algorithm>
#include <functional>

namespace fs = std::filesystem;

using namespace re::index;
using namespace re::concurrency;
using namespace re::database;
using namespace re::logging;
using namespace re::types;

namespace {

struct Reconcile final : FileTask {
    const re::transcode::Classifier& classifier;

    Reconcile(fs::path f, WorkerSlots::Lease l, ProgressCallback cb, const re::transcode::Classifier& c)
        : FileTask(std::move(f), std::move(l), std::move(cb)), classifier(c) {}

protected:
    FileOutcome process() override {
        const auto canonical = re::util::canonicalPath(file);
        const auto mt = re::util::modtimeSeconds(canonical);

        std::optional<bool> conforms;
        auto stored = TrackedFileQueries::modtimeOf(canonical);

        if (!stored) {
            conforms = classifier.conforms(canonical);
            try {
                TrackedFileQueries::upsertNew(canonical, !*conforms, mt);
                LogRegistry::index()->debug("[Scanner] Tracking {} (pending: {})", canonical.string(), !*conforms);
                return {canonical, FileOutcome::Status::Inserted};
            } catch (const AlreadyExists&) {
                // Another writer inserted it first; reconcile against what it stored.
                stored = TrackedFileQueries::modtimeOf(canonical);
                if (!stored) throw NotFound(canonical);
            }
        }

        if (*stored == mt) return {canonical, FileOutcome::Status::Unchanged};

        if (!conforms) conforms = classifier.conforms(canonical);
        TrackedFileQueries::refresh(canonical, !*conforms, mt);
        LogRegistry::index()->debug("[Scanner] {} changed on disk (pending: {})", canonical.string(), !*conforms);
        return {canonical, FileOutcome::Status::Updated};
    }

    [[nodiscard]] std::string name() const override { return "Scanner"; }
    [[nodiscard]] std::shared_ptr<spdlog::logger> logger() const override { return LogRegistry::index(); }
};

}

Scanner::Scanner(const transcode::Classifier& classifier, config::IndexConfig options)
    : classifier_(classifier), options_(std::move(options)) {}

ScanReport Scanner::scan(const fs::path& root, const std::shared_ptr<std::atomic<bool>>& cancel) const {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) throw InvalidRoot(root);

    ScanReport report;
    report.root = util::canonicalPath(root);

    LogRegistry::index()->info("[Scanner] Scanning {} with {} workers", report.root.string(), options_.max_concurrency);

    Dispatcher dispatcher(cancel, options_.max_concurrency);

    // Depth-first, one directory_iterator per directory, so a directory that fails to
    // open or read costs only its own subtree. Subdirectories are visited in name order.
    std::vector<fs::path> dirs{report.root};
    while (!dirs.empty() && !report.cancelled) {
        const auto dir = std::move(dirs.back());
        dirs.pop_back();

        std::vector<fs::path> subdirs;
        fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
        if (ec && dir == report.root) throw InvalidRoot(root);

        for (const fs::directory_iterator end{}; !ec && it != end; it.increment(ec)) {
            std::error_code typeEc;
            if (!it->is_symlink(typeEc) && it->is_directory(typeEc)) {
                subdirs.push_back(it->path());
                continue;
            }
            if (!it->is_regular_file(typeEc) || !util::hasExtension(it->path(), options_.extensions)) continue;

            auto lease = dispatcher.reserve();
            if (!lease) {
                report.cancelled = true;
                break;
            }

            dispatcher.push(std::make_shared<Reconcile>(it->path(), std::move(*lease), progress_, classifier_));
        }

        if (ec) {
            LogRegistry::index()->error("[Scanner] Cannot read directory {}: {}", dir.string(), ec.message());
            report.errors.push_back({dir, "directory walk failed: " + ec.message()});
            ++report.errored;
            ec.clear();
        }

        std::ranges::sort(subdirs, std::greater{});
        for (auto& sub : subdirs) dirs.push_back(std::move(sub));
    }

    for (const auto& outcome : dispatcher.processFutures()) report.record(outcome);
    if (dispatcher.isInterrupted()) report.cancelled = true;

    LogRegistry::index()->info("[Scanner] {} {}: {} inserted, {} updated, {} unchanged, {} errors",
                               report.cancelled ? "Cancelled" : "Finished", report.root.string(),
                               report.inserted, report.updated, report.unchanged, report.errored);
    return report;
}

#include "types/Reports.hpp"

#include <nlohmann/json.hpp>

using namespace re::types;

void ScanReport::record(const FileOutcome& outcome) {
    switch (outcome.status) {
        case FileOutcome::Status::Inserted: ++inserted; break;
        case FileOutcome::Status::Updated: ++updated; break;
        case FileOutcome::Status::Unchanged: ++unchanged; break;
        default:
            ++errored;
            errors.push_back({outcome.path, outcome.error});
    }
}

void RunReport::record(const FileOutcome& outcome) {
    switch (outcome.status) {
        case FileOutcome::Status::Transformed: ++succeeded; break;
        case FileOutcome::Status::Unrecorded:
            // the file itself was processed; only the bookkeeping is stale
            ++succeeded;
            ++unrecorded;
            errors.push_back({outcome.path, outcome.error});
            break;
        case FileOutcome::Status::Missing: ++skipped_missing; break;
        default:
            ++failed;
            errors.push_back({outcome.path, outcome.error});
    }
}

void CleanReport::record(const FileOutcome& outcome) {
    switch (outcome.status) {
        case FileOutcome::Status::Removed: ++missing_removed; break;
        case FileOutcome::Status::Kept: ++kept; break;
        default:
            ++errored;
            errors.push_back({outcome.path, outcome.error});
    }
}

std::string re::types::to_string(const FileOutcome::Status status) {
    switch (status) {
        case FileOutcome::Status::Inserted: return "inserted";
        case FileOutcome::Status::Updated: return "updated";
        case FileOutcome::Status::Unchanged: return "unchanged";
        case FileOutcome::Status::Transformed: return "transformed";
        case FileOutcome::Status::Unrecorded: return "unrecorded";
        case FileOutcome::Status::Missing: return "missing";
        case FileOutcome::Status::Removed: return "removed";
        case FileOutcome::Status::Kept: return "kept";
        case FileOutcome::Status::Failed: return "failed";
    }
    return "unknown";
}

void re::types::to_json(nlohmann::json& j, const FileError& e) {
    j = nlohmann::json{{"path", e.path.string()}, {"error", e.message}};
}

void re::types::to_json(nlohmann::json& j, const ScanReport& r) {
    j = nlohmann::json{
        {"root", r.root.string()},
        {"inserted", r.inserted},
        {"updated", r.updated},
        {"unchanged", r.unchanged},
        {"errored", r.errored},
        {"cancelled", r.cancelled},
        {"errors", r.errors}
    };
}

void re::types::to_json(nlohmann::json& j, const RunReport& r) {
    j = nlohmann::json{
        {"succeeded", r.succeeded},
        {"failed", r.failed},
        {"skipped_missing", r.skipped_missing},
        {"pending_due_to_cancel", r.pending_due_to_cancel},
        {"unrecorded", r.unrecorded},
        {"cancelled", r.cancelled},
        {"errors", r.errors}
    };
}

void re::types::to_json(nlohmann::json& j, const CleanReport& r) {
    j = nlohmann::json{
        {"duplicates_removed", r.duplicates_removed},
        {"missing_removed", r.missing_removed},
        {"kept", r.kept},
        {"errored", r.errored},
        {"compacted", r.compacted},
        {"cancelled", r.cancelled},
        {"errors", r.errors}
    };
}

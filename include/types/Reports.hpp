#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace re::types {

struct FileError {
    std::filesystem::path path;
    std::string message;
};

// Result of processing a single file in a scan, run or clean pass.
struct FileOutcome {
    enum class Status {
        Inserted,     // scan: first sighting
        Updated,      // scan: modtime drift, row refreshed
        Unchanged,    // scan: modtime matches, nothing inspected
        Transformed,  // run: transform succeeded and flag cleared
        Unrecorded,   // run: transform succeeded but the store write failed
        Missing,      // run: backing file vanished, row removed
        Removed,      // clean: backing file vanished, row removed
        Kept,         // clean: backing file still present
        Failed
    };

    std::filesystem::path path;
    Status status{Status::Failed};
    std::string error{};

    [[nodiscard]] bool failed() const { return status == Status::Failed; }
};

using ProgressCallback = std::function<void(const FileOutcome&)>;

struct ScanReport {
    std::filesystem::path root;
    uint64_t inserted{0}, updated{0}, unchanged{0}, errored{0};
    bool cancelled{false};
    std::vector<FileError> errors;

    void record(const FileOutcome& outcome);
    [[nodiscard]] uint64_t total() const { return inserted + updated + unchanged + errored; }
};

struct RunReport {
    uint64_t succeeded{0}, failed{0}, skipped_missing{0}, pending_due_to_cancel{0}, unrecorded{0};
    bool cancelled{false};
    std::vector<FileError> errors;

    void record(const FileOutcome& outcome);
    [[nodiscard]] uint64_t dispatched() const { return succeeded + failed + skipped_missing; }
};

struct CleanReport {
    uint64_t duplicates_removed{0}, missing_removed{0}, kept{0}, errored{0};
    bool compacted{false}, cancelled{false};
    std::vector<FileError> errors;

    void record(const FileOutcome& outcome);
};

std::string to_string(FileOutcome::Status status);

void to_json(nlohmann::json& j, const FileError& e);
void to_json(nlohmann::json& j, const ScanReport& r);
void to_json(nlohmann::json& j, const RunReport& r);
void to_json(nlohmann::json& j, const CleanReport& r);

}

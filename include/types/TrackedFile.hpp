#pragma once

#include <cstdint>
#include <filesystem>
#include <nlohmann/json_fwd.hpp>

namespace re::database {
class Row;
}

namespace re::types {

struct TrackedFile {
    std::filesystem::path path;
    bool needs_processing{false};
    uint64_t last_modified{0};
    uint64_t write_seq{0};

    TrackedFile() = default;
    TrackedFile(std::filesystem::path path, bool needsProcessing, uint64_t lastModified);
    explicit TrackedFile(const database::Row& row);

    bool operator==(const TrackedFile& other) const = default;
};

void to_json(nlohmann::json& j, const TrackedFile& f);

}

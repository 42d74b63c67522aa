#include "types/TrackedFile.hpp"
#include "database/Result.hpp"

#include <nlohmann/json.hpp>

using namespace re::types;

TrackedFile::TrackedFile(std::filesystem::path path, const bool needsProcessing, const uint64_t lastModified)
    : path(std::move(path)), needs_processing(needsProcessing), last_modified(lastModified) {}

TrackedFile::TrackedFile(const database::Row& row)
    : path(row.at("path").as<std::string>()),
      needs_processing(row.at("needs_processing").as<bool>()),
      last_modified(row.at("modtime").as<uint64_t>()),
      write_seq(row.at("write_seq").as<uint64_t>()) {}

void re::types::to_json(nlohmann::json& j, const TrackedFile& f) {
    j = nlohmann::json{
        {"path", f.path.string()},
        {"needs_processing", f.needs_processing},
        {"last_modified", f.last_modified},
        {"write_seq", f.write_seq}
    };
}

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace re::types {

struct InvalidRoot : std::runtime_error {
    explicit InvalidRoot(const std::filesystem::path& root)
        : std::runtime_error("Invalid root directory: " + root.string()) {}
};

struct NotFound : std::runtime_error {
    explicit NotFound(const std::filesystem::path& path)
        : std::runtime_error("No tracked file for path: " + path.string()) {}
};

struct AlreadyExists : std::runtime_error {
    explicit AlreadyExists(const std::filesystem::path& path)
        : std::runtime_error("File is already tracked: " + path.string()) {}
};

// Any failure reported by the backing SQLite store. code() is the extended result code.
class StoreIoError : public std::runtime_error {
public:
    StoreIoError(const std::string& context, int code, const std::string& message)
        : std::runtime_error("[" + context + "] " + message), code_(code) {}

    [[nodiscard]] int code() const noexcept { return code_; }
    [[nodiscard]] bool isConstraintViolation() const noexcept { return (code_ & 0xff) == 19; } // SQLITE_CONSTRAINT

private:
    int code_;
};

struct TransformError : std::runtime_error {
    TransformError(const std::filesystem::path& path, const std::string& cause)
        : std::runtime_error("Transform failed for " + path.string() + ": " + cause) {}
};

}

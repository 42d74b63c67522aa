#pragma once

#include "database/Transactions.hpp"
#include "database/Queries/TrackedFileQueries.hpp"
#include "transcode/Classifier.hpp"
#include "transcode/Transcoder.hpp"
#include "types/Errors.hpp"
#include "util/files.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <sys/stat.h>
#include <thread>

namespace re::test {

namespace fs = std::filesystem;

inline constexpr auto CONFORMING = "CONFORMS";

inline fs::path makeTempDir(const std::string& tag) {
    std::string tmpl = (fs::temp_directory_path() / ("reencoder-" + tag + "-XXXXXX")).string();
    if (!mkdtemp(tmpl.data())) throw std::runtime_error("mkdtemp failed for " + tmpl);
    return fs::canonical(tmpl);
}

inline std::string readFile(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

inline void writeFile(const fs::path& p, const std::string& content) {
    if (p.has_parent_path()) fs::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << content;
}

inline void setModtime(const fs::path& p, const uint64_t seconds) {
    const timespec times[2] = {{static_cast<time_t>(seconds), 0}, {static_cast<time_t>(seconds), 0}};
    if (utimensat(AT_FDCWD, p.c_str(), times, 0) != 0) throw std::runtime_error("utimensat failed for " + p.string());
}

// Conforms iff the file starts with CONFORMS. Files containing UNREADABLE throw.
class FakeClassifier final : public transcode::Classifier {
public:
    std::chrono::milliseconds delay{0};
    std::function<void(const fs::path&)> onClassify;
    mutable std::atomic<int> calls{0};
    mutable std::atomic<int> inFlight{0};
    mutable std::atomic<int> peak{0};

    [[nodiscard]] bool conforms(const fs::path& file) const override {
        ++calls;
        const int now = ++inFlight;
        int prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {}

        if (onClassify) onClassify(file);
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        const auto content = readFile(file);
        --inFlight;

        if (content.find("UNREADABLE") != std::string::npos) throw std::runtime_error("cannot decode " + file.string());
        return content.starts_with(CONFORMING);
    }
};

// Rewrites the file to CONFORMS content through a temp file. Files whose name is in
// failNames throw TransformError without touching the file.
class FakeTranscoder final : public transcode::Transcoder {
public:
    std::set<std::string> failNames;
    std::chrono::milliseconds delay{0};
    std::function<void(const fs::path&)> onTransform;

    mutable std::atomic<int> calls{0};
    mutable std::atomic<int> inFlight{0};
    mutable std::atomic<int> peak{0};

    transcode::TransformOutcome transform(const fs::path& file) const override {
        ++calls;
        const int now = ++inFlight;
        int prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {}

        {
            std::scoped_lock lock(mtx_);
            ++perFile_[file];
        }

        if (onTransform) onTransform(file);
        if (delay.count() > 0) std::this_thread::sleep_for(delay);

        if (failNames.contains(file.filename().string())) {
            --inFlight;
            throw types::TransformError(file, "simulated encoder failure");
        }

        const auto before = fs::file_size(file);
        const auto tmp = fs::path(file.string() + ".tmp");
        writeFile(tmp, std::string(CONFORMING) + " " + file.filename().string());
        fs::rename(tmp, file);
        --inFlight;
        return {file, before, fs::file_size(file)};
    }

    [[nodiscard]] int timesTransformed(const fs::path& file) const {
        std::scoped_lock lock(mtx_);
        const auto it = perFile_.find(file);
        return it == perFile_.end() ? 0 : it->second;
    }

    [[nodiscard]] std::map<fs::path, int> perFile() const {
        std::scoped_lock lock(mtx_);
        return perFile_;
    }

private:
    mutable std::mutex mtx_;
    mutable std::map<fs::path, int> perFile_;
};

// Fresh store file and file tree per test.
class StoreTest : public ::testing::Test {
protected:
    fs::path dir_;
    fs::path tree_;
    fs::path storePath_;
    std::shared_ptr<std::atomic<bool>> cancel_ = std::make_shared<std::atomic<bool>>(false);

    void SetUp() override {
        dir_ = makeTempDir("test");
        tree_ = dir_ / "tree";
        fs::create_directories(tree_);
        storePath_ = dir_ / "store.db";
        database::Transactions::init(storePath_, 4, 5000);
    }

    void TearDown() override {
        database::Transactions::shutdown();
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    // Writes a file under the tree and returns its canonical path.
    fs::path addFile(const std::string& rel, const std::string& content) const {
        const auto p = tree_ / rel;
        writeFile(p, content);
        return fs::canonical(p);
    }

    fs::path addConforming(const std::string& rel) const { return addFile(rel, std::string(CONFORMING) + " " + rel); }
    fs::path addPending(const std::string& rel) const { return addFile(rel, "legacy encoder " + rel); }

    // Inserts a row exactly as given, bypassing canonicalization.
    static void insertRaw(const std::string& path, const bool needsProcessing, const uint64_t modtime) {
        database::Transactions::exec("test::insertRaw", [&](database::Work& txn) {
            txn.exec(database::prepped{"insert_tracked_file"}, path, needsProcessing, modtime);
        });
    }

    static std::vector<fs::path> sorted(std::vector<fs::path> v) {
        std::ranges::sort(v);
        return v;
    }
};

}

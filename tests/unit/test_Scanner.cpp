#include "TestStore.hpp"
#include "index/Scanner.hpp"

using namespace re::test;
using namespace re::database;
using namespace re::index;
using namespace re::types;

class ScannerTest : public StoreTest {
protected:
    FakeClassifier classifier_;

    [[nodiscard]] Scanner makeScanner(const unsigned int maxConcurrency = 4) const {
        re::config::IndexConfig opts;
        opts.max_concurrency = maxConcurrency;
        return Scanner(classifier_, opts);
    }
};

TEST_F(ScannerTest, ThreeFilesTwoConforming) {
    addConforming("a.flac");
    addConforming("sub/b.flac");
    const auto c = addPending("sub/deeper/c.flac");

    const auto report = makeScanner().scan(tree_, cancel_);

    EXPECT_EQ(report.inserted, 3u);
    EXPECT_EQ(report.errored, 0u);
    EXPECT_FALSE(report.cancelled);
    EXPECT_EQ(TrackedFileQueries::pendingCount(), 1u);
    EXPECT_EQ(TrackedFileQueries::pending(), std::vector<fs::path>{c});
}

TEST_F(ScannerTest, SecondScanWithoutChangesIsIdempotent) {
    const auto a = addConforming("a.flac");
    const auto b = addPending("b.flac");
    const auto scanner = makeScanner();
    scanner.scan(tree_, cancel_);

    const auto rowA = TrackedFileQueries::get(a);
    const auto rowB = TrackedFileQueries::get(b);
    const int inspections = classifier_.calls.load();

    const auto report = scanner.scan(tree_, cancel_);

    EXPECT_EQ(report.inserted, 0u);
    EXPECT_EQ(report.updated, 0u);
    EXPECT_EQ(report.unchanged, 2u);
    EXPECT_EQ(TrackedFileQueries::get(a), rowA);
    EXPECT_EQ(TrackedFileQueries::get(b), rowB);
    EXPECT_EQ(classifier_.calls.load(), inspections);
}

TEST_F(ScannerTest, ModtimeDriftTakesClassifierVerdict) {
    const auto a = addConforming("a.flac");
    const auto b = addPending("b.flac");
    setModtime(a, 1000);
    setModtime(b, 1000);
    const auto scanner = makeScanner();
    scanner.scan(tree_, cancel_);
    ASSERT_FALSE(TrackedFileQueries::get(a)->needs_processing);
    ASSERT_TRUE(TrackedFileQueries::get(b)->needs_processing);

    // a is replaced by a legacy encode, b by a conforming one
    writeFile(a, "legacy encoder");
    writeFile(b, std::string(CONFORMING) + " fresh");
    setModtime(a, 2000);
    setModtime(b, 2000);

    const auto report = scanner.scan(tree_, cancel_);

    EXPECT_EQ(report.updated, 2u);
    EXPECT_TRUE(TrackedFileQueries::get(a)->needs_processing);
    EXPECT_EQ(TrackedFileQueries::get(a)->last_modified, 2000u);
    EXPECT_FALSE(TrackedFileQueries::get(b)->needs_processing);
    EXPECT_EQ(TrackedFileQueries::get(b)->last_modified, 2000u);
}

TEST_F(ScannerTest, OnlySelectedExtensionsAreIndexed) {
    const auto upper = addPending("LOUD.FLAC");
    addPending("cover.jpg");
    addPending("notes");
    fs::create_directories(tree_ / "empty.flac");

    const auto report = makeScanner().scan(tree_, cancel_);

    EXPECT_EQ(report.total(), 1u);
    EXPECT_EQ(TrackedFileQueries::allPaths(), std::vector<fs::path>{upper});
}

TEST_F(ScannerTest, InvalidRootThrows) {
    const auto file = addPending("a.flac");
    EXPECT_THROW(makeScanner().scan(tree_ / "missing", cancel_), InvalidRoot);
    EXPECT_THROW(makeScanner().scan(file, cancel_), InvalidRoot);
    EXPECT_TRUE(TrackedFileQueries::allPaths().empty());
}

TEST_F(ScannerTest, ClassifierFailureIsCollectedPerFile) {
    addConforming("good.flac");
    const auto bad = addFile("bad.flac", "UNREADABLE");

    const auto report = makeScanner().scan(tree_, cancel_);

    EXPECT_EQ(report.inserted, 1u);
    EXPECT_EQ(report.errored, 1u);
    ASSERT_EQ(report.errors.size(), 1u);
    EXPECT_EQ(report.errors.front().path, bad);
    EXPECT_FALSE(TrackedFileQueries::exists(bad));
}

TEST_F(ScannerTest, CancelledScanDispatchesNothing) {
    addPending("a.flac");
    addPending("b.flac");
    cancel_->store(true);

    const auto report = makeScanner().scan(tree_, cancel_);

    EXPECT_TRUE(report.cancelled);
    EXPECT_EQ(report.total(), 0u);
    EXPECT_TRUE(TrackedFileQueries::allPaths().empty());
}

TEST_F(ScannerTest, ProgressCallbackSeesEveryFile) {
    for (int i = 0; i < 6; ++i) addPending("f" + std::to_string(i) + ".flac");

    std::mutex mtx;
    std::vector<FileOutcome> seen;
    auto scanner = makeScanner();
    scanner.setProgressCallback([&](const FileOutcome& o) {
        std::scoped_lock lock(mtx);
        seen.push_back(o);
    });

    scanner.scan(tree_, cancel_);

    ASSERT_EQ(seen.size(), 6u);
    for (const auto& o : seen) EXPECT_EQ(o.status, FileOutcome::Status::Inserted);
}

TEST_F(ScannerTest, ConcurrencyIsBounded) {
    for (int i = 0; i < 12; ++i) addPending("f" + std::to_string(i) + ".flac");
    classifier_.delay = std::chrono::milliseconds(20);

    const auto report = makeScanner(2).scan(tree_, cancel_);

    EXPECT_EQ(report.inserted, 12u);
    EXPECT_LE(classifier_.peak.load(), 2);
}

TEST_F(ScannerTest, SymlinkedDuplicatesCollapseToOneRow) {
    const auto real = addPending("albums/a.flac");
    fs::create_symlink(real, tree_ / "alias.flac");

    const auto report = makeScanner().scan(tree_, cancel_);

    EXPECT_EQ(report.errored, 0u);
    EXPECT_EQ(report.inserted + report.unchanged, 2u);
    EXPECT_EQ(TrackedFileQueries::allPaths(), std::vector<fs::path>{real});
}

TEST_F(ScannerTest, VanishedDirectoryDoesNotStopTheWalk) {
    addPending("a/1.flac");
    addPending("a/2.flac");
    addPending("b/x.flac");
    const auto c = addPending("c/y.flac");

    // Directories are walked in name order; with one worker, a/2.flac is only reached
    // after a/1.flac was classified, by which time b/ is gone.
    classifier_.onClassify = [this](const fs::path&) { fs::remove_all(tree_ / "b"); };

    const auto report = makeScanner(1).scan(tree_, cancel_);

    EXPECT_EQ(report.inserted, 3u);
    EXPECT_EQ(report.errored, 1u);
    ASSERT_EQ(report.errors.size(), 1u);
    EXPECT_EQ(report.errors.front().path, tree_ / "b");
    EXPECT_FALSE(report.cancelled);
    EXPECT_TRUE(TrackedFileQueries::exists(c));
}

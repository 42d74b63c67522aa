#include "concurrency/Dispatcher.hpp"
#include "concurrency/FileTask.hpp"
#include "concurrency/ThreadPool.hpp"
#include "concurrency/WorkerSlots.hpp"
#include "logging/LogRegistry.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

using namespace re::concurrency;
using namespace re::types;
using namespace std::chrono_literals;

namespace {

struct CountingTask final : PromisedTask {
    std::atomic<int>& counter;
    explicit CountingTask(std::atomic<int>& c) : counter(c) {}

    void operator()() override {
        ++counter;
        promise.set_value(FileOutcome{"counted", FileOutcome::Status::Kept});
    }
};

struct SleepyFileTask final : FileTask {
    std::atomic<int>& inFlight;
    std::atomic<int>& peak;
    bool fail;

    SleepyFileTask(std::filesystem::path f, WorkerSlots::Lease l, std::atomic<int>& in, std::atomic<int>& pk, bool shouldFail)
        : FileTask(std::move(f), std::move(l)), inFlight(in), peak(pk), fail(shouldFail) {}

protected:
    FileOutcome process() override {
        const int now = ++inFlight;
        int prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
        std::this_thread::sleep_for(10ms);
        --inFlight;
        if (fail) throw std::runtime_error("boom");
        return {file, FileOutcome::Status::Kept};
    }

    [[nodiscard]] std::string name() const override { return "SleepyFileTask"; }
    [[nodiscard]] std::shared_ptr<spdlog::logger> logger() const override { return re::logging::LogRegistry::reencoder(); }
};

}

TEST(ThreadPoolTest, RunsEverySubmittedTask) {
    std::atomic<int> counter{0};
    std::vector<std::future<ExpectedFuture>> futures;
    {
        ThreadPool pool(std::make_shared<std::atomic<bool>>(false), 3);
        EXPECT_EQ(pool.workerCount(), 3u);
        for (int i = 0; i < 20; ++i) {
            auto task = std::make_shared<CountingTask>(counter);
            futures.push_back(task->getFuture().value());
            pool.submit(task);
        }
        for (auto& f : futures) f.get();
    }
    EXPECT_EQ(counter.load(), 20);
}

TEST(ThreadPoolTest, SubmitAfterStopThrows) {
    std::atomic<int> counter{0};
    ThreadPool pool(nullptr, 1);
    pool.stop();
    EXPECT_THROW(pool.submit(std::make_shared<CountingTask>(counter)), std::runtime_error);
}

TEST(WorkerSlotsTest, LeasesAreCountedAndReturned) {
    WorkerSlots slots(2);
    const auto flag = std::make_shared<std::atomic<bool>>(false);

    auto a = slots.acquire(flag);
    auto b = slots.acquire(flag);
    ASSERT_TRUE(a && b);
    EXPECT_EQ(slots.inUse(), 2u);

    WorkerSlots::Lease moved = std::move(*a);
    EXPECT_FALSE(a->held());
    EXPECT_TRUE(moved.held());
    EXPECT_EQ(slots.inUse(), 2u);

    moved.release();
    moved.release();
    EXPECT_EQ(slots.inUse(), 1u);

    b.reset();
    EXPECT_EQ(slots.inUse(), 0u);
    EXPECT_EQ(slots.peak(), 2u);
}

TEST(WorkerSlotsTest, ZeroCapacityMeansOne) {
    const WorkerSlots slots(0);
    EXPECT_EQ(slots.capacity(), 1u);
}

TEST(WorkerSlotsTest, BlockedAcquireNoticesInterruptWithoutNotify) {
    WorkerSlots slots(1);
    const auto flag = std::make_shared<std::atomic<bool>>(false);
    auto held = slots.acquire(flag);
    ASSERT_TRUE(held);

    std::thread setter([flag] {
        std::this_thread::sleep_for(100ms);
        flag->store(true);
    });

    const auto start = std::chrono::steady_clock::now();
    const auto second = slots.acquire(flag);
    const auto waited = std::chrono::steady_clock::now() - start;
    setter.join();

    EXPECT_FALSE(second.has_value());
    EXPECT_GE(waited, 90ms);
    EXPECT_LT(waited, 2s);
}

TEST(WorkerSlotsTest, BlockedAcquireProceedsWhenSlotFrees) {
    WorkerSlots slots(1);
    const auto flag = std::make_shared<std::atomic<bool>>(false);
    auto held = slots.acquire(flag);

    std::thread releaser([&held] {
        std::this_thread::sleep_for(30ms);
        held->release();
    });

    const auto next = slots.acquire(flag);
    releaser.join();
    EXPECT_TRUE(next.has_value());
    EXPECT_EQ(slots.inUse(), 1u);
}

TEST(DispatcherTest, BoundsInFlightTasksAndCollectsFailures) {
    std::atomic<int> inFlight{0}, peak{0};
    Dispatcher dispatcher(std::make_shared<std::atomic<bool>>(false), 3);

    for (int i = 0; i < 12; ++i) {
        auto lease = dispatcher.reserve();
        ASSERT_TRUE(lease);
        dispatcher.push(std::make_shared<SleepyFileTask>("f" + std::to_string(i), std::move(*lease), inFlight, peak, i == 5));
    }

    const auto outcomes = dispatcher.processFutures();
    ASSERT_EQ(outcomes.size(), 12u);
    EXPECT_LE(peak.load(), 3);
    EXPECT_LE(dispatcher.peakInFlight(), 3u);

    EXPECT_TRUE(outcomes[5].failed());
    EXPECT_EQ(outcomes[5].error, "boom");
    EXPECT_EQ(outcomes[5].path, "f5");
    for (size_t i = 0; i < outcomes.size(); ++i)
        if (i != 5) EXPECT_EQ(outcomes[i].status, FileOutcome::Status::Kept);
}

TEST(DispatcherTest, InterruptedDispatcherRefusesSlots) {
    const auto flag = std::make_shared<std::atomic<bool>>(true);
    Dispatcher dispatcher(flag, 2);
    EXPECT_TRUE(dispatcher.isInterrupted());
    EXPECT_FALSE(dispatcher.reserve().has_value());
    EXPECT_TRUE(dispatcher.processFutures().empty());
}

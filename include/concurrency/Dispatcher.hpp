#pragma once

#include "concurrency/ThreadPool.hpp"
#include "concurrency/WorkerSlots.hpp"

#include <atomic>
#include <future>
#include <memory>
#include <optional>
#include <vector>

namespace re::concurrency {

// Feeds per-file tasks to a ThreadPool with at most `width` in flight. Callers reserve()
// a slot before building each task, push() it, and collect outcomes with processFutures().
class Dispatcher {
public:
    Dispatcher(const std::shared_ptr<std::atomic<bool>>& interruptFlag, unsigned int width);
    ~Dispatcher();

    // Blocks for a free slot. Returns nullopt once the interrupt flag is set.
    std::optional<WorkerSlots::Lease> reserve();

    void push(const std::shared_ptr<Task>& task);

    // Waits for every pushed task and returns their outcomes in push order.
    std::vector<ExpectedFuture> processFutures();

    [[nodiscard]] bool isInterrupted() const { return pool_.isInterrupted(); }
    [[nodiscard]] unsigned int peakInFlight() const { return slots_.peak(); }

private:
    WorkerSlots slots_;
    ThreadPool pool_;
    std::vector<std::future<ExpectedFuture>> futures_;
};

}

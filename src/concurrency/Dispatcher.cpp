#include "concurrency/Dispatcher.hpp"

#include <algorithm>

using namespace re::concurrency;

Dispatcher::Dispatcher(const std::shared_ptr<std::atomic<bool>>& interruptFlag, const unsigned int width)
    : slots_(std::max(1u, width)), pool_(interruptFlag, std::max(1u, width)) {}

Dispatcher::~Dispatcher() {
    // Never leave a worker running against a promise nobody waits on.
    for (auto& f : futures_)
        if (f.valid()) f.wait();
    pool_.stop();
}

std::optional<WorkerSlots::Lease> Dispatcher::reserve() {
    return slots_.acquire(pool_.interruptFlag());
}

void Dispatcher::push(const std::shared_ptr<Task>& task) {
    auto future = task->getFuture().value();
    pool_.submit(task);
    futures_.push_back(std::move(future));
}

std::vector<ExpectedFuture> Dispatcher::processFutures() {
    std::vector<ExpectedFuture> out;
    out.reserve(futures_.size());
    for (auto& f : futures_) out.push_back(f.get());
    futures_.clear();
    return out;
}

#include "concurrency/WorkerSlots.hpp"

#include <algorithm>

namespace re::concurrency {

WorkerSlots::Lease& WorkerSlots::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        release();
        slots_ = other.slots_;
        other.slots_ = nullptr;
    }
    return *this;
}

void WorkerSlots::Lease::release() {
    if (!slots_) return;
    slots_->release();
    slots_ = nullptr;
}

WorkerSlots::WorkerSlots(const unsigned int capacity) : capacity_(std::max(1u, capacity)) {}

std::optional<WorkerSlots::Lease> WorkerSlots::acquire(const std::shared_ptr<std::atomic<bool>>& interrupt) {
    std::unique_lock lock(mtx_);
    while (true) {
        if (interrupt && interrupt->load()) return std::nullopt;
        if (inUse_ < capacity_) break;
        cv_.wait_for(lock, RECHECK_INTERVAL);
    }

    ++inUse_;
    peak_ = std::max(peak_, inUse_);
    return Lease(this);
}

unsigned int WorkerSlots::inUse() const {
    std::scoped_lock lock(mtx_);
    return inUse_;
}

unsigned int WorkerSlots::peak() const {
    std::scoped_lock lock(mtx_);
    return peak_;
}

void WorkerSlots::release() {
    {
        std::scoped_lock lock(mtx_);
        if (inUse_ > 0) --inUse_;
    }
    cv_.notify_all();
}

}

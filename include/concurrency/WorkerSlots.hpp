#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

namespace re::concurrency {

// Counting gate that bounds how many tasks are in flight. A Lease is held from
// dispatch until the task finishes its file.
class WorkerSlots {
public:
    class Lease {
    public:
        Lease() = default;
        Lease(Lease&& other) noexcept : slots_(other.slots_) { other.slots_ = nullptr; }
        Lease& operator=(Lease&& other) noexcept;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        ~Lease() { release(); }

        void release();
        [[nodiscard]] bool held() const { return slots_ != nullptr; }

    private:
        friend class WorkerSlots;
        explicit Lease(WorkerSlots* slots) : slots_(slots) {}

        WorkerSlots* slots_{nullptr};
    };

    // Re-check interval so a flag flipped from a signal handler is seen without a notify.
    static constexpr std::chrono::milliseconds RECHECK_INTERVAL{50};

    explicit WorkerSlots(unsigned int capacity);

    // Blocks until a slot is free. Returns nullopt once interrupt is set.
    std::optional<Lease> acquire(const std::shared_ptr<std::atomic<bool>>& interrupt);

    [[nodiscard]] unsigned int capacity() const { return capacity_; }
    [[nodiscard]] unsigned int inUse() const;
    [[nodiscard]] unsigned int peak() const;

private:
    void release();

    const unsigned int capacity_;
    unsigned int inUse_{0};
    unsigned int peak_{0};
    mutable std::mutex mtx_;
    std::condition_variable cv_;
};

}

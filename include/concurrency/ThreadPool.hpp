#pragma once

#include "Task.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace re::concurrency {

class ThreadPool {
public:
    explicit ThreadPool(const std::shared_ptr<std::atomic<bool>>& interruptFlag,
               unsigned int nThreads = 0);

    ~ThreadPool();

    // Drops queued tasks and joins every worker. Running tasks finish first.
    void stop();

    void submit(std::shared_ptr<Task> task);

    [[nodiscard]] unsigned int workerCount() const;

    [[nodiscard]] const std::shared_ptr<std::atomic<bool>>& interruptFlag() const { return interruptFlag_; }
    [[nodiscard]] bool isInterrupted() const { return interruptFlag_ && interruptFlag_->load(); }

private:
    void spawnWorker();

    std::vector<std::thread> threads_;

    std::condition_variable cv;
    mutable std::mutex mutex;
    std::queue<std::shared_ptr<Task>> queue;

    std::shared_ptr<std::atomic<bool>> interruptFlag_;
    std::atomic<bool> stopFlag{false};
};

}

// ============================================================================
// worker_pool.cpp — implementation for worker_pool.hpp
// ============================================================================

#include "bravejig/worker_pool.hpp"
#include "bravejig/logger.hpp"

#include <exception>
#include <string>

namespace bravejig {

WorkerPool::WorkerPool(std::size_t threads, Logger& log)
    : n_threads_(threads == 0 ? 1 : threads), log_(log) {}

WorkerPool::~WorkerPool() { shutdown(); }

void WorkerPool::start() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (running_) return;
    stop_ = false;
    running_ = true;
    workers_.reserve(n_threads_);
    for (std::size_t i = 0; i < n_threads_; ++i)
        workers_.emplace_back(&WorkerPool::run, this);
}

bool WorkerPool::submit(std::function<void()> fn) {
    uint64_t dropped = 0;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!running_ || stop_) return false;
        if (queue_.full()) {
            dropped = ++dropped_;
        } else {
            queue_.push_back(std::move(fn));
        }
    }
    if (dropped) {
        log_.error("pool", "task_dropped",
                   "cap=" + std::to_string(TASK_QUEUE_CAP) + " dropped=" + std::to_string(dropped));
        return false;
    }
    cv_.notify_one();
    return true;
}

bool WorkerPool::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mutex_);
    return idle_cv_.wait_for(lk, timeout, [this] { return queue_.empty() && active_ == 0; });
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!running_) return;
        stop_ = true;
    }
    cv_.notify_all();
    for (auto& t : workers_)
        if (t.joinable()) t.join();
    workers_.clear();

    std::lock_guard<std::mutex> lk(mutex_);
    running_ = false;
}

uint64_t WorkerPool::executed() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return executed_;
}

uint64_t WorkerPool::dropped() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return dropped_;
}

// ---------------------------------------------------------------------------
// run()
// -----
// Pop under the lock, execute outside it. Workers drain whatever is queued
// before honoring stop_, so shutdown() never drops a delivered buffer.
// ---------------------------------------------------------------------------
void WorkerPool::run() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lk(mutex_);
            cv_.wait(lk, [this] { return stop_ || !queue_.empty(); });
            if (stop_ && queue_.empty()) break;
            task = std::move(queue_.front());
            queue_.pop_front();
            ++active_;
        }

        try {
            task();
        } catch (const std::exception& e) {
            log_.error("pool", "callback_threw", std::string("what=\"") + e.what() + "\"");
        }

        {
            std::lock_guard<std::mutex> lk(mutex_);
            --active_;
            ++executed_;
            if (queue_.empty() && active_ == 0) idle_cv_.notify_all();
        }
    }
}

} // namespace bravejig

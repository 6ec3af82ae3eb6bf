#pragma once
/**
 * @file worker_pool.hpp
 * @brief Small fixed-size thread pool that runs Transport callbacks.
 *
 * The serial reader hands every received buffer to this pool so a slow data,
 * error or connection callback never stalls reading. Tasks run in FIFO pop
 * order, but with more than one worker their completion order is not
 * guaranteed. A task that throws is logged and dropped; the worker survives.
 *
 * The queue is bounded (ETL fixed-capacity deque). When the workers fall that
 * far behind, submit() refuses the task, logs it and counts it in dropped().
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "etl/deque.h"

namespace bravejig {

class Logger;

class WorkerPool {
public:
    static constexpr std::size_t TASK_QUEUE_CAP = 256;

    WorkerPool(std::size_t threads, Logger& log);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Spawn the workers. Idempotent.
    void start();

    /// Queue a task. false once shutdown() has begun, or when the queue is full.
    bool submit(std::function<void()> fn);

    /// Block until the queue is empty and no task is running, or timeout.
    bool wait_idle(std::chrono::milliseconds timeout);

    /// Finish queued tasks, then join all workers.
    void shutdown();

    std::size_t threads() const { return n_threads_; }
    uint64_t executed() const;
    uint64_t dropped() const;

private:
    void run();

    const std::size_t n_threads_;
    Logger& log_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    etl::deque<std::function<void()>, TASK_QUEUE_CAP> queue_;
    std::vector<std::thread> workers_;
    std::size_t active_{0};
    uint64_t executed_{0};
    uint64_t dropped_{0};
    bool running_{false};
    bool stop_{false};
};

} // namespace bravejig

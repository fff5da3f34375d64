/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file scheduler.hpp
 * @brief Fixed-size worker pool used for concurrent batch generation.
 *
 * @details
 * The `Scheduler` fans token generation out across worker threads that share a
 * single `TokenGenerator`. Besides fire-and-forget submission it offers a
 * barrier (`wait_idle`) so a batch can be collected once every task finished,
 * and it carries the first exception raised by a task back to that barrier.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace kestrel::infra {

/**
 * @class Scheduler
 * @brief A thread-safe worker pool for executing tasks asynchronously.
 *
 * **Concurrency Model:**
 * - **Producers:** Any thread can `enqueue()` a task.
 * - **Consumers:** Worker threads sleep on a condition variable until work is available.
 * - **Barrier:** `wait_idle()` blocks until the queue is drained and no task is running.
 */
class Scheduler {
  public:
    /**
     * @brief Spawns the worker threads.
     *
     * @param threads Number of workers. Zero is treated as one.
     */
    explicit Scheduler(size_t threads = std::thread::hardware_concurrency());

    /**
     * @brief Drains the queue, then joins every worker.
     *
     * @note Blocking. Pending tasks still run before the pool is torn down.
     */
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Submits a task for asynchronous execution.
     *
     * @code
     * scheduler.enqueue([&generator, &slot] { slot = generator.generate(); });
     * @endcode
     */
    void enqueue(std::function<void()> task);

    /**
     * @brief Blocks until every submitted task has completed.
     *
     * If any task threw since the previous barrier, the first captured
     * exception is rethrown here (later ones are discarded with it).
     */
    void wait_idle();

    /// @brief Number of worker threads in the pool.
    size_t size() const { return workers_.size(); }

  private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    /// @brief Guards `tasks_`, `active_` and `failure_`.
    std::mutex queue_mutex_;

    /// @brief Wakes workers on new work or shutdown.
    std::condition_variable condition_;

    /// @brief Wakes `wait_idle()` callers when the pool drains.
    std::condition_variable idle_;

    /// @brief Tasks currently executing on a worker.
    size_t active_ = 0;

    /// @brief First exception escaping a task since the last barrier.
    std::exception_ptr failure_;

    std::atomic<bool> stop_;
};

} // namespace kestrel::infra

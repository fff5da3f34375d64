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
 * @file scheduler.cpp
 * @brief Implementation of the worker pool.
 */

#include "kestrel/infra/scheduler.hpp"

namespace kestrel::infra {

Scheduler::Scheduler(size_t threads) : stop_(false)
{
    if (threads == 0) {
        threads = 1;
    }
    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

Scheduler::~Scheduler()
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }

    condition_.notify_all();

    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

/**
 * @brief Worker event loop.
 *
 * Tasks run outside the lock. An exception escaping a task is captured
 * (first one wins) instead of unwinding the worker thread, and is surfaced
 * to the next `wait_idle()` caller.
 */
void Scheduler::worker_loop()
{
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

            // Exit only once stopping AND drained.
            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
            ++active_;
        }

        std::exception_ptr error;
        try {
            if (task) {
                task();
            }
        } catch (...) {
            error = std::current_exception();
        }

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (error && !failure_) {
                failure_ = error;
            }
            --active_;
            if (active_ == 0 && tasks_.empty()) {
                idle_.notify_all();
            }
        }
    }
}

void Scheduler::enqueue(std::function<void()> task)
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        tasks_.emplace(std::move(task));
    }
    condition_.notify_one();
}

void Scheduler::wait_idle()
{
    std::exception_ptr error;
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        idle_.wait(lock, [this] { return active_ == 0 && tasks_.empty(); });
        std::swap(error, failure_);
    }
    if (error) {
        std::rethrow_exception(error);
    }
}

} // namespace kestrel::infra

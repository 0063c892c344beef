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

#include "uuidmesh/infra/scheduler.hpp"

#include <algorithm>

namespace uuidmesh::infra {

Scheduler::Scheduler(size_t max_threads)
    : max_threads_(max_threads == 0 ? kDefaultMaxWorkers : std::max(max_threads, kMinWorkers)),
      stop_(false)
{
    std::unique_lock<std::mutex> lock(queue_mutex_);
    workers_.reserve(max_threads_);
    for (size_t i = 0; i < kMinWorkers; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

/**
 * @brief Orchestrates a graceful pool teardown.
 *
 * The stop flag is raised under the queue lock so no worker can miss the
 * wake-up between evaluating its predicate and going back to sleep.
 */
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
 * @brief Queues the task, growing the pool when no idle worker can take it.
 *
 * `workers_` only changes under `queue_mutex_` while the pool is running, so
 * the destructor (which raises `stop_` first) joins a stable set of threads.
 */
bool Scheduler::enqueue(std::function<void()> task)
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_) {
            return false;
        }
        tasks_.emplace(std::move(task));
        if (tasks_.size() > idle_ && workers_.size() < max_threads_) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    }
    condition_.notify_one();
    return true;
}

size_t Scheduler::size() const
{
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return workers_.size();
}

/**
 * @brief Worker event loop.
 *
 * Exits only once the pool is stopping AND the queue is empty, so sessions
 * accepted just before shutdown still get answered.
 */
void Scheduler::worker_loop()
{
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            ++idle_;
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
            --idle_;

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        // Runs outside the lock so other workers can pick up new sessions.
        if (task) {
            task();
        }
    }
}

} // namespace uuidmesh::infra

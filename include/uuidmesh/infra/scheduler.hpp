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
 * @brief Elastic worker pool that runs HTTP connection sessions.
 *
 * @details
 * This header defines the `Scheduler` class, a Producer-Consumer thread pool.
 * The accept loop of `http::Server` is the producer; each task is one client
 * connection. A session that sleeps (such as the delayed UUID endpoint) pins
 * exactly one worker for its duration. The pool starts with `kMinWorkers`
 * threads and spawns another whenever a task arrives while every worker is
 * busy, up to the configured ceiling, so blocked sessions do not delay new
 * connections.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace uuidmesh::infra {

/**
 * @class Scheduler
 * @brief A thread-safe worker pool for executing tasks asynchronously.
 *
 * **Concurrency Model:**
 * - **Producers:** Any thread can `enqueue()` a task.
 * - **Consumers:** Worker threads sleep on a condition variable until work is available.
 * - **Growth:** `enqueue()` adds a worker when queued tasks outnumber idle
 *   workers. Workers are never retired before the pool is destroyed.
 */
class Scheduler {
  public:
    /// @brief Workers spawned up front; also the lowest accepted ceiling.
    static constexpr size_t kMinWorkers = 4;

    /// @brief Ceiling used when the caller passes 0.
    static constexpr size_t kDefaultMaxWorkers = 200;

    /**
     * @brief Spawns the initial worker threads.
     *
     * @param max_threads Upper bound on the worker count. 0 selects
     * `kDefaultMaxWorkers`; other values below `kMinWorkers` are raised to it.
     */
    explicit Scheduler(size_t max_threads = kDefaultMaxWorkers);

    /**
     * @brief Drains the queue and joins every worker.
     *
     * @note Blocking. Tasks already queued still run to completion.
     */
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Submits a task for asynchronous execution.
     *
     * @param task The unit of work.
     * @return false If the pool is shutting down and the task was rejected.
     */
    bool enqueue(std::function<void()> task);

    /// @brief Number of worker threads spawned so far.
    size_t size() const;

    /// @brief Upper bound on `size()`.
    size_t capacity() const { return max_threads_; }

  private:
    void worker_loop();

    size_t max_threads_;
    size_t idle_ = 0;

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stop_;
};

} // namespace uuidmesh::infra

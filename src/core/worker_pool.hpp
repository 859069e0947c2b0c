/*
 * Copyright 2026 Harbor Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */


// Harbor Worker Pool - Header
// Fixed worker threads with a bounded queue for background tasks

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "cancellation.hpp"

namespace harbor::core {

/// Task receives the pool's token, cancelled on stop()
using BackgroundTask = std::function<void(const CancellationToken&)>;

/// Bounded background executor. At most `workers` tasks run at once and at
/// most `max_queued` wait; try_submit() refuses beyond that rather than block.
class WorkerPool {
public:
    WorkerPool(size_t workers, size_t max_queued);
    ~WorkerPool();

    // Non-copyable, non-movable (owns threads)
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void start();

    /// Cancel running tasks, drop queued ones and join the workers
    void stop();

    /// Queue a task; false if the pool is stopped or full
    [[nodiscard]] bool try_submit(BackgroundTask task);

    [[nodiscard]] size_t queued() const;
    [[nodiscard]] size_t active() const noexcept { return active_.load(std::memory_order_relaxed); }
    [[nodiscard]] bool running() const noexcept { return running_.load(std::memory_order_acquire); }

private:
    void worker_loop();

    const size_t worker_count_;
    const size_t max_queued_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<BackgroundTask> queue_;
    std::vector<std::thread> workers_;

    CancellationToken cancel_ = CancellationToken::create();
    std::atomic<bool> running_{false};
    std::atomic<size_t> active_{0};
};

}  // namespace harbor::core

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


// Harbor Worker Pool - Implementation

#include "worker_pool.hpp"

#include <algorithm>
#include <exception>

#include "logging.hpp"

namespace harbor::core {

WorkerPool::WorkerPool(size_t workers, size_t max_queued)
    : worker_count_(workers == 0 ? 1 : workers), max_queued_(max_queued) {}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::start() {
    if (running_.exchange(true)) {
        return;  // Already running
    }
    workers_.reserve(worker_count_);
    for (size_t i = 0; i < worker_count_; ++i) {
        workers_.emplace_back(&WorkerPool::worker_loop, this);
    }
}

void WorkerPool::stop() {
    {
        std::lock_guard lock(mutex_);
        if (!running_.exchange(false)) {
            return;  // Not running
        }
        queue_.clear();
    }
    cancel_.cancel();
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

bool WorkerPool::try_submit(BackgroundTask task) {
    {
        std::lock_guard lock(mutex_);
        if (!running_.load(std::memory_order_relaxed)) {
            return false;
        }
        // Idle workers take queued tasks immediately, so count them as capacity
        size_t idle = worker_count_ - std::min(worker_count_, active_.load());
        if (queue_.size() >= max_queued_ + idle) {
            return false;
        }
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

size_t WorkerPool::queued() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

void WorkerPool::worker_loop() {
    while (true) {
        BackgroundTask task;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this] { return !running_.load() || !queue_.empty(); });
            if (!running_.load()) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
            active_.fetch_add(1, std::memory_order_relaxed);
        }

        try {
            task(cancel_);
        } catch (const std::exception& e) {
            if (auto* logger = logging::get_current_logger()) {
                LOG_ERROR(logger, "[WORKER] Background task failed: {}", e.what());
            }
        }
        active_.fetch_sub(1, std::memory_order_relaxed);
    }
}

}  // namespace harbor::core

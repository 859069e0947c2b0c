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

// Harbor Admin Server - Header
// Lightweight HTTP server for internal admin endpoints (status, health, metrics, purge)
// Runs on a separate loopback port, NOT exposed to clients

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "../control/config.hpp"
#include "../control/metrics.hpp"
#include "../http/http.hpp"

namespace harbor::gateway {
class CacheStore;
class UpstreamPool;
}  // namespace harbor::gateway

namespace harbor::core {

/// Serves GET /status, /health, /metrics and POST /cache/purge
/// Uses simple blocking I/O (not performance-critical)
class AdminServer {
public:
    AdminServer(control::AdminConfig config,
                 std::vector<std::shared_ptr<gateway::UpstreamPool>> pools,
                 const control::ProxyMetrics& metrics,
                 std::shared_ptr<gateway::CacheStore> cache = nullptr);
    ~AdminServer();

    // Non-copyable, non-movable
    AdminServer(const AdminServer&) = delete;
    AdminServer& operator=(const AdminServer&) = delete;

    /// Bind and listen on the admin port
    [[nodiscard]] std::error_code start();

    /// Stop admin server (run() returns within one poll slice)
    void stop();

    /// Run accept loop (blocking, call in separate thread)
    void run();

    /// Route one admin request
    [[nodiscard]] http::Response handle(const http::Request& request) const;

    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] uint16_t port() const noexcept { return bound_port_; }

private:
    /// Handle single client connection (blocking)
    void handle_connection(int client_fd);

    [[nodiscard]] http::Response purge(const http::Request& request) const;

    control::AdminConfig config_;
    std::vector<std::shared_ptr<gateway::UpstreamPool>> pools_;
    const control::ProxyMetrics& metrics_;
    std::shared_ptr<gateway::CacheStore> cache_;
    std::chrono::steady_clock::time_point started_ = std::chrono::steady_clock::now();

    int listen_fd_ = -1;
    uint16_t bound_port_ = 0;
    std::atomic<bool> running_{false};
};

}  // namespace harbor::core

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

// Harbor Listener - Header
// Accepts client connections and runs one blocking handler thread per connection

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

#include "../control/metrics.hpp"
#include "../http/http.hpp"
#include "cancellation.hpp"
#include "containers.hpp"

namespace harbor::core {

struct ListenerOptions {
    std::string address = "0.0.0.0";
    uint16_t port = 8080;  // 0 picks an ephemeral port
    int backlog = 511;

    uint32_t max_connections = 1024;
    size_t max_request_size = 1048576;  // Body bytes
    size_t max_header_size = 8192;

    std::chrono::milliseconds client_read_timeout{60000};  // While a request is arriving
    std::chrono::milliseconds keepalive_timeout{75000};    // Idle between requests
    std::chrono::milliseconds shutdown_timeout{30000};     // Grace period for in-flight handlers
    uint32_t max_keepalive_requests = 1000;
};

/// Produces the response for one request; nullopt means the client went away
using RequestHandler = std::function<std::optional<http::Response>(
    const http::Request& request, const CancellationToken& cancel,
    std::string_view correlation_id)>;

class Listener {
public:
    Listener(ListenerOptions options, RequestHandler handler, control::ProxyMetrics& metrics);
    ~Listener();

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    /// Bind, listen and spawn the accept thread
    [[nodiscard]] std::error_code start();

    /// Stop accepting, close idle keep-alive clients and wait for in-flight requests.
    /// Requests still running after shutdown_timeout are cancelled.
    void stop();

    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    /// Bound port (useful when options.port was 0)
    [[nodiscard]] uint16_t port() const noexcept { return bound_port_; }

    [[nodiscard]] size_t active_connections() const noexcept {
        return active_.load(std::memory_order_relaxed);
    }

private:
    void accept_loop();
    void serve(int fd, std::string client_ip, uint16_t client_port);
    void reject(int fd);
    void reap_finished();

    /// Send a listener-generated error and account for it
    void send_error(int fd, http::StatusCode status);

    ListenerOptions options_;
    RequestHandler handler_;
    control::ProxyMetrics& metrics_;

    int listen_fd_ = -1;
    uint16_t bound_port_ = 0;
    std::thread accept_thread_;

    std::atomic<bool> running_{false};
    std::atomic<bool> draining_{false};     // No new requests on existing connections
    std::atomic<bool> force_cancel_{false};  // Grace period over
    std::atomic<size_t> active_{0};

    CancellationToken idle_cancel_ = CancellationToken::create();  // Wakes idle keep-alive reads

    std::mutex threads_mutex_;
    std::condition_variable threads_cv_;
    fast_map<std::thread::id, std::thread> threads_;
    std::vector<std::thread::id> finished_;
};

}  // namespace harbor::core

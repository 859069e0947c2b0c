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


// Harbor Gateway - Backend Connection Pool
// Shared keep-alive pool plus the ConnectionManager that opens upstream connections

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "../core/cancellation.hpp"
#include "../core/containers.hpp"
#include "upstream.hpp"

namespace harbor::gateway {

/// Pooled backend connection with metadata
struct PooledConnection {
    int fd = -1;
    std::string address;  // host:port of the upstream
    std::chrono::steady_clock::time_point last_used;
    size_t request_count = 0;  // Requests served on this connection so far

    /// Check if connection has been idle too long
    [[nodiscard]] bool is_stale(std::chrono::seconds max_idle,
                                std::chrono::steady_clock::time_point now) const noexcept {
        return (now - last_used) > max_idle;
    }

    /// Check if connection has served too many requests (needs recycling)
    [[nodiscard]] bool needs_recycling(size_t max_requests) const noexcept {
        return max_requests > 0 && request_count >= max_requests;
    }

    /// Peek at the socket: false if the upstream has closed it
    [[nodiscard]] bool is_healthy() const noexcept;
};

/// Keep-alive options for one pool of upstream connections
struct KeepaliveOptions {
    size_t max_idle_per_server = 32;          // 0 disables keep-alive
    std::chrono::seconds idle_timeout{60};
    size_t max_requests_per_conn = 1000;      // 0 = unlimited
};

/// Idle upstream connections keyed by server address (LIFO per server).
/// Shared by all request threads; the mutex only covers vector operations,
/// never socket I/O other than the non-blocking health peek.
class BackendConnectionPool {
public:
    explicit BackendConnectionPool(KeepaliveOptions options = {});

    BackendConnectionPool(const BackendConnectionPool&) = delete;
    BackendConnectionPool& operator=(const BackendConnectionPool&) = delete;

    ~BackendConnectionPool();

    /// Most recently used healthy connection for this server, if any
    [[nodiscard]] std::optional<PooledConnection> acquire(const std::string& address);

    /// Return a connection after a successful exchange. Closes it instead if
    /// keep-alive is off, the per-server pool is full, it has served its
    /// request quota, or the peer has closed it.
    void release(PooledConnection conn);

    /// Close connections idle longer than idle_timeout; returns how many
    size_t cleanup_stale(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    /// Close everything
    void clear();

    [[nodiscard]] const KeepaliveOptions& options() const noexcept { return options_; }

    // Statistics
    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t hits() const;
    [[nodiscard]] size_t misses() const;
    [[nodiscard]] double hit_rate() const;

    /// Log pool statistics (call periodically for monitoring)
    void log_stats() const;

private:
    KeepaliveOptions options_;

    mutable std::mutex mutex_;
    core::fast_map<std::string, std::vector<PooledConnection>> idle_;  // back = most recent

    size_t hits_ = 0;              // Pool hit (reused connection)
    size_t misses_ = 0;            // Pool miss (new connection needed)
    size_t health_fails_ = 0;      // Dead connections found in the pool
    size_t pool_full_closes_ = 0;  // Closes due to pool being full
    size_t evictions_ = 0;         // Recycled after max_requests_per_conn
    size_t stale_closes_ = 0;      // Closed by cleanup_stale
};

/// One upstream connection for the duration of an attempt. Closes the socket
/// on destruction unless it was handed back with release().
class UpstreamConnection {
public:
    UpstreamConnection() = default;
    UpstreamConnection(BackendConnectionPool* pool, PooledConnection conn, bool reused) noexcept
        : pool_(pool), conn_(std::move(conn)), reused_(reused) {}

    ~UpstreamConnection();

    UpstreamConnection(UpstreamConnection&& other) noexcept;
    UpstreamConnection& operator=(UpstreamConnection&& other) noexcept;
    UpstreamConnection(const UpstreamConnection&) = delete;
    UpstreamConnection& operator=(const UpstreamConnection&) = delete;

    [[nodiscard]] int fd() const noexcept { return conn_.fd; }
    [[nodiscard]] bool valid() const noexcept { return conn_.fd >= 0; }
    [[nodiscard]] bool reused() const noexcept { return reused_; }

    /// Hand the connection back to the keep-alive pool
    void release();

    /// Close now (response not reusable or exchange failed)
    void close();

private:
    BackendConnectionPool* pool_ = nullptr;
    PooledConnection conn_;
    bool reused_ = false;
};

/// Owns the keep-alive pool and opens connections with a connect timeout.
/// Also the only writer of UpstreamServer::active_connections.
class ConnectionManager {
public:
    explicit ConnectionManager(KeepaliveOptions options = {});

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /// Counts one in-flight attempt against a server for its lifetime
    class ActiveAttempt {
    public:
        explicit ActiveAttempt(UpstreamServer& server) noexcept : server_(&server) {
            ConnectionManager::attempt_started(server);
        }
        ~ActiveAttempt() {
            if (server_) ConnectionManager::attempt_finished(*server_);
        }
        ActiveAttempt(const ActiveAttempt&) = delete;
        ActiveAttempt& operator=(const ActiveAttempt&) = delete;

    private:
        UpstreamServer* server_;
    };

    /// Reuse an idle connection when allowed, else connect within timeout.
    /// On failure the returned connection is invalid and ec is set.
    [[nodiscard]] UpstreamConnection connect(const UpstreamServer& server,
                                             std::chrono::milliseconds timeout,
                                             const core::CancellationToken& cancel,
                                             std::error_code& ec, bool allow_reuse = true);

    [[nodiscard]] BackendConnectionPool& pool() noexcept { return pool_; }

    size_t cleanup_stale() { return pool_.cleanup_stale(); }

private:
    static void attempt_started(UpstreamServer& server) noexcept { server.connection_started(); }
    static void attempt_finished(UpstreamServer& server) noexcept { server.connection_finished(); }

    BackendConnectionPool pool_;
};

}  // namespace harbor::gateway

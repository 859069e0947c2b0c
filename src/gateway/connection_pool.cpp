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


// Harbor Gateway - Backend Connection Pool Implementation

#include "connection_pool.hpp"

#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>

#include "../core/logging.hpp"
#include "../core/socket.hpp"

using harbor::core::close_fd;

namespace harbor::gateway {

bool PooledConnection::is_healthy() const noexcept {
    if (fd < 0)
        return false;

    // MSG_PEEK|MSG_DONTWAIT: 0 means FIN received (CLOSE-WAIT), EAGAIN means idle and alive.
    // Unsolicited data on an idle HTTP/1.1 connection is a protocol error, so treat it as dead.
    char buf[1];
    ssize_t result = recv(fd, buf, 1, MSG_PEEK | MSG_DONTWAIT);

    if (result > 0) {
        return false;
    } else if (result == 0) {
        return false;
    }
    return errno == EAGAIN || errno == EWOULDBLOCK;
}

BackendConnectionPool::BackendConnectionPool(KeepaliveOptions options)
    : options_(options) {}

BackendConnectionPool::~BackendConnectionPool() {
    clear();
}

std::optional<PooledConnection> BackendConnectionPool::acquire(const std::string& address) {
    std::lock_guard lock(mutex_);

    auto it = idle_.find(address);
    if (it != idle_.end()) {
        auto& conns = it->second;
        auto now = std::chrono::steady_clock::now();
        // LIFO - most recently used first
        while (!conns.empty()) {
            PooledConnection conn = std::move(conns.back());
            conns.pop_back();

            if (conn.is_stale(options_.idle_timeout, now)) {
                close_fd(conn.fd);
                ++stale_closes_;
                continue;
            }
            if (!conn.is_healthy()) {
                close_fd(conn.fd);
                ++health_fails_;
                continue;
            }
            ++hits_;
            return conn;
        }
    }

    ++misses_;
    return std::nullopt;
}

void BackendConnectionPool::release(PooledConnection conn) {
    if (conn.fd < 0)
        return;

    conn.request_count++;
    conn.last_used = std::chrono::steady_clock::now();

    if (options_.max_idle_per_server == 0) {
        close_fd(conn.fd);
        return;
    }

    if (conn.needs_recycling(options_.max_requests_per_conn)) {
        close_fd(conn.fd);
        std::lock_guard lock(mutex_);
        ++evictions_;
        return;
    }

    if (!conn.is_healthy()) {
        close_fd(conn.fd);
        std::lock_guard lock(mutex_);
        ++health_fails_;
        return;
    }

    std::lock_guard lock(mutex_);
    auto& conns = idle_[conn.address];
    if (conns.size() >= options_.max_idle_per_server) {
        close_fd(conn.fd);
        ++pool_full_closes_;
        return;
    }
    conns.push_back(std::move(conn));
}

size_t BackendConnectionPool::cleanup_stale(std::chrono::steady_clock::time_point now) {
    std::lock_guard lock(mutex_);

    size_t closed = 0;
    for (auto& [address, conns] : idle_) {
        auto first_stale = std::remove_if(conns.begin(), conns.end(),
                                          [this, now](const PooledConnection& conn) {
                                              return conn.is_stale(options_.idle_timeout, now);
                                          });
        for (auto it = first_stale; it != conns.end(); ++it) {
            close_fd(it->fd);
            ++closed;
        }
        conns.erase(first_stale, conns.end());
    }
    stale_closes_ += closed;
    return closed;
}

void BackendConnectionPool::clear() {
    std::lock_guard lock(mutex_);
    for (const auto& [address, conns] : idle_) {
        for (const auto& conn : conns) {
            if (conn.fd >= 0) {
                close_fd(conn.fd);
            }
        }
    }
    idle_.clear();
}

size_t BackendConnectionPool::size() const {
    std::lock_guard lock(mutex_);
    size_t total = 0;
    for (const auto& [address, conns] : idle_) {
        total += conns.size();
    }
    return total;
}

size_t BackendConnectionPool::hits() const {
    std::lock_guard lock(mutex_);
    return hits_;
}

size_t BackendConnectionPool::misses() const {
    std::lock_guard lock(mutex_);
    return misses_;
}

double BackendConnectionPool::hit_rate() const {
    std::lock_guard lock(mutex_);
    auto total = hits_ + misses_;
    return total > 0 ? static_cast<double>(hits_) / static_cast<double>(total) : 0.0;
}

void BackendConnectionPool::log_stats() const {
    auto* logger = logging::get_current_logger();
    if (!logger) {
        return;
    }

    size_t idle_total = size();
    std::lock_guard lock(mutex_);
    auto total_requests = hits_ + misses_;
    if (total_requests == 0) {
        LOG_INFO(logger, "[POOL] No requests processed yet");
        return;
    }

    double rate = static_cast<double>(hits_) / static_cast<double>(total_requests);
    LOG_INFO(logger,
             "[POOL] Stats: idle={}, servers={}, hits={}, misses={}, hit_rate={:.2f}%, "
             "health_fails={}, pool_full_closes={}, evictions={}, stale_closes={}",
             idle_total, idle_.size(), hits_, misses_, rate * 100.0, health_fails_,
             pool_full_closes_, evictions_, stale_closes_);
}

// UpstreamConnection

UpstreamConnection::~UpstreamConnection() {
    close();
}

UpstreamConnection::UpstreamConnection(UpstreamConnection&& other) noexcept
    : pool_(other.pool_), conn_(std::move(other.conn_)), reused_(other.reused_) {
    other.conn_.fd = -1;
}

UpstreamConnection& UpstreamConnection::operator=(UpstreamConnection&& other) noexcept {
    if (this != &other) {
        close();
        pool_ = other.pool_;
        conn_ = std::move(other.conn_);
        reused_ = other.reused_;
        other.conn_.fd = -1;
    }
    return *this;
}

void UpstreamConnection::release() {
    if (conn_.fd < 0) {
        return;
    }
    if (pool_) {
        pool_->release(std::move(conn_));
    } else {
        close_fd(conn_.fd);
    }
    conn_.fd = -1;
}

void UpstreamConnection::close() {
    if (conn_.fd >= 0) {
        close_fd(conn_.fd);
        conn_.fd = -1;
    }
}

// ConnectionManager

ConnectionManager::ConnectionManager(KeepaliveOptions options) : pool_(options) {}

UpstreamConnection ConnectionManager::connect(const UpstreamServer& server,
                                              std::chrono::milliseconds timeout,
                                              const core::CancellationToken& cancel,
                                              std::error_code& ec, bool allow_reuse) {
    ec.clear();

    if (allow_reuse && pool_.options().max_idle_per_server > 0) {
        if (auto pooled = pool_.acquire(server.address())) {
            return UpstreamConnection(&pool_, std::move(*pooled), true);
        }
    }

    int fd = core::connect_with_timeout(server.host(), server.port(), timeout, cancel, ec);
    if (fd < 0) {
        return {};
    }

    PooledConnection conn;
    conn.fd = fd;
    conn.address = server.address();
    conn.last_used = std::chrono::steady_clock::now();
    return UpstreamConnection(&pool_, std::move(conn), false);
}

}  // namespace harbor::gateway

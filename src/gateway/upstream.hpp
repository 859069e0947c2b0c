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


// Harbor Upstream - Header
// Upstream servers, their health fields, and pools of servers

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../core/containers.hpp"

namespace harbor::gateway {

using Clock = std::chrono::steady_clock;

class ConnectionManager;
class HealthChecker;
class LoadBalancer;
class UpstreamPool;

/// Server role within a pool
enum class ServerRole : uint8_t {
    Primary,
    Backup  // Only selected when no primary is eligible
};

/// Health classification driving eligibility
enum class ServerState : uint8_t { Healthy, Unhealthy };

/// Load balancing policy, chosen once per pool
enum class BalancingPolicy : uint8_t {
    RoundRobin,
    WeightedRoundRobin,
    LeastConnections,
    IpHash,         // hash(key) % eligible servers
    ConsistentHash  // Ketama-style ring
};

[[nodiscard]] constexpr std::string_view to_string(ServerRole role) noexcept {
    return role == ServerRole::Primary ? "primary" : "backup";
}

[[nodiscard]] constexpr std::string_view to_string(ServerState state) noexcept {
    return state == ServerState::Healthy ? "healthy" : "unhealthy";
}

[[nodiscard]] std::string_view to_string(BalancingPolicy policy) noexcept;
[[nodiscard]] std::optional<BalancingPolicy> parse_balancing_policy(std::string_view name) noexcept;
[[nodiscard]] std::optional<ServerRole> parse_server_role(std::string_view name) noexcept;

/// Passive health parameters
struct HealthParams {
    uint32_t max_fails = 1;                          // 0 disables failure accounting
    std::chrono::milliseconds fail_timeout{10000};   // Failure window and probation delay
    std::chrono::milliseconds max_fail_timeout{0};   // Probation backoff cap (<= fail_timeout: off)
};

/// Active probe parameters
struct ActiveCheckParams {
    bool enabled = false;
    std::chrono::milliseconds interval{5000};
    std::string path = "/health";
    std::chrono::milliseconds timeout{2000};
    std::vector<uint16_t> expected_statuses;  // Empty: any 2xx or 3xx
};

/// Static description of a server, from pool configuration
struct UpstreamServerSpec {
    std::string host;
    uint16_t port = 80;
    uint32_t weight = 1;
    ServerRole role = ServerRole::Primary;
    std::optional<uint32_t> max_fails;
    std::optional<std::chrono::milliseconds> fail_timeout;
    uint32_t max_connections = 0;  // 0 = unlimited
};

/// A backend server. Identity is immutable; health fields are mutated only
/// by HealthChecker and the connection count only by ConnectionManager.
/// Selection reads everything through atomics.
class UpstreamServer {
public:
    UpstreamServer(UpstreamServerSpec spec, const HealthParams& pool_health);

    UpstreamServer(const UpstreamServer&) = delete;
    UpstreamServer& operator=(const UpstreamServer&) = delete;

    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] uint16_t port() const noexcept { return port_; }
    [[nodiscard]] const std::string& address() const noexcept { return address_; }
    [[nodiscard]] uint32_t weight() const noexcept { return weight_; }
    [[nodiscard]] ServerRole role() const noexcept { return role_; }
    [[nodiscard]] uint32_t max_connections() const noexcept { return max_connections_; }
    [[nodiscard]] const HealthParams& health_params() const noexcept { return health_; }

    [[nodiscard]] ServerState state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }
    [[nodiscard]] uint32_t failure_count() const noexcept {
        return failure_count_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] uint32_t active_connections() const noexcept {
        return active_connections_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] uint64_t total_requests() const noexcept {
        return total_requests_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] uint64_t total_failures() const noexcept {
        return total_failures_.load(std::memory_order_relaxed);
    }

    /// Time of the most recent recorded failure (nullopt if none)
    [[nodiscard]] std::optional<Clock::time_point> last_failure() const noexcept;

    /// Current probation delay, grows with backoff after failed probes
    [[nodiscard]] std::chrono::milliseconds effective_fail_timeout() const noexcept;

    /// Below max_connections (always true when unlimited)
    [[nodiscard]] bool has_capacity() const noexcept;

    /// Healthy, or unhealthy with its probation window open and unclaimed
    [[nodiscard]] bool is_selectable(Clock::time_point now) const noexcept;

    /// Unhealthy but due for a probationary request
    [[nodiscard]] bool probation_due(Clock::time_point now) const noexcept;

private:
    friend class HealthChecker;
    friend class ConnectionManager;
    friend class UpstreamPool;

    /// Returns true when this failure made the server unhealthy
    bool record_failure(Clock::time_point now);

    /// Returns true when this success brought the server back
    bool record_success();

    /// Claim the single probationary request for this window
    bool try_claim_probe(Clock::time_point now) noexcept;

    void connection_started() noexcept {
        active_connections_.fetch_add(1, std::memory_order_relaxed);
        total_requests_.fetch_add(1, std::memory_order_relaxed);
    }
    void connection_finished() noexcept {
        active_connections_.fetch_sub(1, std::memory_order_relaxed);
    }

    static int64_t to_ticks(Clock::time_point tp) noexcept {
        return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
    }

    const std::string host_;
    const uint16_t port_;
    const std::string address_;
    const uint32_t weight_;
    const ServerRole role_;
    const uint32_t max_connections_;
    const HealthParams health_;

    // Serializes health transitions for this server only
    std::mutex health_mutex_;

    std::atomic<ServerState> state_{ServerState::Healthy};
    std::atomic<uint32_t> failure_count_{0};
    std::atomic<int64_t> last_failure_ticks_{0};   // 0 = never failed
    std::atomic<int64_t> probe_claim_ticks_{0};    // Start of the claimed probation window
    std::atomic<int64_t> fail_timeout_ns_;
    std::atomic<uint32_t> active_connections_{0};

    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> total_failures_{0};
};

/// Request-scoped set of servers that already failed this request
using ExcludedServers = core::fast_set<const UpstreamServer*>;

/// Pool-level options
struct PoolOptions {
    BalancingPolicy policy = BalancingPolicy::RoundRobin;
    HealthParams health;
    ActiveCheckParams active_check;
    std::string hash_key = "client_ip";  // "client_ip" or "header:<Name>"
};

/// Ordered set of servers with one balancing policy. Servers are created with
/// the pool and live as long as it does.
class UpstreamPool {
public:
    /// Throws std::invalid_argument without a primary server or on weight 0
    UpstreamPool(std::string name, std::vector<UpstreamServerSpec> servers, PoolOptions options);
    ~UpstreamPool();

    UpstreamPool(const UpstreamPool&) = delete;
    UpstreamPool& operator=(const UpstreamPool&) = delete;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] BalancingPolicy policy() const noexcept { return options_.policy; }
    [[nodiscard]] const PoolOptions& options() const noexcept { return options_; }

    /// All servers in configuration order
    [[nodiscard]] const std::vector<std::unique_ptr<UpstreamServer>>& servers() const noexcept {
        return servers_;
    }

    [[nodiscard]] UpstreamServer* find(std::string_view address) const noexcept;

    /// Pick a server for one attempt, or nullptr when nothing is eligible
    /// (NoHealthyUpstream). Backups are considered only when no primary is.
    [[nodiscard]] UpstreamServer* select(std::string_view hash_key,
                                         const ExcludedServers& excluded,
                                         Clock::time_point now = Clock::now());

    /// True if a fresh request could be routed somewhere right now
    [[nodiscard]] bool has_eligible(Clock::time_point now = Clock::now()) const noexcept;

private:
    std::string name_;
    PoolOptions options_;
    std::vector<std::unique_ptr<UpstreamServer>> servers_;
    std::vector<UpstreamServer*> primaries_;
    std::vector<UpstreamServer*> backups_;
    std::unique_ptr<LoadBalancer> primary_balancer_;
    std::unique_ptr<LoadBalancer> backup_balancer_;
};

}  // namespace harbor::gateway

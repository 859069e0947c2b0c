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


// Harbor Upstream - Implementation

#include "upstream.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>

#include "load_balancer.hpp"

namespace harbor::gateway {

std::string_view to_string(BalancingPolicy policy) noexcept {
    switch (policy) {
        case BalancingPolicy::RoundRobin:
            return "round_robin";
        case BalancingPolicy::WeightedRoundRobin:
            return "weighted_round_robin";
        case BalancingPolicy::LeastConnections:
            return "least_connections";
        case BalancingPolicy::IpHash:
            return "ip_hash";
        case BalancingPolicy::ConsistentHash:
            return "consistent_hash";
    }
    return "round_robin";
}

std::optional<BalancingPolicy> parse_balancing_policy(std::string_view name) noexcept {
    if (name == "round_robin") return BalancingPolicy::RoundRobin;
    if (name == "weighted_round_robin") return BalancingPolicy::WeightedRoundRobin;
    if (name == "least_connections") return BalancingPolicy::LeastConnections;
    if (name == "ip_hash") return BalancingPolicy::IpHash;
    if (name == "consistent_hash") return BalancingPolicy::ConsistentHash;
    return std::nullopt;
}

std::optional<ServerRole> parse_server_role(std::string_view name) noexcept {
    if (name == "primary") return ServerRole::Primary;
    if (name == "backup") return ServerRole::Backup;
    return std::nullopt;
}

// UpstreamServer

static HealthParams merge_health(const UpstreamServerSpec& spec, const HealthParams& pool) {
    HealthParams params = pool;
    if (spec.max_fails) {
        params.max_fails = *spec.max_fails;
    }
    if (spec.fail_timeout) {
        params.fail_timeout = *spec.fail_timeout;
    }
    return params;
}

UpstreamServer::UpstreamServer(UpstreamServerSpec spec, const HealthParams& pool_health)
    : host_(std::move(spec.host)),
      port_(spec.port),
      address_(fmt::format("{}:{}", host_, port_)),
      weight_(spec.weight),
      role_(spec.role),
      max_connections_(spec.max_connections),
      health_(merge_health(spec, pool_health)),
      fail_timeout_ns_(std::chrono::nanoseconds(health_.fail_timeout).count()) {
    if (host_.empty()) {
        throw std::invalid_argument("upstream server host must not be empty");
    }
    if (weight_ == 0) {
        throw std::invalid_argument(fmt::format("upstream server {} has weight 0", address_));
    }
}

std::optional<Clock::time_point> UpstreamServer::last_failure() const noexcept {
    int64_t ticks = last_failure_ticks_.load(std::memory_order_acquire);
    if (ticks == 0) {
        return std::nullopt;
    }
    return Clock::time_point(std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds(ticks)));
}

std::chrono::milliseconds UpstreamServer::effective_fail_timeout() const noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::nanoseconds(fail_timeout_ns_.load(std::memory_order_relaxed)));
}

bool UpstreamServer::has_capacity() const noexcept {
    return max_connections_ == 0 || active_connections() < max_connections_;
}

bool UpstreamServer::probation_due(Clock::time_point now) const noexcept {
    if (state() != ServerState::Unhealthy) {
        return false;
    }
    int64_t now_ticks = to_ticks(now);
    int64_t timeout = fail_timeout_ns_.load(std::memory_order_relaxed);
    int64_t since_failure = now_ticks - last_failure_ticks_.load(std::memory_order_acquire);
    int64_t since_claim = now_ticks - probe_claim_ticks_.load(std::memory_order_acquire);
    return since_failure >= timeout && since_claim >= timeout;
}

bool UpstreamServer::is_selectable(Clock::time_point now) const noexcept {
    if (!has_capacity()) {
        return false;
    }
    return state() == ServerState::Healthy || probation_due(now);
}

bool UpstreamServer::try_claim_probe(Clock::time_point now) noexcept {
    int64_t claimed = probe_claim_ticks_.load(std::memory_order_acquire);
    if (!probation_due(now)) {
        return false;
    }
    // Only one request wins the window; the rest see a fresh claim
    return probe_claim_ticks_.compare_exchange_strong(claimed, to_ticks(now),
                                                      std::memory_order_acq_rel);
}

bool UpstreamServer::record_failure(Clock::time_point now) {
    std::lock_guard lock(health_mutex_);

    total_failures_.fetch_add(1, std::memory_order_relaxed);
    if (health_.max_fails == 0) {
        return false;
    }

    int64_t now_ticks = to_ticks(now);
    int64_t previous = last_failure_ticks_.load(std::memory_order_relaxed);

    if (state_.load(std::memory_order_relaxed) == ServerState::Unhealthy) {
        // Failed probe (or a late failure): restart the window, optionally longer
        auto cap = std::chrono::nanoseconds(health_.max_fail_timeout).count();
        auto current = fail_timeout_ns_.load(std::memory_order_relaxed);
        if (cap > current) {
            fail_timeout_ns_.store(std::min(current * 2, cap), std::memory_order_relaxed);
        }
        failure_count_.fetch_add(1, std::memory_order_relaxed);
        last_failure_ticks_.store(now_ticks, std::memory_order_release);
        return false;
    }

    // Failures older than the window do not accumulate
    auto window = std::chrono::nanoseconds(health_.fail_timeout).count();
    if (previous != 0 && now_ticks - previous > window) {
        failure_count_.store(0, std::memory_order_relaxed);
    }

    uint32_t failures = failure_count_.fetch_add(1, std::memory_order_relaxed) + 1;
    last_failure_ticks_.store(now_ticks, std::memory_order_release);

    if (failures >= health_.max_fails) {
        state_.store(ServerState::Unhealthy, std::memory_order_release);
        return true;
    }
    return false;
}

bool UpstreamServer::record_success() {
    std::lock_guard lock(health_mutex_);

    failure_count_.store(0, std::memory_order_relaxed);
    if (state_.load(std::memory_order_relaxed) == ServerState::Healthy) {
        return false;
    }

    fail_timeout_ns_.store(std::chrono::nanoseconds(health_.fail_timeout).count(),
                           std::memory_order_relaxed);
    state_.store(ServerState::Healthy, std::memory_order_release);
    return true;
}

// UpstreamPool

UpstreamPool::UpstreamPool(std::string name, std::vector<UpstreamServerSpec> servers,
                           PoolOptions options)
    : name_(std::move(name)), options_(std::move(options)) {
    servers_.reserve(servers.size());
    for (auto& spec : servers) {
        servers_.push_back(std::make_unique<UpstreamServer>(std::move(spec), options_.health));
        UpstreamServer* server = servers_.back().get();
        (server->role() == ServerRole::Primary ? primaries_ : backups_).push_back(server);
    }

    if (primaries_.empty()) {
        throw std::invalid_argument(
            fmt::format("upstream pool '{}' needs at least one primary server", name_));
    }

    primary_balancer_ = make_load_balancer(options_.policy, primaries_);
    if (!backups_.empty()) {
        backup_balancer_ = make_load_balancer(options_.policy, backups_);
    }
}

UpstreamPool::~UpstreamPool() = default;

UpstreamServer* UpstreamPool::find(std::string_view address) const noexcept {
    for (const auto& server : servers_) {
        if (server->address() == address) {
            return server.get();
        }
    }
    return nullptr;
}

UpstreamServer* UpstreamPool::select(std::string_view hash_key, const ExcludedServers& excluded,
                                     Clock::time_point now) {
    // Probationary servers whose probe another request already claimed
    ExcludedServers contended;

    auto primary_ok = [&](const UpstreamServer& server) {
        return !excluded.contains(&server) && !contended.contains(&server) &&
               server.is_selectable(now);
    };

    for (size_t attempt = 0; attempt <= primaries_.size(); ++attempt) {
        UpstreamServer* server = primary_balancer_->select(primary_ok, hash_key);
        if (!server) {
            break;
        }
        if (server->state() == ServerState::Healthy || server->try_claim_probe(now)) {
            return server;
        }
        contended.insert(server);
    }

    if (!backup_balancer_) {
        return nullptr;
    }

    // Last resort: backups regardless of their own health flag
    auto backup_ok = [&](const UpstreamServer& server) {
        return !excluded.contains(&server) && server.has_capacity();
    };
    return backup_balancer_->select(backup_ok, hash_key);
}

bool UpstreamPool::has_eligible(Clock::time_point now) const noexcept {
    bool primary = std::any_of(primaries_.begin(), primaries_.end(),
                               [now](const UpstreamServer* s) { return s->is_selectable(now); });
    return primary || !backups_.empty();
}

}  // namespace harbor::gateway

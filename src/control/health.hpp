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

// Harbor Health Reporting - Header
// Snapshots of pool state and counters for the admin endpoint

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "metrics.hpp"

namespace harbor::gateway {
class CacheStore;
class UpstreamPool;
}  // namespace harbor::gateway

namespace harbor::control {

/// Health status levels
enum class HealthStatus {
    Healthy,    // Every server selectable
    Degraded,   // Some servers unhealthy, pool still serving
    Unhealthy   // No eligible server in at least one pool
};

[[nodiscard]] std::string_view to_string(HealthStatus status) noexcept;

/// Backend health information
struct BackendHealth {
    std::string address;
    std::string state;  // "healthy" or "unhealthy"
    std::string role;
    uint32_t weight = 1;
    uint32_t active_connections = 0;
    uint32_t failure_count = 0;
    uint64_t total_requests = 0;
    uint64_t total_failures = 0;
};

/// Upstream health information
struct UpstreamHealth {
    std::string name;
    std::string policy;
    HealthStatus status = HealthStatus::Healthy;
    size_t healthy_backends = 0;
    size_t total_backends = 0;
    std::vector<BackendHealth> backends;
};

/// Server health information
struct ServerHealth {
    HealthStatus status = HealthStatus::Healthy;
    std::chrono::seconds uptime{0};
    uint64_t total_requests = 0;
    uint64_t active_connections = 0;
    uint64_t total_errors = 0;
    std::vector<UpstreamHealth> upstreams;
};

/// Collect a point-in-time view of every pool
[[nodiscard]] ServerHealth collect_health(
    const std::vector<std::shared_ptr<gateway::UpstreamPool>>& pools,
    const MetricsSnapshot& metrics, std::chrono::steady_clock::time_point started);

/// Health check response builder
class HealthResponse {
public:
    /// Per-pool JSON used by GET /status
    [[nodiscard]] static std::string to_json(const ServerHealth& health);

    /// One-line summary used by GET /health
    [[nodiscard]] static std::string to_text(const ServerHealth& health);

    /// 503 only when some pool has nothing to route to
    [[nodiscard]] static uint16_t to_http_status(HealthStatus status) noexcept {
        switch (status) {
            case HealthStatus::Healthy:
                return 200;
            case HealthStatus::Degraded:
                return 200;  // Still serving
            case HealthStatus::Unhealthy:
                return 503;
        }
        return 500;
    }
};

/// Counter JSON used by GET /metrics (cache may be null)
[[nodiscard]] std::string metrics_to_json(const MetricsSnapshot& metrics,
                                          const gateway::CacheStore* cache);

}  // namespace harbor::control

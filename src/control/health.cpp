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

// Harbor Health Reporting - Implementation

#include "health.hpp"

#include <nlohmann/json.hpp>

#include <fmt/format.h>

#include "../gateway/cache_store.hpp"
#include "../gateway/upstream.hpp"

namespace harbor::control {

std::string_view to_string(HealthStatus status) noexcept {
    switch (status) {
        case HealthStatus::Healthy:
            return "healthy";
        case HealthStatus::Degraded:
            return "degraded";
        case HealthStatus::Unhealthy:
            return "unhealthy";
    }
    return "unhealthy";
}

ServerHealth collect_health(const std::vector<std::shared_ptr<gateway::UpstreamPool>>& pools,
                            const MetricsSnapshot& metrics,
                            std::chrono::steady_clock::time_point started) {
    auto now = gateway::Clock::now();

    ServerHealth health;
    health.uptime = std::chrono::duration_cast<std::chrono::seconds>(now - started);
    health.total_requests = metrics.total_requests;
    health.active_connections = metrics.active_connections;
    health.total_errors = metrics.total_errors;

    for (const auto& pool : pools) {
        UpstreamHealth upstream;
        upstream.name = pool->name();
        upstream.policy = std::string(gateway::to_string(pool->policy()));

        for (const auto& server : pool->servers()) {
            BackendHealth backend;
            backend.address = server->address();
            backend.state = std::string(gateway::to_string(server->state()));
            backend.role = std::string(gateway::to_string(server->role()));
            backend.weight = server->weight();
            backend.active_connections = server->active_connections();
            backend.failure_count = server->failure_count();
            backend.total_requests = server->total_requests();
            backend.total_failures = server->total_failures();

            if (server->state() == gateway::ServerState::Healthy) {
                ++upstream.healthy_backends;
            }
            upstream.backends.push_back(std::move(backend));
        }
        upstream.total_backends = upstream.backends.size();

        if (!pool->has_eligible(now)) {
            upstream.status = HealthStatus::Unhealthy;
        } else if (upstream.healthy_backends < upstream.total_backends) {
            upstream.status = HealthStatus::Degraded;
        }

        // Worst pool decides the overall status
        if (static_cast<int>(upstream.status) > static_cast<int>(health.status)) {
            health.status = upstream.status;
        }
        health.upstreams.push_back(std::move(upstream));
    }

    return health;
}

std::string HealthResponse::to_json(const ServerHealth& health) {
    nlohmann::json j;
    j["status"] = to_string(health.status);
    j["uptime_seconds"] = health.uptime.count();
    j["total_requests"] = health.total_requests;
    j["active_connections"] = health.active_connections;
    j["total_errors"] = health.total_errors;

    auto& upstreams = j["upstreams"] = nlohmann::json::array();
    for (const auto& upstream : health.upstreams) {
        nlohmann::json u{{"name", upstream.name},
                         {"policy", upstream.policy},
                         {"status", to_string(upstream.status)},
                         {"healthy_backends", upstream.healthy_backends},
                         {"total_backends", upstream.total_backends}};

        auto& backends = u["backends"] = nlohmann::json::array();
        for (const auto& backend : upstream.backends) {
            backends.push_back({{"address", backend.address},
                                {"state", backend.state},
                                {"role", backend.role},
                                {"weight", backend.weight},
                                {"activeConnectionCount", backend.active_connections},
                                {"currentFailureCount", backend.failure_count},
                                {"totalRequests", backend.total_requests},
                                {"totalFailures", backend.total_failures}});
        }
        upstreams.push_back(std::move(u));
    }

    return j.dump(2) + "\n";
}

std::string HealthResponse::to_text(const ServerHealth& health) {
    std::string_view label = "OK";
    if (health.status == HealthStatus::Degraded) {
        label = "DEGRADED";
    } else if (health.status == HealthStatus::Unhealthy) {
        label = "UNHEALTHY";
    }

    return fmt::format("{} - Uptime: {}s, Requests: {}, Errors: {}, Active: {}\n", label,
                       health.uptime.count(), health.total_requests, health.total_errors,
                       health.active_connections);
}

std::string metrics_to_json(const MetricsSnapshot& metrics, const gateway::CacheStore* cache) {
    nlohmann::json j;

    j["requests"] = {{"total", metrics.total_requests},
                     {"errors", metrics.total_errors},
                     {"timeouts", metrics.total_timeouts},
                     {"error_rate", metrics.error_rate()}};

    j["connections"] = {{"active", metrics.active_connections},
                        {"total", metrics.total_connections},
                        {"rejected", metrics.rejected_connections}};

    j["latency_us"] = {{"avg", metrics.avg_latency_us()},
                       {"min", metrics.min_latency_us},
                       {"max", metrics.max_latency_us}};

    j["bytes"] = {{"received", metrics.bytes_received}, {"sent", metrics.bytes_sent}};

    j["status"] = {{"2xx", metrics.status_2xx},
                   {"3xx", metrics.status_3xx},
                   {"4xx", metrics.status_4xx},
                   {"5xx", metrics.status_5xx}};

    j["upstream"] = {{"attempts", metrics.upstream_attempts},
                     {"retries", metrics.upstream_retries},
                     {"failures", metrics.upstream_failures},
                     {"no_healthy_upstream", metrics.no_healthy_upstream},
                     {"client_disconnects", metrics.client_disconnects}};

    j["rate_limited"] = metrics.rate_limited;

    nlohmann::json cache_json{{"hits", metrics.cache_hits},
                              {"misses", metrics.cache_misses},
                              {"stale", metrics.cache_stale},
                              {"bypass", metrics.cache_bypass},
                              {"store_failures", metrics.cache_store_failures},
                              {"background_refreshes", metrics.background_refreshes},
                              {"hit_ratio", metrics.cache_hit_ratio()}};
    if (cache) {
        auto stats = cache->stats();
        cache_json["entries"] = stats.entries;
        cache_json["bytes"] = stats.bytes;
        cache_json["evictions"] = stats.evictions;
        cache_json["expirations"] = stats.expirations;
        cache_json["rejected"] = stats.rejected;
    }
    j["cache"] = std::move(cache_json);

    return j.dump(2) + "\n";
}

}  // namespace harbor::control

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


// Harbor Proxy Engine - Header
// Admission, cache, selection and forwarding for one request

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../control/metrics.hpp"
#include "../core/cancellation.hpp"
#include "../core/containers.hpp"
#include "../http/http.hpp"
#include "cache_policy.hpp"
#include "cache_store.hpp"
#include "rate_limit.hpp"
#include "request_key.hpp"
#include "upstream.hpp"

namespace harbor::core {
class WorkerPool;
}

namespace harbor::gateway {

class HealthChecker;
class UpstreamTransport;

/// Forwarding behaviour
struct ProxyOptions {
    uint32_t max_attempts = 3;  // First try plus retries
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds send_timeout{10000};
    std::chrono::milliseconds read_timeout{30000};
    std::chrono::milliseconds request_timeout{60000};  // Overall budget, 0 = unbounded

    std::vector<uint16_t> retriable_statuses = {502, 503, 504};
    std::vector<uint16_t> failure_statuses = {500, 502, 503, 504};
    bool retry_non_idempotent = false;

    bool diagnostic_headers = true;         // X-Cache-Status
    bool expose_upstream_address = false;   // X-Upstream-Addr
    std::vector<std::string> hide_headers = {"X-Accel-*", "X-Internal-*"};
};

/// Cache behaviour beyond the store itself
struct CacheSettings {
    bool background_refresh = true;
    std::chrono::milliseconds lock_timeout{5000};
};

/// Path prefix routed to a pool
struct Route {
    std::string prefix;
    std::shared_ptr<UpstreamPool> pool;
};

/// Per-request orchestration. Stateless between requests apart from the
/// shared components it was given; handle() is called concurrently.
///
/// Order: rate limit zones, cache lookup (with fill lock), forwarding with
/// retry and exclusion, health reporting, cache store, response headers.
class ProxyEngine {
public:
    ProxyEngine(ProxyOptions options, std::vector<Route> routes, UpstreamTransport& transport,
                HealthChecker& health, control::ProxyMetrics& metrics);
    ~ProxyEngine();

    ProxyEngine(const ProxyEngine&) = delete;
    ProxyEngine& operator=(const ProxyEngine&) = delete;

    /// Zones are checked in the order added; the first denial wins
    void add_rate_limit_zone(RateLimitZone zone);

    /// Enable caching. refreshers runs stale-while-revalidate refreshes;
    /// without it stale entries are treated as expired.
    void enable_cache(std::shared_ptr<CacheStore> store, CachePolicy policy,
                      CacheSettings settings, core::WorkerPool* refreshers);

    /// Produce the response for request. Returns nullopt when the client
    /// went away (cancel fired): nothing must be written back.
    [[nodiscard]] std::optional<http::Response> handle(const http::Request& request,
                                                       const core::CancellationToken& cancel,
                                                       std::string_view correlation_id = {});

    /// Longest matching route prefix, or nullptr
    [[nodiscard]] UpstreamPool* route(std::string_view path) const noexcept;

    [[nodiscard]] CacheStore* cache() const noexcept { return cache_.get(); }
    [[nodiscard]] const ProxyOptions& options() const noexcept { return options_; }

private:
    /// Result of the forwarding loop
    struct ForwardResult {
        std::optional<http::Response> response;  // nullopt: client disconnected
        bool from_upstream = false;               // False for engine-generated errors
        const UpstreamServer* server = nullptr;   // Server that produced the response
    };

    struct PoolRoute {
        std::string prefix;
        std::shared_ptr<UpstreamPool> pool;
        RequestKeyExtractor hash_key;
    };

    [[nodiscard]] const PoolRoute* find_route(std::string_view path) const noexcept;

    [[nodiscard]] std::optional<http::Response> check_rate_limits(const http::Request& request);

    [[nodiscard]] ForwardResult forward(const http::Request& request, const PoolRoute& route,
                                        const core::CancellationToken& cancel,
                                        Clock::time_point deadline,
                                        std::string_view correlation_id);

    /// Store a forwarded response if the rule allows it; returns the entry
    std::shared_ptr<const CacheEntry> store(const CacheRule& rule, const std::string& key,
                                            const http::Response& response);

    /// Queue a stale-while-revalidate refresh; false if it could not be queued
    bool schedule_refresh(const http::Request& request, const PoolRoute& route,
                          const CacheRule& rule, const std::string& key);

    /// Drop hop-by-hop and hidden headers from an upstream response
    void sanitize(http::Response& response) const;

    /// Add diagnostic headers for the client
    void decorate(http::Response& response, std::string_view cache_status,
                  const UpstreamServer* server) const;

    [[nodiscard]] bool is_retriable(uint16_t status) const noexcept;
    [[nodiscard]] bool is_failure(uint16_t status) const noexcept;

    [[nodiscard]] Clock::time_point deadline_from(Clock::time_point start) const noexcept;

    ProxyOptions options_;
    std::vector<PoolRoute> routes_;  // Sorted by prefix length, longest first
    UpstreamTransport& transport_;
    HealthChecker& health_;
    control::ProxyMetrics& metrics_;

    std::vector<RateLimitZone> zones_;

    std::shared_ptr<CacheStore> cache_;
    CachePolicy cache_policy_;
    CacheSettings cache_settings_;
    core::WorkerPool* refreshers_ = nullptr;
};

/// Text of the X-Cache-Status header for a lookup outcome
[[nodiscard]] std::string_view cache_status_text(CacheEntryState state) noexcept;

}  // namespace harbor::gateway

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

// Harbor Gateway Component Factory - Header
// Builds pools, transports, health checking, cache and the proxy engine from configuration

#pragma once

#include <memory>
#include <vector>

#include "../control/config.hpp"
#include "../control/metrics.hpp"
#include "../core/worker_pool.hpp"
#include "cache_policy.hpp"
#include "cache_store.hpp"
#include "connection_pool.hpp"
#include "health_checker.hpp"
#include "proxy_engine.hpp"
#include "rate_limit.hpp"
#include "upstream.hpp"
#include "upstream_client.hpp"

namespace harbor::gateway {

/// Everything the listener needs to serve requests.
/// Members are declared in dependency order; background refreshers are torn
/// down first since their tasks call back into the engine.
struct Gateway {
    std::vector<std::shared_ptr<UpstreamPool>> pools;

    std::unique_ptr<ConnectionManager> connections;
    std::unique_ptr<HttpUpstreamTransport> transport;

    // Probes use their own connections so they never reuse a request's keep-alive socket
    std::unique_ptr<ConnectionManager> probe_connections;
    std::unique_ptr<HttpUpstreamTransport> probe_transport;
    std::unique_ptr<HealthChecker> health;

    std::shared_ptr<CacheStore> cache;  // Null when caching is disabled
    std::unique_ptr<ProxyEngine> engine;
    std::unique_ptr<core::WorkerPool> refreshers;
};

/// Build one pool per upstream (throws std::invalid_argument on bad input)
[[nodiscard]] std::vector<std::shared_ptr<UpstreamPool>> build_upstream_pools(
    const control::Config& config);

[[nodiscard]] KeepaliveOptions build_keepalive_options(const control::KeepaliveConfig& config);

[[nodiscard]] ProxyOptions build_proxy_options(const control::ProxyConfig& config);

/// Map route prefixes to pools; an empty route list sends "/" to the first upstream
[[nodiscard]] std::vector<Route> build_routes(
    const control::Config& config, const std::vector<std::shared_ptr<UpstreamPool>>& pools);

[[nodiscard]] RateLimitZone build_rate_limit_zone(const control::RateLimitConfig& config);

[[nodiscard]] CacheRule build_cache_rule(const control::CacheRuleConfig& config);

[[nodiscard]] CacheStoreOptions build_cache_store_options(const control::CacheConfig& config);

/// Assemble the full request path (does not start background threads)
[[nodiscard]] std::unique_ptr<Gateway> build_gateway(const control::Config& config,
                                                     control::ProxyMetrics& metrics);

}  // namespace harbor::gateway

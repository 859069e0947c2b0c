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

// Harbor Gateway Component Factory - Implementation

#include "factory.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <stdexcept>

#include "../core/logging.hpp"

namespace harbor::gateway {

namespace {

std::chrono::milliseconds seconds_to_ms(uint32_t seconds) {
    return std::chrono::milliseconds(static_cast<int64_t>(seconds) * 1000);
}

UpstreamServerSpec build_server_spec(const control::BackendConfig& backend) {
    UpstreamServerSpec spec;
    spec.host = backend.host;
    spec.port = backend.port;
    spec.weight = backend.weight;

    auto role = parse_server_role(backend.role);
    if (!role) {
        throw std::invalid_argument(
            fmt::format("backend {}:{} has unknown role '{}'", backend.host, backend.port, backend.role));
    }
    spec.role = *role;

    spec.max_fails = backend.max_fails;
    if (backend.fail_timeout) {
        spec.fail_timeout = seconds_to_ms(*backend.fail_timeout);
    }
    spec.max_connections = backend.max_connections;
    return spec;
}

}  // namespace

std::vector<std::shared_ptr<UpstreamPool>> build_upstream_pools(const control::Config& config) {
    std::vector<std::shared_ptr<UpstreamPool>> pools;
    pools.reserve(config.upstreams.size());

    for (const auto& upstream : config.upstreams) {
        PoolOptions options;

        auto policy = parse_balancing_policy(upstream.load_balancing);
        if (!policy) {
            throw std::invalid_argument(fmt::format("upstream '{}' has unknown load_balancing '{}'",
                                                    upstream.name, upstream.load_balancing));
        }
        options.policy = *policy;
        options.hash_key = upstream.hash_key;

        options.health.max_fails = upstream.max_fails;
        options.health.fail_timeout = seconds_to_ms(upstream.fail_timeout);
        options.health.max_fail_timeout = seconds_to_ms(upstream.max_fail_timeout);

        const auto& check = upstream.health_check;
        options.active_check.enabled = check.enabled;
        options.active_check.interval = seconds_to_ms(check.interval);
        options.active_check.path = check.path;
        options.active_check.timeout = std::chrono::milliseconds(check.timeout);
        options.active_check.expected_statuses = check.expected_statuses;

        std::vector<UpstreamServerSpec> servers;
        servers.reserve(upstream.backends.size());
        for (const auto& backend : upstream.backends) {
            servers.push_back(build_server_spec(backend));
        }

        pools.push_back(
            std::make_shared<UpstreamPool>(upstream.name, std::move(servers), std::move(options)));
    }

    return pools;
}

KeepaliveOptions build_keepalive_options(const control::KeepaliveConfig& config) {
    KeepaliveOptions options;
    options.max_idle_per_server = config.pool_size;
    options.idle_timeout = std::chrono::seconds(config.idle_timeout);
    options.max_requests_per_conn = config.max_requests;
    return options;
}

ProxyOptions build_proxy_options(const control::ProxyConfig& config) {
    ProxyOptions options;
    options.max_attempts = config.max_attempts;
    options.connect_timeout = std::chrono::milliseconds(config.connect_timeout);
    options.send_timeout = std::chrono::milliseconds(config.send_timeout);
    options.read_timeout = std::chrono::milliseconds(config.read_timeout);
    options.request_timeout = std::chrono::milliseconds(config.request_timeout);
    options.retriable_statuses = config.retriable_statuses;
    options.failure_statuses = config.failure_statuses;
    options.retry_non_idempotent = config.retry_non_idempotent;
    options.diagnostic_headers = config.diagnostic_headers;
    options.expose_upstream_address = config.expose_upstream_address;
    options.hide_headers = config.hide_headers;
    return options;
}

std::vector<Route> build_routes(const control::Config& config,
                                const std::vector<std::shared_ptr<UpstreamPool>>& pools) {
    auto find_pool = [&pools](const std::string& name) -> std::shared_ptr<UpstreamPool> {
        auto it = std::find_if(pools.begin(), pools.end(),
                               [&name](const auto& pool) { return pool->name() == name; });
        return it != pools.end() ? *it : nullptr;
    };

    std::vector<Route> routes;
    for (const auto& route_config : config.routes) {
        auto pool = find_pool(route_config.upstream);
        if (!pool) {
            throw std::invalid_argument(fmt::format("route '{}' references unknown upstream '{}'",
                                                    route_config.path, route_config.upstream));
        }
        routes.push_back(Route{route_config.path, std::move(pool)});
    }

    if (routes.empty() && !pools.empty()) {
        routes.push_back(Route{"/", pools.front()});
    }

    return routes;
}

RateLimitZone build_rate_limit_zone(const control::RateLimitConfig& config) {
    auto key = RequestKeyExtractor::parse(config.key);
    if (!key) {
        throw std::invalid_argument(
            fmt::format("rate limit '{}' has invalid key '{}'", config.name, config.key));
    }

    RateLimitZone zone;
    zone.name = config.name;
    zone.key = *key;
    zone.limiter = std::make_unique<RateLimiter>(config.capacity, config.rate, config.max_keys);
    zone.status = config.status;
    return zone;
}

CacheRule build_cache_rule(const control::CacheRuleConfig& config) {
    CacheRule rule;
    rule.path = config.path;

    for (const auto& [status_text, seconds] : config.ttl) {
        if (status_text == "any") {
            rule.ttl_any = std::chrono::seconds(seconds);
            continue;
        }
        uint16_t status = 0;
        auto [ptr, ec] =
            std::from_chars(status_text.data(), status_text.data() + status_text.size(), status);
        if (ec != std::errc{} || ptr != status_text.data() + status_text.size()) {
            throw std::invalid_argument(
                fmt::format("cache rule '{}' has invalid ttl status '{}'", config.path, status_text));
        }
        rule.ttl_by_status[status] = std::chrono::seconds(seconds);
    }

    rule.methods.clear();
    for (const auto& name : config.methods) {
        auto method = http::parse_method(name);
        if (method != http::Method::GET && method != http::Method::HEAD) {
            throw std::invalid_argument(
                fmt::format("cache rule '{}' lists uncacheable method '{}'", config.path, name));
        }
        rule.methods.push_back(method);
    }

    rule.bypass.cookies = config.bypass.cookies;
    rule.bypass.headers = config.bypass.headers;
    rule.bypass.query_params = config.bypass.query_params;
    rule.vary_headers = config.vary_headers;
    rule.max_entry_size = config.max_entry_size;
    rule.respect_cache_control = config.respect_cache_control;
    return rule;
}

CacheStoreOptions build_cache_store_options(const control::CacheConfig& config) {
    CacheStoreOptions options;
    options.max_entries = config.max_entries;
    options.max_bytes = static_cast<size_t>(config.max_bytes);
    options.shards = std::max<size_t>(config.shards, 1);
    options.stale_while_revalidate = std::chrono::seconds(config.stale_while_revalidate);
    return options;
}

std::unique_ptr<Gateway> build_gateway(const control::Config& config,
                                       control::ProxyMetrics& metrics) {
    auto gateway = std::make_unique<Gateway>();

    gateway->pools = build_upstream_pools(config);

    // One shared keep-alive pool; its limits come from the first upstream
    KeepaliveOptions keepalive;
    if (!config.upstreams.empty()) {
        keepalive = build_keepalive_options(config.upstreams.front().keepalive);
    }
    gateway->connections = std::make_unique<ConnectionManager>(keepalive);

    ForwardingOptions forwarding;
    forwarding.add_forwarded_for = config.proxy.forwarded_headers;
    forwarding.add_real_ip = config.proxy.forwarded_headers;
    forwarding.add_forwarded_proto = config.proxy.forwarded_headers;
    gateway->transport = std::make_unique<HttpUpstreamTransport>(*gateway->connections, forwarding);

    KeepaliveOptions no_keepalive;
    no_keepalive.max_idle_per_server = 0;
    gateway->probe_connections = std::make_unique<ConnectionManager>(no_keepalive);
    gateway->probe_transport =
        std::make_unique<HttpUpstreamTransport>(*gateway->probe_connections, forwarding);
    gateway->health = std::make_unique<HealthChecker>(
        gateway->pools, std::make_shared<HttpHealthProber>(*gateway->probe_transport));

    gateway->engine =
        std::make_unique<ProxyEngine>(build_proxy_options(config.proxy),
                                      build_routes(config, gateway->pools), *gateway->transport,
                                      *gateway->health, metrics);

    for (const auto& zone_config : config.rate_limits) {
        gateway->engine->add_rate_limit_zone(build_rate_limit_zone(zone_config));
    }

    if (config.cache.enabled) {
        std::vector<CacheRule> rules;
        rules.reserve(config.cache.rules.size());
        for (const auto& rule_config : config.cache.rules) {
            rules.push_back(build_cache_rule(rule_config));
        }

        gateway->cache = std::make_shared<CacheStore>(build_cache_store_options(config.cache));

        CacheSettings settings;
        settings.background_refresh = config.cache.background_refresh;
        settings.lock_timeout = std::chrono::milliseconds(config.cache.lock_timeout);

        if (settings.background_refresh && config.cache.max_background_refreshes > 0) {
            gateway->refreshers = std::make_unique<core::WorkerPool>(
                config.cache.max_background_refreshes, config.cache.max_background_refreshes);
        } else {
            settings.background_refresh = false;
        }

        gateway->engine->enable_cache(gateway->cache, CachePolicy(std::move(rules)), settings,
                                      gateway->refreshers.get());
    }

    if (auto* logger = logging::get_current_logger()) {
        LOG_INFO(logger, "Gateway built: pools={}, routes={}, rate_limits={}, cache={}",
                 gateway->pools.size(), std::max<size_t>(config.routes.size(), 1),
                 config.rate_limits.size(), config.cache.enabled ? "enabled" : "disabled");
    }

    return gateway;
}

}  // namespace harbor::gateway

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


// Harbor Proxy Engine - Implementation

#include "proxy_engine.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"
#include "../core/worker_pool.hpp"
#include "connection_pool.hpp"
#include "errors.hpp"
#include "health_checker.hpp"
#include "upstream_client.hpp"

namespace harbor::gateway {

namespace {

// Cache lock waiters re-check cancellation at this granularity
constexpr std::chrono::milliseconds kLockWaitSlice{50};

bool contains(const std::vector<uint16_t>& statuses, uint16_t status) noexcept {
    return std::find(statuses.begin(), statuses.end(), status) != statuses.end();
}

}  // namespace

std::string_view cache_status_text(CacheEntryState state) noexcept {
    switch (state) {
        case CacheEntryState::Fresh:
            return "HIT";
        case CacheEntryState::Stale:
            return "STALE";
        case CacheEntryState::Updating:
            return "UPDATING";
    }
    return "HIT";
}

ProxyEngine::ProxyEngine(ProxyOptions options, std::vector<Route> routes,
                         UpstreamTransport& transport, HealthChecker& health,
                         control::ProxyMetrics& metrics)
    : options_(std::move(options)), transport_(transport), health_(health), metrics_(metrics) {
    for (auto& pattern : options_.hide_headers) {
        pattern = core::to_lower(pattern);
    }

    for (auto& route : routes) {
        if (!route.pool) {
            throw std::invalid_argument(fmt::format("route '{}' has no upstream pool", route.prefix));
        }
        auto extractor = RequestKeyExtractor::parse(route.pool->options().hash_key);
        if (!extractor) {
            throw std::invalid_argument(fmt::format("pool '{}' has invalid hash_key '{}'",
                                                    route.pool->name(),
                                                    route.pool->options().hash_key));
        }
        routes_.push_back({std::move(route.prefix), std::move(route.pool), *extractor});
    }
    std::stable_sort(routes_.begin(), routes_.end(), [](const PoolRoute& a, const PoolRoute& b) {
        return a.prefix.size() > b.prefix.size();
    });
}

ProxyEngine::~ProxyEngine() = default;

void ProxyEngine::add_rate_limit_zone(RateLimitZone zone) {
    zones_.push_back(std::move(zone));
}

void ProxyEngine::enable_cache(std::shared_ptr<CacheStore> store, CachePolicy policy,
                               CacheSettings settings, core::WorkerPool* refreshers) {
    cache_ = std::move(store);
    cache_policy_ = std::move(policy);
    cache_settings_ = settings;
    refreshers_ = refreshers;
}

const ProxyEngine::PoolRoute* ProxyEngine::find_route(std::string_view path) const noexcept {
    for (const auto& route : routes_) {
        if (path.substr(0, route.prefix.size()) == route.prefix) {
            return &route;
        }
    }
    return nullptr;
}

UpstreamPool* ProxyEngine::route(std::string_view path) const noexcept {
    const PoolRoute* found = find_route(path);
    return found ? found->pool.get() : nullptr;
}

Clock::time_point ProxyEngine::deadline_from(Clock::time_point start) const noexcept {
    if (options_.request_timeout.count() <= 0) {
        return Clock::time_point::max();
    }
    return start + options_.request_timeout;
}

bool ProxyEngine::is_retriable(uint16_t status) const noexcept {
    return contains(options_.retriable_statuses, status);
}

bool ProxyEngine::is_failure(uint16_t status) const noexcept {
    return contains(options_.failure_statuses, status);
}

std::optional<http::Response> ProxyEngine::handle(const http::Request& request,
                                                  const core::CancellationToken& cancel,
                                                  std::string_view correlation_id) {
    control::RequestTimer timer(metrics_);

    auto finish = [this](http::Response response) {
        uint16_t status = response.status_code();
        metrics_.record_status_code(status);
        if (status >= 500) {
            metrics_.record_error();
        }
        return std::optional<http::Response>(std::move(response));
    };

    if (auto denied = check_rate_limits(request)) {
        return finish(std::move(*denied));
    }

    const PoolRoute* route = find_route(request.path);
    if (!route) {
        return finish(http::make_error_response(http::StatusCode::NotFound));
    }

    Clock::time_point deadline = deadline_from(Clock::now());

    const CacheRule* rule = nullptr;
    std::string key;
    std::string_view cache_status;
    bool may_store = false;
    CacheFillTicket ticket;

    if (cache_) {
        rule = cache_policy_.match(request);
        if (rule && CachePolicy::should_bypass(*rule, request)) {
            cache_status = "BYPASS";
            metrics_.record_cache_bypass();
            rule = nullptr;
        }
    }

    if (rule) {
        key = CachePolicy::build_key(request, *rule);
        CacheLookup lookup = cache_->get(key);

        if (lookup && lookup.state == CacheEntryState::Fresh) {
            metrics_.record_cache_hit();
            http::Response response = lookup.entry->to_response();
            decorate(response, "HIT", nullptr);
            return finish(std::move(response));
        }

        if (lookup && cache_settings_.background_refresh && refreshers_) {
            // Serve stale now; at most one refresh per key runs in the background
            std::string_view status = cache_status_text(lookup.state);
            if (lookup.state == CacheEntryState::Stale) {
                if (!cache_->try_begin_refresh(key)) {
                    status = "UPDATING";
                } else if (!schedule_refresh(request, *route, *rule, key)) {
                    cache_->end_refresh(key);
                }
            }
            metrics_.record_cache_stale();
            http::Response response = lookup.entry->to_response();
            decorate(response, status, nullptr);
            return finish(std::move(response));
        }

        cache_status = (lookup || lookup.expired) ? "EXPIRED" : "MISS";
        metrics_.record_cache_miss();
        may_store = true;

        ticket = cache_->begin_fill(key);
        if (ticket.is_leader()) {
            // A previous leader may have published between get() and begin_fill()
            CacheLookup again = cache_->get(key);
            if (again && again.state == CacheEntryState::Fresh) {
                ticket.complete(again.entry);
                http::Response response = again.entry->to_response();
                decorate(response, "HIT", nullptr);
                return finish(std::move(response));
            }
        } else {
            auto wait_until = std::min(deadline, Clock::now() + cache_settings_.lock_timeout);
            std::optional<std::shared_ptr<const CacheEntry>> published;
            while (!published) {
                if (cancel.is_cancelled()) {
                    metrics_.record_client_disconnect();
                    return std::nullopt;
                }
                auto now = Clock::now();
                if (now >= wait_until) {
                    break;
                }
                auto left = std::chrono::duration_cast<std::chrono::milliseconds>(wait_until - now);
                published = ticket.wait(std::min(kLockWaitSlice, left + std::chrono::milliseconds(1)));
            }

            if (published && *published) {
                http::Response response = (*published)->to_response();
                decorate(response, "HIT", nullptr);
                return finish(std::move(response));
            }
            if (!published) {
                // Gave up on the lock: forward, but leave the store to the leader
                may_store = false;
                if (auto* logger = logging::get_current_logger()) {
                    LOG_DEBUG(logger, "[CACHE] Lock wait timed out for {}", key);
                }
            }
        }
    }

    ForwardResult result = forward(request, *route, cancel, deadline, correlation_id);
    if (!result.response) {
        return std::nullopt;  // Client gone; the fill ticket releases its waiters
    }

    http::Response response = std::move(*result.response);
    std::shared_ptr<const CacheEntry> entry;
    if (result.from_upstream) {
        sanitize(response);
        if (rule && may_store) {
            entry = store(*rule, key, response);
        }
    }
    if (ticket.is_leader()) {
        ticket.complete(entry);
    }

    decorate(response, cache_status, result.server);
    return finish(std::move(response));
}

std::optional<http::Response> ProxyEngine::check_rate_limits(const http::Request& request) {
    for (auto& zone : zones_) {
        std::string_view key = zone.key.extract(request);
        if (key.empty()) {
            continue;  // Nothing to key on: the zone does not apply
        }

        RateLimitDecision decision = zone.limiter->allow(key);
        if (decision.allowed) {
            continue;
        }

        metrics_.record_rate_limited();
        if (auto* logger = logging::get_current_logger()) {
            LOG_DEBUG(logger, "[RATE] Zone '{}' denied {} {} for key '{}'", zone.name,
                      http::to_string(request.method), request.path, key);
        }

        http::Response response =
            http::make_error_response(static_cast<http::StatusCode>(zone.status));
        int64_t retry_seconds = retry_after_seconds(decision.retry_after);
        response.set_header("Retry-After", fmt::format("{}", retry_seconds));
        return response;
    }
    return std::nullopt;
}

ProxyEngine::ForwardResult ProxyEngine::forward(const http::Request& request,
                                                const PoolRoute& route,
                                                const core::CancellationToken& cancel,
                                                Clock::time_point deadline,
                                                std::string_view correlation_id) {
    ForwardResult result;
    UpstreamPool& pool = *route.pool;
    auto* logger = logging::get_current_logger();

    std::string_view hash_key = route.hash_key.extract(request);
    bool retry_after_send = http::is_idempotent(request.method) || options_.retry_non_idempotent;
    uint32_t max_attempts = std::max<uint32_t>(1, options_.max_attempts);

    ExcludedServers excluded;
    bool reached = false;
    std::error_code last_error;

    for (uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
        if (cancel.is_cancelled()) {
            metrics_.record_client_disconnect();
            return result;
        }
        if (Clock::now() >= deadline) {
            last_error = ProxyErrc::deadline_exceeded;
            break;
        }

        UpstreamServer* server = pool.select(hash_key, excluded);
        if (!server) {
            if (!reached) {
                metrics_.record_no_healthy_upstream();
                if (logger) {
                    LOG_ERROR(logger, "[PROXY] No healthy upstream in pool '{}' (correlation_id={})",
                              pool.name(), correlation_id);
                }
                result.response = http::make_error_response(http::StatusCode::ServiceUnavailable);
                return result;
            }
            break;  // Every candidate already tried
        }
        reached = true;

        metrics_.record_upstream_attempt();
        if (attempt > 1) {
            metrics_.record_upstream_retry();
        }
        if (logger && server->role() == ServerRole::Backup) {
            LOG_UPSTREAM(logger, "backup selected", pool.name(), server->host(), server->port(),
                         correlation_id);
        }

        ExchangeTimeouts timeouts;
        timeouts.connect = options_.connect_timeout;
        timeouts.send = options_.send_timeout;
        timeouts.read = options_.read_timeout;
        timeouts.deadline = deadline;

        ExchangeResult exchange;
        {
            ConnectionManager::ActiveAttempt active(*server);
            exchange = transport_.exchange(*server, request, timeouts, cancel);
        }

        if (exchange.error) {
            if (exchange.error == ProxyErrc::client_disconnected || cancel.is_cancelled()) {
                metrics_.record_client_disconnect();
                return result;
            }
            last_error = exchange.error;
            if (exchange.error == ProxyErrc::deadline_exceeded) {
                break;
            }

            health_.report_failure(pool, *server, exchange.error);
            metrics_.record_upstream_failure();
            excluded.insert(server);

            bool can_retry = retry_after_send || failed_before_send(exchange.error);
            if (logger) {
                LOG_WARNING(logger,
                            "[PROXY] Attempt {}/{} to {} in pool '{}' failed: {}{} "
                            "(correlation_id={})",
                            attempt, max_attempts, server->address(), pool.name(),
                            exchange.error.message(),
                            can_retry ? "" : ", not retrying non-idempotent request",
                            correlation_id);
            }
            if (!can_retry) {
                break;
            }
            continue;
        }

        uint16_t status = exchange.response.status_code();
        if (is_failure(status)) {
            health_.report_failure(pool, *server, ProxyErrc::bad_status);
            metrics_.record_upstream_failure();
        } else {
            health_.report_success(pool, *server);
        }

        if (is_retriable(status) && retry_after_send) {
            last_error = ProxyErrc::bad_status;
            excluded.insert(server);
            if (logger) {
                LOG_WARNING(logger,
                            "[PROXY] Attempt {}/{} to {} in pool '{}' returned {} "
                            "(correlation_id={})",
                            attempt, max_attempts, server->address(), pool.name(), status,
                            correlation_id);
            }
            continue;
        }

        result.response = std::move(exchange.response);
        result.from_upstream = true;
        result.server = server;
        return result;
    }

    if (last_error == ProxyErrc::deadline_exceeded) {
        metrics_.record_timeout();
        if (logger) {
            LOG_ERROR_CTX(logger, "[PROXY] Request deadline exceeded", correlation_id, 504,
                          pool.name());
        }
        result.response = http::make_error_response(http::StatusCode::GatewayTimeout);
        return result;
    }

    if (logger) {
        LOG_ERROR_CTX(logger, "[PROXY] Upstream attempts exhausted", correlation_id, 502,
                      fmt::format("pool={}, last_error={}", pool.name(),
                                  last_error ? last_error.message() : "none"));
    }
    result.response = http::make_error_response(http::StatusCode::BadGateway);
    return result;
}

std::shared_ptr<const CacheEntry> ProxyEngine::store(const CacheRule& rule, const std::string& key,
                                                     const http::Response& response) {
    auto ttl = CachePolicy::ttl_for(rule, response);
    if (!ttl) {
        return nullptr;
    }

    if (response.body.size() > rule.max_entry_size) {
        metrics_.record_cache_store_failure();
        if (auto* logger = logging::get_current_logger()) {
            LOG_WARNING(logger, "[CACHE] Not storing {}: body of {} bytes exceeds {} bytes", key,
                        response.body.size(), rule.max_entry_size);
        }
        return nullptr;
    }

    auto entry = std::make_shared<CacheEntry>();
    entry->key = key;
    entry->status = response.status_code();
    entry->headers = response.headers;
    entry->body = response.body;
    entry->created_at = cache_->now();
    entry->ttl = *ttl;

    if (std::error_code ec = cache_->put(entry)) {
        metrics_.record_cache_store_failure();
        if (auto* logger = logging::get_current_logger()) {
            LOG_WARNING(logger, "[CACHE] Failed to store {}: {}", key, ec.message());
        }
        return nullptr;
    }
    return entry;
}

bool ProxyEngine::schedule_refresh(const http::Request& request, const PoolRoute& route,
                                   const CacheRule& rule, const std::string& key) {
    const PoolRoute* route_ptr = &route;
    const CacheRule* rule_ptr = &rule;

    bool queued = refreshers_->try_submit(
        [this, request, route_ptr, rule_ptr, key](const core::CancellationToken& cancel) {
            metrics_.record_background_refresh();
            ForwardResult result =
                forward(request, *route_ptr, cancel, deadline_from(Clock::now()), {});

            bool stored = false;
            if (result.response && result.from_upstream) {
                sanitize(*result.response);
                stored = store(*rule_ptr, key, *result.response) != nullptr;
            }
            if (!stored) {
                cache_->end_refresh(key);
            }
        });

    if (!queued) {
        if (auto* logger = logging::get_current_logger()) {
            LOG_DEBUG(logger, "[CACHE] Refresh queue full, serving stale {} without refresh", key);
        }
    }
    return queued;
}

void ProxyEngine::sanitize(http::Response& response) const {
    auto hidden = [this](const std::string& name) {
        if (http::is_hop_by_hop_header(name)) {
            return true;
        }
        std::string lowered = core::to_lower(name);
        return std::any_of(options_.hide_headers.begin(), options_.hide_headers.end(),
                           [&lowered](const std::string& pattern) {
                               return core::glob_match(pattern, lowered);
                           });
    };
    response.headers.erase(
        std::remove_if(response.headers.begin(), response.headers.end(),
                       [&hidden](const http::Header& header) { return hidden(header.name); }),
        response.headers.end());
}

void ProxyEngine::decorate(http::Response& response, std::string_view cache_status,
                           const UpstreamServer* server) const {
    if (options_.diagnostic_headers && !cache_status.empty()) {
        response.set_header("X-Cache-Status", cache_status);
    }
    if (options_.expose_upstream_address && server) {
        response.set_header("X-Upstream-Addr", server->address());
    }
}

}  // namespace harbor::gateway

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


// Harbor Health Checker - Implementation

#include "health_checker.hpp"

#include <algorithm>

#include "../core/logging.hpp"
#include "errors.hpp"
#include "upstream_client.hpp"

namespace harbor::gateway {

bool HttpHealthProber::probe(UpstreamServer& server, const ActiveCheckParams& params) {
    http::Request request;
    request.method = http::Method::GET;
    request.path = params.path.empty() ? "/" : params.path;
    request.host = server.address();
    request.headers.push_back({"User-Agent", "harbor-health-check"});

    ExchangeTimeouts timeouts;
    timeouts.connect = params.timeout;
    timeouts.send = params.timeout;
    timeouts.read = params.timeout;
    timeouts.deadline = Clock::now() + params.timeout;

    ExchangeResult result = transport_.exchange(server, request, timeouts, core::CancellationToken{});
    if (result.error) {
        return false;
    }

    uint16_t status = result.response.status_code();
    if (!params.expected_statuses.empty()) {
        return std::find(params.expected_statuses.begin(), params.expected_statuses.end(),
                         status) != params.expected_statuses.end();
    }
    return status >= 200 && status < 400;
}

HealthChecker::HealthChecker(std::vector<std::shared_ptr<UpstreamPool>> pools,
                             std::shared_ptr<HealthProber> prober)
    : pools_(std::move(pools)), prober_(std::move(prober)) {}

HealthChecker::~HealthChecker() {
    stop();
}

void HealthChecker::report_success(const UpstreamPool& pool, UpstreamServer& server) {
    if (!server.record_success()) {
        return;
    }
    if (auto* logger = logging::get_current_logger()) {
        LOG_INFO(logger, "[HEALTH] {} in pool '{}' recovered, marked healthy", server.address(),
                 pool.name());
    }
}

void HealthChecker::report_failure(const UpstreamPool& pool, UpstreamServer& server,
                                   std::error_code reason, Clock::time_point now) {
    if (reason == ProxyErrc::client_disconnected || !is_upstream_failure(reason)) {
        return;
    }

    if (!server.record_failure(now)) {
        return;
    }
    if (auto* logger = logging::get_current_logger()) {
        LOG_WARNING(logger,
                    "[HEALTH] {} in pool '{}' marked unhealthy after {} failure(s) ({}), "
                    "retry in {}ms",
                    server.address(), pool.name(), server.failure_count(), reason.message(),
                    server.effective_fail_timeout().count());
    }
}

size_t HealthChecker::run_probes_once(Clock::time_point now) {
    if (!prober_) {
        return 0;
    }

    size_t probes = 0;
    for (const auto& pool : pools_) {
        const ActiveCheckParams& params = pool->options().active_check;
        if (!params.enabled) {
            continue;
        }

        {
            std::lock_guard lock(schedule_mutex_);
            auto it = next_probe_.find(pool.get());
            if (it != next_probe_.end() && now < it->second) {
                continue;
            }
            next_probe_[pool.get()] = now + params.interval;
        }

        for (const auto& server : pool->servers()) {
            if (server->state() != ServerState::Unhealthy) {
                continue;
            }
            ++probes;
            if (prober_->probe(*server, params)) {
                report_success(*pool, *server);
            } else {
                report_failure(*pool, *server, ProxyErrc::bad_status, Clock::now());
                if (auto* logger = logging::get_current_logger()) {
                    LOG_DEBUG(logger, "[HEALTH] Probe of {} in pool '{}' failed", server->address(),
                              pool->name());
                }
            }
        }
    }
    return probes;
}

void HealthChecker::start() {
    if (!prober_) {
        return;
    }
    bool any_enabled = std::any_of(pools_.begin(), pools_.end(), [](const auto& pool) {
        return pool->options().active_check.enabled;
    });
    if (!any_enabled) {
        return;
    }

    std::lock_guard lock(thread_mutex_);
    if (thread_.joinable()) {
        return;
    }
    stopping_ = false;
    thread_ = std::thread([this] { probe_loop(); });

    if (auto* logger = logging::get_current_logger()) {
        LOG_INFO(logger, "[HEALTH] Active health checks started");
    }
}

void HealthChecker::stop() {
    std::thread thread;
    {
        std::lock_guard lock(thread_mutex_);
        stopping_ = true;
        thread = std::move(thread_);
    }
    wake_.notify_all();
    if (thread.joinable()) {
        thread.join();
    }
}

void HealthChecker::probe_loop() {
    std::chrono::milliseconds tick{1000};
    for (const auto& pool : pools_) {
        const auto& params = pool->options().active_check;
        if (params.enabled && params.interval.count() > 0) {
            tick = std::min(tick, params.interval);
        }
    }

    std::unique_lock lock(thread_mutex_);
    while (!stopping_) {
        wake_.wait_for(lock, tick, [this] { return stopping_; });
        if (stopping_) {
            break;
        }
        lock.unlock();
        run_probes_once(Clock::now());
        lock.lock();
    }
}

}  // namespace harbor::gateway

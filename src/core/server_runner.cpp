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

// Harbor Server Runner - Implementation

#include "server_runner.hpp"

#include <algorithm>
#include <stdexcept>

#include "logging.hpp"

namespace harbor::core {

namespace {

constexpr std::chrono::seconds kMaintenanceTick{1};
constexpr std::chrono::seconds kPoolStatsInterval{60};
constexpr std::chrono::milliseconds kMainLoopPoll{100};

}  // namespace

ListenerOptions build_listener_options(const control::ServerConfig& config) {
    ListenerOptions options;
    options.address = config.listen_address;
    options.port = config.listen_port;
    options.backlog = static_cast<int>(config.backlog);
    options.max_connections = config.max_connections;
    options.max_request_size = config.max_request_size;
    options.max_header_size = config.max_header_size;
    options.client_read_timeout = std::chrono::milliseconds(config.client_read_timeout);
    options.keepalive_timeout = std::chrono::milliseconds(config.keepalive_timeout);
    options.shutdown_timeout = std::chrono::milliseconds(config.shutdown_timeout);
    options.max_keepalive_requests = config.max_keepalive_requests;
    return options;
}

ServerRunner::ServerRunner(control::Config config) : config_(std::move(config)) {}

ServerRunner::~ServerRunner() {
    stop();
}

std::error_code ServerRunner::start() {
    if (running_.exchange(true)) {
        return std::make_error_code(std::errc::operation_in_progress);
    }

    try {
        gateway_ = gateway::build_gateway(config_, metrics_);
    } catch (const std::invalid_argument& e) {
        if (auto* logger = logging::get_current_logger()) {
            LOG_ERROR(logger, "Invalid gateway configuration: {}", e.what());
        }
        running_.store(false);
        return std::make_error_code(std::errc::invalid_argument);
    }

    if (gateway_->refreshers) {
        gateway_->refreshers->start();
    }
    gateway_->health->start();

    {
        std::lock_guard lock(maintenance_mutex_);
        stopping_ = false;
    }
    maintenance_thread_ = std::thread([this] { maintenance_loop(); });

    if (config_.admin.enabled) {
        admin_ = std::make_unique<AdminServer>(config_.admin, gateway_->pools, metrics_,
                                               gateway_->cache);
        if (auto ec = admin_->start(); ec) {
            if (auto* logger = logging::get_current_logger()) {
                LOG_ERROR(logger, "Admin endpoint failed to start on {}:{}: {}",
                          config_.admin.address, config_.admin.port, ec.message());
            }
            stop();
            return ec;
        }
        admin_thread_ = std::thread([this] { admin_->run(); });
    }

    gateway::ProxyEngine* engine = gateway_->engine.get();
    listener_ = std::make_unique<Listener>(
        build_listener_options(config_.server),
        [engine](const http::Request& request, const CancellationToken& cancel,
                 std::string_view correlation_id) {
            return engine->handle(request, cancel, correlation_id);
        },
        metrics_);

    if (auto ec = listener_->start(); ec) {
        if (auto* logger = logging::get_current_logger()) {
            LOG_ERROR(logger, "Listener failed to start on {}:{}: {}",
                      config_.server.listen_address, config_.server.listen_port, ec.message());
        }
        stop();
        return ec;
    }

    return {};
}

void ServerRunner::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    // Listener first so no new work reaches the engine
    if (listener_) {
        listener_->stop();
    }

    if (admin_) {
        admin_->stop();
        if (admin_thread_.joinable()) {
            admin_thread_.join();
        }
    }

    if (gateway_) {
        if (gateway_->refreshers) {
            gateway_->refreshers->stop();
        }
        gateway_->health->stop();
    }

    {
        std::lock_guard lock(maintenance_mutex_);
        stopping_ = true;
    }
    maintenance_cv_.notify_all();
    if (maintenance_thread_.joinable()) {
        maintenance_thread_.join();
    }

    if (gateway_) {
        gateway_->connections->pool().log_stats();
        gateway_->connections->pool().clear();
    }

    if (auto* logger = logging::get_current_logger()) {
        auto snap = metrics_.snapshot();
        LOG_INFO(logger, "Server stopped: requests={}, errors={}, cache_hit_ratio={:.3f}",
                 snap.total_requests, snap.total_errors, snap.cache_hit_ratio());
    }
}

void ServerRunner::run_maintenance_once(bool log_stats) {
    if (!gateway_) {
        return;
    }

    size_t swept = 0;
    if (gateway_->cache) {
        swept = gateway_->cache->sweep_expired();
    }
    size_t closed = gateway_->connections->cleanup_stale();

    if (auto* logger = logging::get_current_logger()) {
        if (swept > 0 || closed > 0) {
            LOG_DEBUG(logger, "Maintenance: swept {} cache entries, closed {} idle connections",
                      swept, closed);
        }
    }

    if (log_stats) {
        gateway_->connections->pool().log_stats();
    }
}

void ServerRunner::maintenance_loop() {
    auto sweep_interval = std::chrono::seconds(std::max<uint32_t>(config_.cache.sweep_interval, 1));
    auto next_sweep = std::chrono::steady_clock::now() + sweep_interval;
    auto next_stats = std::chrono::steady_clock::now() + kPoolStatsInterval;

    std::unique_lock lock(maintenance_mutex_);
    while (!stopping_) {
        maintenance_cv_.wait_for(lock, kMaintenanceTick, [this] { return stopping_; });
        if (stopping_) {
            break;
        }
        lock.unlock();

        auto now = std::chrono::steady_clock::now();
        bool log_stats = now >= next_stats;
        if (log_stats) {
            next_stats = now + kPoolStatsInterval;
        }

        if (now >= next_sweep) {
            next_sweep = now + sweep_interval;
            run_maintenance_once(log_stats);
        } else {
            // Idle connections are checked every tick, the cache only on its interval
            gateway_->connections->cleanup_stale();
            if (log_stats) {
                gateway_->connections->pool().log_stats();
            }
        }

        lock.lock();
    }
}

std::error_code run_server(const control::Config& config, const std::atomic<bool>& running) {
    ServerRunner runner(config);
    if (auto ec = runner.start(); ec) {
        return ec;
    }

    while (running.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(kMainLoopPoll);
    }

    if (auto* logger = logging::get_current_logger()) {
        LOG_INFO(logger, "Shutdown requested, draining connections");
    }
    runner.stop();
    return {};
}

}  // namespace harbor::core

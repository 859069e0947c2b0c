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

// Harbor Server Runner - Header
// Wires configuration into the gateway, listener, admin endpoint and maintenance

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>

#include "../control/config.hpp"
#include "../control/metrics.hpp"
#include "../gateway/factory.hpp"
#include "admin_server.hpp"
#include "listener.hpp"

namespace harbor::core {

[[nodiscard]] ListenerOptions build_listener_options(const control::ServerConfig& config);

class ServerRunner {
public:
    explicit ServerRunner(control::Config config);
    ~ServerRunner();

    ServerRunner(const ServerRunner&) = delete;
    ServerRunner& operator=(const ServerRunner&) = delete;

    /// Build components and start every thread; nothing is left running on error
    [[nodiscard]] std::error_code start();

    /// Stop in dependency order: listener, admin, refreshers, probes, maintenance
    void stop();

    /// One maintenance pass: cache sweep, idle connection cleanup, pool stats
    void run_maintenance_once(bool log_stats = false);

    [[nodiscard]] uint16_t port() const noexcept { return listener_ ? listener_->port() : 0; }
    [[nodiscard]] uint16_t admin_port() const noexcept { return admin_ ? admin_->port() : 0; }

    [[nodiscard]] gateway::Gateway* gateway() noexcept { return gateway_.get(); }
    [[nodiscard]] control::ProxyMetrics& metrics() noexcept { return metrics_; }

private:
    void maintenance_loop();

    control::Config config_;
    control::ProxyMetrics metrics_;

    std::unique_ptr<gateway::Gateway> gateway_;
    std::unique_ptr<Listener> listener_;
    std::unique_ptr<AdminServer> admin_;
    std::thread admin_thread_;

    std::mutex maintenance_mutex_;
    std::condition_variable maintenance_cv_;
    bool stopping_ = false;
    std::thread maintenance_thread_;

    std::atomic<bool> running_{false};
};

/// Run until `running` turns false (set by the signal handler)
[[nodiscard]] std::error_code run_server(const control::Config& config,
                                         const std::atomic<bool>& running);

}  // namespace harbor::core

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


// Harbor Health Checker - Header
// Passive failure accounting and active probing of unhealthy servers

#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "../core/containers.hpp"
#include "upstream.hpp"

namespace harbor::gateway {

class UpstreamTransport;

/// Issues one synthetic request to a server
class HealthProber {
public:
    virtual ~HealthProber() = default;

    /// True if the server answered with an acceptable status in time
    [[nodiscard]] virtual bool probe(UpstreamServer& server, const ActiveCheckParams& params) = 0;
};

/// GET <path> over a transport; 2xx/3xx (or expected_statuses) is success
class HttpHealthProber final : public HealthProber {
public:
    explicit HttpHealthProber(UpstreamTransport& transport) : transport_(transport) {}

    [[nodiscard]] bool probe(UpstreamServer& server, const ActiveCheckParams& params) override;

private:
    UpstreamTransport& transport_;
};

/// Sole writer of server health fields.
///
/// Passive mode: ProxyEngine reports every attempt outcome. Client
/// disconnects are dropped here so they never count against a server.
///
/// Active mode: for pools with health_check.enabled, a background thread
/// probes unhealthy servers every interval. Healthy servers are never probed.
class HealthChecker {
public:
    explicit HealthChecker(std::vector<std::shared_ptr<UpstreamPool>> pools,
                           std::shared_ptr<HealthProber> prober = nullptr);
    ~HealthChecker();

    HealthChecker(const HealthChecker&) = delete;
    HealthChecker& operator=(const HealthChecker&) = delete;

    /// Attempt succeeded: reset the failure count, recover if unhealthy
    void report_success(const UpstreamPool& pool, UpstreamServer& server);

    /// Attempt failed with reason (a ProxyErrc value)
    void report_failure(const UpstreamPool& pool, UpstreamServer& server, std::error_code reason,
                        Clock::time_point now = Clock::now());

    /// Probe unhealthy servers of every enabled pool whose interval elapsed.
    /// Returns the number of probes issued.
    size_t run_probes_once(Clock::time_point now = Clock::now());

    /// Start the probe thread (no-op without a prober or enabled pool)
    void start();
    void stop();

    [[nodiscard]] const std::vector<std::shared_ptr<UpstreamPool>>& pools() const noexcept {
        return pools_;
    }

private:
    void probe_loop();

    std::vector<std::shared_ptr<UpstreamPool>> pools_;
    std::shared_ptr<HealthProber> prober_;

    std::mutex schedule_mutex_;
    core::fast_map<const UpstreamPool*, Clock::time_point> next_probe_;

    std::mutex thread_mutex_;
    std::condition_variable wake_;
    bool stopping_ = false;
    std::thread thread_;
};

}  // namespace harbor::gateway

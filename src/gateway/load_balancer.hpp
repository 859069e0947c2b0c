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


// Harbor Load Balancer - Header
// Selection strategies over one group (primaries or backups) of a pool

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <span>
#include <string_view>
#include <vector>

#include "upstream.hpp"

namespace harbor::gateway {

/// Predicate deciding whether a server may take this attempt
using EligibilityFilter = std::function<bool(const UpstreamServer&)>;

/// Load balancer interface. One instance per group, created at pool
/// construction; select() is called concurrently from request threads.
class LoadBalancer {
public:
    virtual ~LoadBalancer() = default;

    /// Returns an eligible server or nullptr
    [[nodiscard]] virtual UpstreamServer* select(const EligibilityFilter& eligible,
                                                 std::string_view hash_key) = 0;
};

/// Round-robin: the cursor advances once per call, ineligible servers are skipped
class RoundRobinBalancer : public LoadBalancer {
public:
    explicit RoundRobinBalancer(std::vector<UpstreamServer*> group);

    [[nodiscard]] UpstreamServer* select(const EligibilityFilter& eligible,
                                         std::string_view hash_key) override;

private:
    std::vector<UpstreamServer*> group_;
    std::atomic<uint64_t> cursor_{0};
};

/// Smooth weighted round-robin: each round adds every eligible server's weight
/// to its current weight, picks the largest and subtracts the round total from
/// it. Weights [5,1,1] yield A A B A C A A rather than A A A A A B C.
class WeightedRoundRobinBalancer : public LoadBalancer {
public:
    explicit WeightedRoundRobinBalancer(std::vector<UpstreamServer*> group);

    [[nodiscard]] UpstreamServer* select(const EligibilityFilter& eligible,
                                         std::string_view hash_key) override;

private:
    std::vector<UpstreamServer*> group_;
    std::vector<int64_t> current_weights_;
    std::mutex mutex_;  // Guards current_weights_ for the arithmetic only
};

/// Fewest active connections; ties go to the first server after the cursor
class LeastConnectionsBalancer : public LoadBalancer {
public:
    explicit LeastConnectionsBalancer(std::vector<UpstreamServer*> group);

    [[nodiscard]] UpstreamServer* select(const EligibilityFilter& eligible,
                                         std::string_view hash_key) override;

private:
    std::vector<UpstreamServer*> group_;
    std::atomic<uint64_t> cursor_{0};
};

/// servers[hash(key) % N] over the currently eligible servers
class IpHashBalancer : public LoadBalancer {
public:
    explicit IpHashBalancer(std::vector<UpstreamServer*> group);

    [[nodiscard]] UpstreamServer* select(const EligibilityFilter& eligible,
                                         std::string_view hash_key) override;

private:
    std::vector<UpstreamServer*> group_;
};

/// Consistent hashing on a ring of virtual nodes (points per unit of weight).
/// A key maps to the first eligible server clockwise from its hash, so losing
/// one server only moves the keys that server owned.
class ConsistentHashBalancer : public LoadBalancer {
public:
    static constexpr size_t kPointsPerWeight = 160;

    explicit ConsistentHashBalancer(std::vector<UpstreamServer*> group);

    [[nodiscard]] UpstreamServer* select(const EligibilityFilter& eligible,
                                         std::string_view hash_key) override;

    [[nodiscard]] size_t ring_size() const noexcept { return ring_.size(); }

private:
    std::map<uint32_t, UpstreamServer*> ring_;  // Immutable after construction
};

/// Strategy factory, resolved once per pool group
[[nodiscard]] std::unique_ptr<LoadBalancer> make_load_balancer(BalancingPolicy policy,
                                                               std::vector<UpstreamServer*> group);

}  // namespace harbor::gateway

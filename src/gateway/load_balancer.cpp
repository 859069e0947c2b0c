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


// Harbor Load Balancer - Implementation

#include "load_balancer.hpp"

#include <fmt/format.h>

#include <limits>

#include "../core/hash.hpp"

namespace harbor::gateway {

// RoundRobinBalancer

RoundRobinBalancer::RoundRobinBalancer(std::vector<UpstreamServer*> group)
    : group_(std::move(group)) {}

UpstreamServer* RoundRobinBalancer::select(const EligibilityFilter& eligible,
                                           std::string_view /*hash_key*/) {
    if (group_.empty()) {
        return nullptr;
    }

    // One cursor step per call; skipped servers keep their logical slot
    size_t start = cursor_.fetch_add(1, std::memory_order_relaxed) % group_.size();

    for (size_t i = 0; i < group_.size(); ++i) {
        UpstreamServer* server = group_[(start + i) % group_.size()];
        if (eligible(*server)) {
            return server;
        }
    }
    return nullptr;
}

// WeightedRoundRobinBalancer

WeightedRoundRobinBalancer::WeightedRoundRobinBalancer(std::vector<UpstreamServer*> group)
    : group_(std::move(group)), current_weights_(group_.size(), 0) {}

UpstreamServer* WeightedRoundRobinBalancer::select(const EligibilityFilter& eligible,
                                                   std::string_view /*hash_key*/) {
    // Evaluate eligibility outside the lock
    std::vector<bool> usable(group_.size());
    bool any = false;
    for (size_t i = 0; i < group_.size(); ++i) {
        usable[i] = eligible(*group_[i]);
        any = any || usable[i];
    }
    if (!any) {
        return nullptr;
    }

    std::lock_guard lock(mutex_);

    int64_t total = 0;
    size_t best = group_.size();
    for (size_t i = 0; i < group_.size(); ++i) {
        if (!usable[i]) {
            continue;
        }
        int64_t weight = group_[i]->weight();
        current_weights_[i] += weight;
        total += weight;
        if (best == group_.size() || current_weights_[i] > current_weights_[best]) {
            best = i;
        }
    }

    current_weights_[best] -= total;
    return group_[best];
}

// LeastConnectionsBalancer

LeastConnectionsBalancer::LeastConnectionsBalancer(std::vector<UpstreamServer*> group)
    : group_(std::move(group)) {}

UpstreamServer* LeastConnectionsBalancer::select(const EligibilityFilter& eligible,
                                                 std::string_view /*hash_key*/) {
    if (group_.empty()) {
        return nullptr;
    }

    size_t start = cursor_.fetch_add(1, std::memory_order_relaxed) % group_.size();

    UpstreamServer* best = nullptr;
    uint32_t best_connections = std::numeric_limits<uint32_t>::max();

    for (size_t i = 0; i < group_.size(); ++i) {
        UpstreamServer* server = group_[(start + i) % group_.size()];
        if (!eligible(*server)) {
            continue;
        }
        uint32_t connections = server->active_connections();
        // Strict comparison keeps the earliest server in rotation order on ties
        if (connections < best_connections) {
            best = server;
            best_connections = connections;
        }
    }
    return best;
}

// IpHashBalancer

IpHashBalancer::IpHashBalancer(std::vector<UpstreamServer*> group) : group_(std::move(group)) {}

UpstreamServer* IpHashBalancer::select(const EligibilityFilter& eligible,
                                       std::string_view hash_key) {
    std::vector<UpstreamServer*> candidates;
    candidates.reserve(group_.size());
    for (UpstreamServer* server : group_) {
        if (eligible(*server)) {
            candidates.push_back(server);
        }
    }
    if (candidates.empty()) {
        return nullptr;
    }

    uint64_t hash = core::fnv1a_64(hash_key);
    return candidates[hash % candidates.size()];
}

// ConsistentHashBalancer

ConsistentHashBalancer::ConsistentHashBalancer(std::vector<UpstreamServer*> group) {
    for (UpstreamServer* server : group) {
        // Each digest yields four 32-bit points
        size_t digests = (server->weight() * kPointsPerWeight) / 4;
        for (size_t i = 0; i < digests; ++i) {
            auto digest = core::md5(fmt::format("{}-{}", server->address(), i));
            for (size_t p = 0; p < 4; ++p) {
                ring_.emplace(core::md5_point(digest, p), server);
            }
        }
    }
}

UpstreamServer* ConsistentHashBalancer::select(const EligibilityFilter& eligible,
                                               std::string_view hash_key) {
    if (ring_.empty()) {
        return nullptr;
    }

    uint32_t point = core::md5_point(core::md5(hash_key));
    auto it = ring_.lower_bound(point);

    // Walk clockwise past ineligible servers, at most one full turn
    for (size_t steps = 0; steps < ring_.size(); ++steps) {
        if (it == ring_.end()) {
            it = ring_.begin();
        }
        if (eligible(*it->second)) {
            return it->second;
        }
        ++it;
    }
    return nullptr;
}

std::unique_ptr<LoadBalancer> make_load_balancer(BalancingPolicy policy,
                                                 std::vector<UpstreamServer*> group) {
    switch (policy) {
        case BalancingPolicy::RoundRobin:
            return std::make_unique<RoundRobinBalancer>(std::move(group));
        case BalancingPolicy::WeightedRoundRobin:
            return std::make_unique<WeightedRoundRobinBalancer>(std::move(group));
        case BalancingPolicy::LeastConnections:
            return std::make_unique<LeastConnectionsBalancer>(std::move(group));
        case BalancingPolicy::IpHash:
            return std::make_unique<IpHashBalancer>(std::move(group));
        case BalancingPolicy::ConsistentHash:
            return std::make_unique<ConsistentHashBalancer>(std::move(group));
    }
    return std::make_unique<RoundRobinBalancer>(std::move(group));
}

}  // namespace harbor::gateway

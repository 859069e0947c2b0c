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


// Harbor Rate Limiting - Implementation

#include "rate_limit.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

#include "../core/hash.hpp"

namespace harbor::gateway {

// TokenBucket implementation

TokenBucket::TokenBucket(double capacity, double refill_rate, RateClock::time_point now)
    : capacity_(capacity)
    , refill_rate_(refill_rate)
    , tokens_(capacity)
    , last_refill_(now) {
    if (!std::isfinite(refill_rate) || refill_rate <= 0.0) {
        throw std::invalid_argument(
            fmt::format("token bucket refill rate {} must be > 0", refill_rate));
    }
}

bool TokenBucket::consume(RateClock::time_point now, double tokens) {
    std::lock_guard lock(mutex_);
    refill(now);

    if (tokens_ >= tokens) {
        tokens_ -= tokens;
        return true;  // Successfully consumed
    }

    return false;  // Not enough tokens
}

double TokenBucket::available(RateClock::time_point now) {
    std::lock_guard lock(mutex_);
    refill(now);
    return tokens_;
}

std::chrono::milliseconds TokenBucket::time_until_available(RateClock::time_point now) {
    std::lock_guard lock(mutex_);
    refill(now);
    if (tokens_ >= 1.0) {
        return std::chrono::milliseconds::zero();
    }
    double ms = std::ceil((1.0 - tokens_) / refill_rate_ * 1000.0);
    // Saturate instead of overflowing the cast for very slow rates
    constexpr auto kMaxMs = std::numeric_limits<int64_t>::max() / 2;
    if (!(ms < static_cast<double>(kMaxMs))) {
        return std::chrono::milliseconds(kMaxMs);
    }
    return std::chrono::milliseconds(static_cast<int64_t>(ms));
}

void TokenBucket::reset(RateClock::time_point now) {
    std::lock_guard lock(mutex_);
    tokens_ = capacity_;
    last_refill_ = now;
}

void TokenBucket::refill(RateClock::time_point now) {
    if (now <= last_refill_) {
        return;  // No time has passed (or the caller's clock lags)
    }

    std::chrono::duration<double> elapsed = now - last_refill_;
    last_refill_ = now;

    // Add tokens (capped at capacity)
    tokens_ = std::min(tokens_ + elapsed.count() * refill_rate_, capacity_);
}

int64_t retry_after_seconds(std::chrono::milliseconds retry_after) noexcept {
    int64_t ms = retry_after.count();
    int64_t seconds = ms / 1000 + (ms % 1000 > 0 ? 1 : 0);
    return std::max<int64_t>(1, seconds);
}

// RateLimiter implementation

RateLimiter::RateLimiter(double capacity, double refill_rate, size_t max_keys, TimeSource now)
    : capacity_(capacity)
    , refill_rate_(refill_rate)
    , max_keys_per_shard_(max_keys == 0 ? 0 : (max_keys + kShardCount - 1) / kShardCount)
    , now_(std::move(now)) {
    if (!std::isfinite(capacity) || capacity < 1.0) {
        throw std::invalid_argument(fmt::format("rate limit capacity {} must be >= 1", capacity));
    }
    if (!std::isfinite(refill_rate) || refill_rate <= 0.0) {
        throw std::invalid_argument(
            fmt::format("rate limit refill rate {} must be > 0", refill_rate));
    }
}

RateLimiter::Shard& RateLimiter::shard_for(std::string_view key) noexcept {
    return shards_[core::fnv1a_64(key) % kShardCount];
}

std::shared_ptr<TokenBucket> RateLimiter::bucket_for(std::string_view key, bool create) {
    Shard& shard = shard_for(key);
    std::string key_str{key};

    std::lock_guard lock(shard.mutex);
    auto it = shard.buckets.find(key_str);
    if (it != shard.buckets.end()) {
        // Touch: move to the front of the LRU list
        shard.lru.splice(shard.lru.begin(), shard.lru, it->second.lru_position);
        return it->second.bucket;
    }
    if (!create) {
        return nullptr;
    }

    if (max_keys_per_shard_ > 0 && shard.buckets.size() >= max_keys_per_shard_) {
        // Evict the idle-longest key; its holder (if any) keeps its shared_ptr
        shard.buckets.erase(shard.lru.back());
        shard.lru.pop_back();
    }

    auto bucket = std::make_shared<TokenBucket>(capacity_, refill_rate_, now());
    shard.lru.push_front(key_str);
    shard.buckets.emplace(std::move(key_str), Slot{bucket, shard.lru.begin()});
    return bucket;
}

RateLimitDecision RateLimiter::allow(std::string_view key) {
    auto bucket = bucket_for(key, true);

    auto t = now();
    if (bucket->consume(t)) {
        return {};
    }
    return {false, bucket->time_until_available(t)};
}

void RateLimiter::reset(std::string_view key) {
    if (auto bucket = bucket_for(key, false)) {
        bucket->reset(now());
    }
}

void RateLimiter::clear() {
    for (auto& shard : shards_) {
        std::lock_guard lock(shard.mutex);
        shard.buckets.clear();
        shard.lru.clear();
    }
}

size_t RateLimiter::key_count() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard lock(shard.mutex);
        total += shard.buckets.size();
    }
    return total;
}

double RateLimiter::available(std::string_view key) {
    auto bucket = bucket_for(key, false);
    if (!bucket) {
        return capacity_;  // New key would have full capacity
    }
    return bucket->available(now());
}

} // namespace harbor::gateway

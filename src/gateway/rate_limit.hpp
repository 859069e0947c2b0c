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


// Harbor Rate Limiting - Header
// Per-key token buckets shared by all request threads

#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "../core/containers.hpp"
#include "request_key.hpp"

namespace harbor::gateway {

using RateClock = std::chrono::steady_clock;

/// Time source, injectable for tests
using TimeSource = std::function<RateClock::time_point()>;

/// Token bucket with continuous refill. Safe for concurrent callers; each
/// bucket has its own lock so different keys never contend.
class TokenBucket {
public:
    /// Create a token bucket
    /// @param capacity Maximum number of tokens (burst size)
    /// @param refill_rate Tokens added per second (throws std::invalid_argument unless > 0)
    TokenBucket(double capacity, double refill_rate, RateClock::time_point now);

    ~TokenBucket() = default;

    // Non-copyable, non-movable (holds a mutex)
    TokenBucket(const TokenBucket&) = delete;
    TokenBucket& operator=(const TokenBucket&) = delete;

    /// Refill, then take tokens if at least that many are available
    [[nodiscard]] bool consume(RateClock::time_point now, double tokens = 1.0);

    /// Tokens available at now (after refill)
    [[nodiscard]] double available(RateClock::time_point now);

    /// Time until one token is available (zero if one already is)
    [[nodiscard]] std::chrono::milliseconds time_until_available(RateClock::time_point now);

    [[nodiscard]] double capacity() const noexcept { return capacity_; }
    [[nodiscard]] double refill_rate() const noexcept { return refill_rate_; }

    /// Reset the bucket to full capacity
    void reset(RateClock::time_point now);

private:
    /// Add elapsed * rate tokens, capped at capacity (caller holds mutex_)
    void refill(RateClock::time_point now);

    const double capacity_;     // Maximum tokens (burst size)
    const double refill_rate_;  // Tokens per second

    std::mutex mutex_;
    double tokens_;
    RateClock::time_point last_refill_;
};

/// Admission decision
struct RateLimitDecision {
    bool allowed = true;
    std::chrono::milliseconds retry_after{0};  // Until the next token (denials only)
};

/// Retry-After value in whole seconds: rounded up, at least 1
[[nodiscard]] int64_t retry_after_seconds(std::chrono::milliseconds retry_after) noexcept;

/// Rate limiter with per-key buckets, created lazily on first use.
/// Keys are spread over shards; each shard bounds its key count with LRU
/// eviction. Shard locks cover map and LRU updates only.
/// Throws std::invalid_argument if capacity < 1 or refill_rate <= 0.
class RateLimiter {
public:
    /// @param capacity Token bucket capacity (burst size)
    /// @param refill_rate Tokens per second
    /// @param max_keys Tracked keys before the least recently used are evicted (0 = unbounded)
    RateLimiter(double capacity, double refill_rate, size_t max_keys = 100000,
                TimeSource now = {});

    ~RateLimiter() = default;

    // Non-copyable, non-movable
    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /// Check if a request should be allowed for a key (never waits)
    [[nodiscard]] RateLimitDecision allow(std::string_view key);

    /// Reset rate limit for a specific key
    void reset(std::string_view key);

    /// Clear all buckets
    void clear();

    /// Get number of tracked keys
    [[nodiscard]] size_t key_count() const;

    /// Get available tokens for a key (capacity if key not found)
    [[nodiscard]] double available(std::string_view key);

    [[nodiscard]] double capacity() const noexcept { return capacity_; }
    [[nodiscard]] double refill_rate() const noexcept { return refill_rate_; }

private:
    static constexpr size_t kShardCount = 16;

    struct Slot {
        std::shared_ptr<TokenBucket> bucket;
        std::list<std::string>::iterator lru_position;
    };

    struct Shard {
        mutable std::mutex mutex;
        core::fast_map<std::string, Slot> buckets;
        std::list<std::string> lru;  // front = most recently used
    };

    [[nodiscard]] Shard& shard_for(std::string_view key) noexcept;
    [[nodiscard]] std::shared_ptr<TokenBucket> bucket_for(std::string_view key, bool create);
    [[nodiscard]] RateClock::time_point now() const {
        return now_ ? now_() : RateClock::now();
    }

    const double capacity_;
    const double refill_rate_;
    const size_t max_keys_per_shard_;
    TimeSource now_;
    std::array<Shard, kShardCount> shards_;
};

/// A named limit applied to requests by key
struct RateLimitZone {
    std::string name;
    RequestKeyExtractor key;
    std::unique_ptr<RateLimiter> limiter;
    uint16_t status = 429;
};

}  // namespace harbor::gateway

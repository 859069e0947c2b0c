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


// Harbor Cache Store - Header
// Sharded LRU response cache with TTL, stale window and a per-key fill lock

#pragma once

#include <chrono>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "../core/containers.hpp"
#include "../http/http.hpp"

namespace harbor::gateway {

using CacheClock = std::chrono::steady_clock;

/// A stored response. Immutable once inserted; readers share it.
struct CacheEntry {
    std::string key;  // Raw key text (purge patterns match against it)
    uint16_t status = 200;
    http::Headers headers;
    std::string body;
    CacheClock::time_point created_at;
    std::chrono::seconds ttl{0};

    [[nodiscard]] CacheClock::time_point expires_at() const noexcept { return created_at + ttl; }

    /// Approximate memory footprint used for the byte bound
    [[nodiscard]] size_t size_bytes() const noexcept;

    /// Rebuild the response for a client
    [[nodiscard]] http::Response to_response() const;
};

enum class CacheEntryState : uint8_t {
    Fresh,     // Within TTL
    Stale,     // Past TTL, inside the stale window, no refresh running
    Updating   // Past TTL, a background refresh is in flight
};

[[nodiscard]] constexpr std::string_view to_string(CacheEntryState state) noexcept {
    switch (state) {
        case CacheEntryState::Fresh:
            return "fresh";
        case CacheEntryState::Stale:
            return "stale";
        case CacheEntryState::Updating:
            return "updating";
    }
    return "fresh";
}

/// Result of get(): entry is null on a miss. expired is set when an entry
/// existed but was past its stale window and has been dropped.
struct CacheLookup {
    std::shared_ptr<const CacheEntry> entry;
    CacheEntryState state = CacheEntryState::Fresh;
    bool expired = false;

    explicit operator bool() const noexcept { return entry != nullptr; }
};

struct CacheStoreOptions {
    size_t max_entries = 10000;
    size_t max_bytes = 256 * 1024 * 1024;
    size_t shards = 16;
    std::chrono::seconds stale_while_revalidate{0};
};

struct CacheStats {
    uint64_t hits = 0;
    uint64_t stale_hits = 0;
    uint64_t misses = 0;
    uint64_t stores = 0;
    uint64_t evictions = 0;
    uint64_t expirations = 0;
    uint64_t rejected = 0;  // Entries too large to store
    size_t entries = 0;
    size_t bytes = 0;
};

/// Shared state of one in-progress origin fetch for a key
struct CacheFill {
    std::mutex mutex;
    std::condition_variable done_cv;
    bool done = false;
    std::shared_ptr<const CacheEntry> entry;  // Null if the leader stored nothing
};

class CacheStore;

/// Membership in the fill for one key. The leader fetches from the origin
/// and publishes; followers wait for it. A leader that goes away without
/// publishing releases its followers with nothing.
class CacheFillTicket {
public:
    CacheFillTicket() = default;
    CacheFillTicket(CacheStore* store, std::string digest, std::shared_ptr<CacheFill> fill,
                    bool leader) noexcept;
    ~CacheFillTicket();

    CacheFillTicket(CacheFillTicket&& other) noexcept;
    CacheFillTicket& operator=(CacheFillTicket&& other) noexcept;
    CacheFillTicket(const CacheFillTicket&) = delete;
    CacheFillTicket& operator=(const CacheFillTicket&) = delete;

    [[nodiscard]] bool is_leader() const noexcept { return leader_; }

    /// Leader: release followers with the stored entry (or null)
    void complete(std::shared_ptr<const CacheEntry> entry);

    /// Follower: wait for the leader. Returns nullopt on timeout, otherwise
    /// what the leader published (possibly null).
    [[nodiscard]] std::optional<std::shared_ptr<const CacheEntry>> wait(
        std::chrono::milliseconds timeout);

private:
    CacheStore* store_ = nullptr;
    std::string digest_;
    std::shared_ptr<CacheFill> fill_;
    bool leader_ = false;
    bool completed_ = false;
};

/// Response cache. Keys are hashed (MD5) onto shards; each shard has its
/// own lock guarding the map and LRU list. Locks are never held across I/O,
/// so get() on one key does not wait for put() on another.
class CacheStore {
public:
    using TimeSource = std::function<CacheClock::time_point()>;

    explicit CacheStore(CacheStoreOptions options = {}, TimeSource now = {});

    CacheStore(const CacheStore&) = delete;
    CacheStore& operator=(const CacheStore&) = delete;

    /// Look up a key; expired entries are removed lazily here
    [[nodiscard]] CacheLookup get(std::string_view key);

    /// Insert or replace. Fails with cache_failure if the entry cannot fit.
    [[nodiscard]] std::error_code put(std::shared_ptr<const CacheEntry> entry);

    /// Remove one key; returns true if it existed
    bool purge(std::string_view key);

    /// Remove every entry whose raw key matches a glob ('*' and '?')
    size_t purge_matching(std::string_view pattern);

    /// Exact key, or glob when the text contains '*'; returns entries removed
    size_t purge_key_or_pattern(std::string_view key_or_pattern);

    /// Drop entries past their stale window; returns how many
    size_t sweep_expired();

    /// Claim the background refresh of a stale entry. Only one caller wins
    /// until end_refresh() or put() replaces the entry.
    [[nodiscard]] bool try_begin_refresh(std::string_view key);
    void end_refresh(std::string_view key);

    /// Join the fill for key, becoming leader if none is in progress
    [[nodiscard]] CacheFillTicket begin_fill(std::string_view key);

    void clear();

    [[nodiscard]] CacheStats stats() const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] const CacheStoreOptions& options() const noexcept { return options_; }

    [[nodiscard]] CacheClock::time_point now() const { return now_ ? now_() : CacheClock::now(); }

private:
    friend class CacheFillTicket;

    struct Slot {
        std::shared_ptr<const CacheEntry> entry;
        std::list<std::string>::iterator lru_position;
        bool refreshing = false;
        uint64_t last_used = 0;  // Store-wide use order for eviction
    };

    struct Shard {
        mutable std::mutex mutex;
        core::fast_map<std::string, Slot> entries;  // Keyed by MD5 hex digest
        std::list<std::string> lru;                 // front = most recently used
        size_t bytes = 0;
        core::fast_map<std::string, std::shared_ptr<CacheFill>> fills;

        uint64_t hits = 0;
        uint64_t stale_hits = 0;
        uint64_t misses = 0;
        uint64_t stores = 0;
        uint64_t evictions = 0;
        uint64_t expirations = 0;
        uint64_t rejected = 0;
    };

    [[nodiscard]] Shard& shard_for(std::string_view digest) noexcept;
    void erase_locked(Shard& shard, core::fast_map<std::string, Slot>::iterator it);
    [[nodiscard]] bool over_capacity() const noexcept;
    [[nodiscard]] const Slot* lru_victim_locked(const Shard& shard, std::string_view keep) const;
    void evict_until_within_bounds(std::string_view keep);
    void finish_fill(const std::string& digest, const std::shared_ptr<CacheFill>& fill,
                     std::shared_ptr<const CacheEntry> entry);

    CacheStoreOptions options_;
    TimeSource now_;
    // Limits apply to the whole store, not to each shard
    std::atomic<size_t> total_entries_{0};
    std::atomic<size_t> total_bytes_{0};
    std::atomic<uint64_t> use_clock_{1};
    std::vector<std::unique_ptr<Shard>> shards_;
};

}  // namespace harbor::gateway

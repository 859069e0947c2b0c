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


// Harbor Cache Store - Implementation

#include "cache_store.hpp"

#include <algorithm>

#include "../core/hash.hpp"
#include "../core/string_utils.hpp"
#include "errors.hpp"

namespace harbor::gateway {

size_t CacheEntry::size_bytes() const noexcept {
    size_t total = sizeof(CacheEntry) + key.size() + body.size();
    for (const auto& header : headers) {
        total += header.name.size() + header.value.size() + sizeof(http::Header);
    }
    return total;
}

http::Response CacheEntry::to_response() const {
    http::Response response;
    response.status = static_cast<http::StatusCode>(status);
    response.headers = headers;
    response.body = body;
    return response;
}

// CacheFillTicket

CacheFillTicket::CacheFillTicket(CacheStore* store, std::string digest,
                                 std::shared_ptr<CacheFill> fill, bool leader) noexcept
    : store_(store), digest_(std::move(digest)), fill_(std::move(fill)), leader_(leader) {}

CacheFillTicket::~CacheFillTicket() {
    if (leader_ && !completed_ && fill_) {
        complete(nullptr);
    }
}

CacheFillTicket::CacheFillTicket(CacheFillTicket&& other) noexcept
    : store_(other.store_),
      digest_(std::move(other.digest_)),
      fill_(std::move(other.fill_)),
      leader_(other.leader_),
      completed_(other.completed_) {
    other.leader_ = false;
}

CacheFillTicket& CacheFillTicket::operator=(CacheFillTicket&& other) noexcept {
    if (this != &other) {
        if (leader_ && !completed_ && fill_) {
            complete(nullptr);
        }
        store_ = other.store_;
        digest_ = std::move(other.digest_);
        fill_ = std::move(other.fill_);
        leader_ = other.leader_;
        completed_ = other.completed_;
        other.leader_ = false;
    }
    return *this;
}

void CacheFillTicket::complete(std::shared_ptr<const CacheEntry> entry) {
    if (!leader_ || completed_ || !fill_ || !store_) {
        return;
    }
    completed_ = true;
    store_->finish_fill(digest_, fill_, std::move(entry));
}

std::optional<std::shared_ptr<const CacheEntry>> CacheFillTicket::wait(
    std::chrono::milliseconds timeout) {
    if (!fill_) {
        return std::nullopt;
    }
    std::unique_lock lock(fill_->mutex);
    if (!fill_->done_cv.wait_for(lock, timeout, [this] { return fill_->done; })) {
        return std::nullopt;
    }
    return fill_->entry;
}

// CacheStore

CacheStore::CacheStore(CacheStoreOptions options, TimeSource now)
    : options_(options), now_(std::move(now)) {
    if (options_.shards == 0) {
        options_.shards = 1;
    }
    options_.max_entries = std::max<size_t>(options_.max_entries, 1);
    options_.max_bytes = std::max<size_t>(options_.max_bytes, 1);
    shards_.reserve(options_.shards);
    for (size_t i = 0; i < options_.shards; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

CacheStore::Shard& CacheStore::shard_for(std::string_view digest) noexcept {
    return *shards_[core::fnv1a_64(digest) % shards_.size()];
}

void CacheStore::erase_locked(Shard& shard, core::fast_map<std::string, Slot>::iterator it) {
    size_t size = std::min(shard.bytes, it->second.entry->size_bytes());
    shard.bytes -= size;
    total_bytes_.fetch_sub(size, std::memory_order_relaxed);
    total_entries_.fetch_sub(1, std::memory_order_relaxed);
    shard.lru.erase(it->second.lru_position);
    shard.entries.erase(it);
}

bool CacheStore::over_capacity() const noexcept {
    return total_entries_.load(std::memory_order_relaxed) > options_.max_entries ||
           total_bytes_.load(std::memory_order_relaxed) > options_.max_bytes;
}

const CacheStore::Slot* CacheStore::lru_victim_locked(const Shard& shard,
                                                      std::string_view keep) const {
    for (auto it = shard.lru.rbegin(); it != shard.lru.rend(); ++it) {
        if (*it == keep) {
            continue;
        }
        auto slot = shard.entries.find(*it);
        return slot == shard.entries.end() ? nullptr : &slot->second;
    }
    return nullptr;
}

void CacheStore::evict_until_within_bounds(std::string_view keep) {
    while (over_capacity()) {
        // Oldest shard tail across the store; shard locks are taken one at a time
        Shard* oldest = nullptr;
        uint64_t oldest_use = UINT64_MAX;
        for (auto& shard_ptr : shards_) {
            std::lock_guard lock(shard_ptr->mutex);
            const Slot* victim = lru_victim_locked(*shard_ptr, keep);
            if (victim && victim->last_used < oldest_use) {
                oldest_use = victim->last_used;
                oldest = shard_ptr.get();
            }
        }
        if (!oldest) {
            return;
        }

        std::lock_guard lock(oldest->mutex);
        const Slot* victim = lru_victim_locked(*oldest, keep);
        if (!victim) {
            continue;  // Emptied by another thread meanwhile
        }
        auto it = oldest->entries.find(*victim->lru_position);
        erase_locked(*oldest, it);
        ++oldest->evictions;
    }
}

CacheLookup CacheStore::get(std::string_view key) {
    std::string digest = core::md5_hex(key);
    Shard& shard = shard_for(digest);
    auto t = now();

    std::lock_guard lock(shard.mutex);
    auto it = shard.entries.find(digest);
    if (it == shard.entries.end()) {
        ++shard.misses;
        return {};
    }

    Slot& slot = it->second;
    CacheLookup result;
    auto expires = slot.entry->expires_at();
    if (t < expires) {
        result.state = CacheEntryState::Fresh;
        ++shard.hits;
    } else if (t < expires + options_.stale_while_revalidate) {
        result.state = slot.refreshing ? CacheEntryState::Updating : CacheEntryState::Stale;
        ++shard.stale_hits;
    } else {
        erase_locked(shard, it);
        ++shard.expirations;
        ++shard.misses;
        result.expired = true;
        return result;
    }

    shard.lru.splice(shard.lru.begin(), shard.lru, slot.lru_position);
    slot.last_used = use_clock_.fetch_add(1, std::memory_order_relaxed);
    result.entry = slot.entry;
    return result;
}

std::error_code CacheStore::put(std::shared_ptr<const CacheEntry> entry) {
    if (!entry) {
        return ProxyErrc::cache_failure;
    }

    std::string digest = core::md5_hex(entry->key);
    Shard& shard = shard_for(digest);
    size_t size = entry->size_bytes();

    {
        std::lock_guard lock(shard.mutex);
        if (size > options_.max_bytes) {
            ++shard.rejected;
            return ProxyErrc::cache_failure;
        }

        auto existing = shard.entries.find(digest);
        if (existing != shard.entries.end()) {
            erase_locked(shard, existing);
        }

        shard.lru.push_front(digest);
        shard.bytes += size;
        total_bytes_.fetch_add(size, std::memory_order_relaxed);
        total_entries_.fetch_add(1, std::memory_order_relaxed);
        shard.entries.emplace(digest, Slot{std::move(entry), shard.lru.begin(), false,
                                           use_clock_.fetch_add(1, std::memory_order_relaxed)});
        ++shard.stores;
    }

    // Store-wide LRU eviction; the entry just written is never the victim
    evict_until_within_bounds(digest);
    return {};
}

bool CacheStore::purge(std::string_view key) {
    std::string digest = core::md5_hex(key);
    Shard& shard = shard_for(digest);

    std::lock_guard lock(shard.mutex);
    auto it = shard.entries.find(digest);
    if (it == shard.entries.end()) {
        return false;
    }
    erase_locked(shard, it);
    return true;
}

size_t CacheStore::purge_matching(std::string_view pattern) {
    size_t removed = 0;
    for (auto& shard_ptr : shards_) {
        Shard& shard = *shard_ptr;
        std::lock_guard lock(shard.mutex);

        std::vector<std::string> matched;
        for (const auto& [digest, slot] : shard.entries) {
            if (core::glob_match(pattern, slot.entry->key)) {
                matched.push_back(digest);
            }
        }
        for (const auto& digest : matched) {
            auto it = shard.entries.find(digest);
            if (it != shard.entries.end()) {
                erase_locked(shard, it);
                ++removed;
            }
        }
    }
    return removed;
}

size_t CacheStore::purge_key_or_pattern(std::string_view key_or_pattern) {
    if (key_or_pattern.find('*') != std::string_view::npos) {
        return purge_matching(key_or_pattern);
    }
    return purge(key_or_pattern) ? 1 : 0;
}

size_t CacheStore::sweep_expired() {
    auto t = now();
    size_t removed = 0;
    for (auto& shard_ptr : shards_) {
        Shard& shard = *shard_ptr;
        std::lock_guard lock(shard.mutex);

        std::vector<std::string> expired;
        for (const auto& [digest, slot] : shard.entries) {
            if (t >= slot.entry->expires_at() + options_.stale_while_revalidate &&
                !slot.refreshing) {
                expired.push_back(digest);
            }
        }
        for (const auto& digest : expired) {
            auto it = shard.entries.find(digest);
            if (it != shard.entries.end()) {
                erase_locked(shard, it);
                ++shard.expirations;
                ++removed;
            }
        }
    }
    return removed;
}

bool CacheStore::try_begin_refresh(std::string_view key) {
    std::string digest = core::md5_hex(key);
    Shard& shard = shard_for(digest);

    std::lock_guard lock(shard.mutex);
    auto it = shard.entries.find(digest);
    if (it == shard.entries.end() || it->second.refreshing) {
        return false;
    }
    it->second.refreshing = true;
    return true;
}

void CacheStore::end_refresh(std::string_view key) {
    std::string digest = core::md5_hex(key);
    Shard& shard = shard_for(digest);

    std::lock_guard lock(shard.mutex);
    auto it = shard.entries.find(digest);
    if (it != shard.entries.end()) {
        it->second.refreshing = false;
    }
}

CacheFillTicket CacheStore::begin_fill(std::string_view key) {
    std::string digest = core::md5_hex(key);
    Shard& shard = shard_for(digest);

    std::lock_guard lock(shard.mutex);
    auto it = shard.fills.find(digest);
    if (it != shard.fills.end()) {
        return CacheFillTicket(this, digest, it->second, false);
    }
    auto fill = std::make_shared<CacheFill>();
    shard.fills.emplace(digest, fill);
    return CacheFillTicket(this, std::move(digest), std::move(fill), true);
}

void CacheStore::finish_fill(const std::string& digest, const std::shared_ptr<CacheFill>& fill,
                             std::shared_ptr<const CacheEntry> entry) {
    {
        Shard& shard = shard_for(digest);
        std::lock_guard lock(shard.mutex);
        auto it = shard.fills.find(digest);
        if (it != shard.fills.end() && it->second == fill) {
            shard.fills.erase(it);
        }
    }
    {
        std::lock_guard lock(fill->mutex);
        fill->done = true;
        fill->entry = std::move(entry);
    }
    fill->done_cv.notify_all();
}

void CacheStore::clear() {
    for (auto& shard_ptr : shards_) {
        std::lock_guard lock(shard_ptr->mutex);
        total_entries_.fetch_sub(shard_ptr->entries.size(), std::memory_order_relaxed);
        total_bytes_.fetch_sub(shard_ptr->bytes, std::memory_order_relaxed);
        shard_ptr->entries.clear();
        shard_ptr->lru.clear();
        shard_ptr->bytes = 0;
    }
}

CacheStats CacheStore::stats() const {
    CacheStats stats;
    for (const auto& shard_ptr : shards_) {
        const Shard& shard = *shard_ptr;
        std::lock_guard lock(shard.mutex);
        stats.hits += shard.hits;
        stats.stale_hits += shard.stale_hits;
        stats.misses += shard.misses;
        stats.stores += shard.stores;
        stats.evictions += shard.evictions;
        stats.expirations += shard.expirations;
        stats.rejected += shard.rejected;
        stats.entries += shard.entries.size();
        stats.bytes += shard.bytes;
    }
    return stats;
}

size_t CacheStore::size() const {
    size_t total = 0;
    for (const auto& shard_ptr : shards_) {
        std::lock_guard lock(shard_ptr->mutex);
        total += shard_ptr->entries.size();
    }
    return total;
}

}  // namespace harbor::gateway

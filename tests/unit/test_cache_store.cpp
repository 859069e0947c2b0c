// Harbor Cache Store Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <memory>
#include <string>

#include "../../src/gateway/cache_store.hpp"
#include "../../src/gateway/errors.hpp"

using namespace harbor::gateway;
using namespace std::chrono_literals;

namespace {

struct FakeClock {
    CacheClock::time_point now = CacheClock::now();

    CacheStore::TimeSource source() {
        return [this] { return now; };
    }
};

std::shared_ptr<const CacheEntry> make_entry(std::string key, std::string body,
                                             CacheClock::time_point created,
                                             std::chrono::seconds ttl = 60s) {
    auto entry = std::make_shared<CacheEntry>();
    entry->key = std::move(key);
    entry->status = 200;
    entry->headers = {{"Content-Type", "text/plain"}};
    entry->body = std::move(body);
    entry->created_at = created;
    entry->ttl = ttl;
    return entry;
}

}  // namespace

TEST_CASE("Cache entries move from fresh to stale to expired", "[gateway][cache]") {
    FakeClock clock;
    CacheStoreOptions options;
    options.stale_while_revalidate = 30s;
    CacheStore store(options, clock.source());

    const std::string key = "GET http://example.com/a";
    REQUIRE_FALSE(store.put(make_entry(key, "hello", clock.now, 60s)));

    CacheLookup fresh = store.get(key);
    REQUIRE(fresh);
    REQUIRE(fresh.state == CacheEntryState::Fresh);
    REQUIRE(fresh.entry->body == "hello");

    harbor::http::Response response = fresh.entry->to_response();
    REQUIRE(response.status_code() == 200);
    REQUIRE(response.get_header("Content-Type") == "text/plain");

    clock.now += 70s;
    CacheLookup stale = store.get(key);
    REQUIRE(stale);
    REQUIRE(stale.state == CacheEntryState::Stale);

    SECTION("only one refresh may run") {
        REQUIRE(store.try_begin_refresh(key));
        REQUIRE_FALSE(store.try_begin_refresh(key));
        REQUIRE(store.get(key).state == CacheEntryState::Updating);

        store.end_refresh(key);
        REQUIRE(store.get(key).state == CacheEntryState::Stale);
        REQUIRE(store.try_begin_refresh(key));
    }

    SECTION("a new put replaces the stale entry") {
        REQUIRE(store.try_begin_refresh(key));
        REQUIRE_FALSE(store.put(make_entry(key, "refreshed", clock.now, 60s)));
        CacheLookup again = store.get(key);
        REQUIRE(again.state == CacheEntryState::Fresh);
        REQUIRE(again.entry->body == "refreshed");
    }

    SECTION("past the stale window the entry is dropped") {
        clock.now += 30s;
        CacheLookup expired = store.get(key);
        REQUIRE_FALSE(expired);
        REQUIRE(expired.expired);
        REQUIRE(store.size() == 0);

        CacheLookup miss = store.get(key);
        REQUIRE_FALSE(miss);
        REQUIRE_FALSE(miss.expired);
    }
}

TEST_CASE("Without a stale window entries expire at TTL", "[gateway][cache]") {
    FakeClock clock;
    CacheStore store({}, clock.source());

    REQUIRE_FALSE(store.put(make_entry("k", "v", clock.now, 10s)));
    clock.now += 9s;
    REQUIRE(store.get("k"));
    clock.now += 1s;
    REQUIRE(store.get("k").expired);
}

TEST_CASE("Cache evicts least recently used entries", "[gateway][cache]") {
    FakeClock clock;
    CacheStoreOptions options;
    options.shards = 1;
    options.max_entries = 3;
    CacheStore store(options, clock.source());

    REQUIRE_FALSE(store.put(make_entry("a", "1", clock.now)));
    REQUIRE_FALSE(store.put(make_entry("b", "2", clock.now)));
    REQUIRE_FALSE(store.put(make_entry("c", "3", clock.now)));

    // Touch "a" so "b" becomes the oldest
    REQUIRE(store.get("a"));
    REQUIRE_FALSE(store.put(make_entry("d", "4", clock.now)));

    REQUIRE(store.size() == 3);
    REQUIRE(store.get("a"));
    REQUIRE_FALSE(store.get("b"));
    REQUIRE(store.get("c"));
    REQUIRE(store.get("d"));
    REQUIRE(store.stats().evictions == 1);
}

TEST_CASE("Cache bounds apply to the whole store across shards", "[gateway][cache]") {
    FakeClock clock;
    CacheStoreOptions options;  // Default shard count
    options.max_entries = 3;
    CacheStore store(options, clock.source());

    SECTION("entry count never exceeds max_entries") {
        for (int i = 0; i < 20; ++i) {
            REQUIRE_FALSE(store.put(make_entry("key-" + std::to_string(i), "v", clock.now)));
            REQUIRE(store.size() <= 3);
        }
        REQUIRE(store.size() == 3);
        REQUIRE(store.get("key-17"));
        REQUIRE(store.get("key-18"));
        REQUIRE(store.get("key-19"));
        REQUIRE(store.stats().evictions == 17);
    }

    SECTION("least recently used entry goes first whatever its shard") {
        REQUIRE_FALSE(store.put(make_entry("a", "1", clock.now)));
        REQUIRE_FALSE(store.put(make_entry("b", "2", clock.now)));
        REQUIRE_FALSE(store.put(make_entry("c", "3", clock.now)));
        REQUIRE(store.get("a"));

        REQUIRE_FALSE(store.put(make_entry("d", "4", clock.now)));
        REQUIRE_FALSE(store.get("b"));
        REQUIRE(store.get("a"));
        REQUIRE(store.get("c"));
        REQUIRE(store.get("d"));
    }
}

TEST_CASE("Cache below capacity evicts nothing", "[gateway][cache]") {
    FakeClock clock;
    CacheStoreOptions options;
    options.max_entries = 64;
    CacheStore store(options, clock.source());

    // With 16 shards, 64 keys are bound to share shards
    for (int i = 0; i < 64; ++i) {
        REQUIRE_FALSE(store.put(make_entry("hot-" + std::to_string(i), "v", clock.now)));
    }
    REQUIRE(store.size() == 64);
    REQUIRE(store.stats().evictions == 0);
    for (int i = 0; i < 64; ++i) {
        REQUIRE(store.get("hot-" + std::to_string(i)));
    }
}

TEST_CASE("Cache byte bound is store-wide", "[gateway][cache]") {
    FakeClock clock;
    CacheStoreOptions options;
    options.max_bytes = 8192;
    CacheStore store(options, clock.source());

    for (int i = 0; i < 10; ++i) {
        REQUIRE_FALSE(
            store.put(make_entry("page-" + std::to_string(i), std::string(2000, 'x'), clock.now)));
        REQUIRE(store.stats().bytes <= 8192);
    }
    REQUIRE(store.size() < 10);
    REQUIRE(store.get("page-9"));
}

TEST_CASE("Cache respects the byte bound", "[gateway][cache]") {
    FakeClock clock;
    CacheStoreOptions options;
    options.shards = 1;
    options.max_bytes = 4096;
    CacheStore store(options, clock.source());

    SECTION("oversized entries are rejected") {
        std::error_code ec = store.put(make_entry("big", std::string(8192, 'x'), clock.now));
        REQUIRE(ec == ProxyErrc::cache_failure);
        REQUIRE(store.size() == 0);
        REQUIRE(store.stats().rejected == 1);
    }

    SECTION("older entries make room") {
        REQUIRE_FALSE(store.put(make_entry("one", std::string(1500, 'a'), clock.now)));
        REQUIRE_FALSE(store.put(make_entry("two", std::string(1500, 'b'), clock.now)));
        REQUIRE_FALSE(store.put(make_entry("three", std::string(1500, 'c'), clock.now)));

        REQUIRE_FALSE(store.get("one"));
        REQUIRE(store.get("three"));
        REQUIRE(store.stats().bytes <= 4096);
    }
}

TEST_CASE("Cache purge by key and by pattern", "[gateway][cache]") {
    FakeClock clock;
    CacheStore store({}, clock.source());

    REQUIRE_FALSE(store.put(make_entry("GET http://shop.example.com/products/1", "p1", clock.now)));
    REQUIRE_FALSE(store.put(make_entry("GET http://shop.example.com/products/2", "p2", clock.now)));
    REQUIRE_FALSE(store.put(make_entry("GET http://shop.example.com/cart", "c", clock.now)));
    REQUIRE_FALSE(store.put(make_entry("GET http://blog.example.com/post", "b", clock.now)));

    REQUIRE(store.purge("GET http://shop.example.com/cart"));
    REQUIRE_FALSE(store.purge("GET http://shop.example.com/cart"));

    REQUIRE(store.purge_matching("GET http://shop.example.com/products/*") == 2);
    REQUIRE(store.size() == 1);

    REQUIRE(store.purge_key_or_pattern("GET http://blog.example.com/pos?") == 0);
    REQUIRE(store.purge_key_or_pattern("*blog*") == 1);
    REQUIRE(store.size() == 0);
}

TEST_CASE("Sweep drops entries past their stale window", "[gateway][cache]") {
    FakeClock clock;
    CacheStoreOptions options;
    options.stale_while_revalidate = 10s;
    CacheStore store(options, clock.source());

    REQUIRE_FALSE(store.put(make_entry("short", "s", clock.now, 5s)));
    REQUIRE_FALSE(store.put(make_entry("long", "l", clock.now, 300s)));

    clock.now += 10s;
    REQUIRE(store.sweep_expired() == 0);  // "short" is stale, not expired

    clock.now += 10s;
    REQUIRE(store.sweep_expired() == 1);
    REQUIRE(store.size() == 1);
    REQUIRE(store.get("long"));
    REQUIRE(store.stats().expirations == 1);
}

TEST_CASE("Cache statistics", "[gateway][cache]") {
    FakeClock clock;
    CacheStore store({}, clock.source());

    (void)store.get("missing");
    REQUIRE_FALSE(store.put(make_entry("k", "value", clock.now)));
    (void)store.get("k");
    (void)store.get("k");

    CacheStats stats = store.stats();
    REQUIRE(stats.misses == 1);
    REQUIRE(stats.hits == 2);
    REQUIRE(stats.stores == 1);
    REQUIRE(stats.entries == 1);
    REQUIRE(stats.bytes > 0);

    store.clear();
    REQUIRE(store.size() == 0);
    REQUIRE(store.stats().bytes == 0);
}

TEST_CASE("Fill tickets elect one leader per key", "[gateway][cache]") {
    FakeClock clock;
    CacheStore store({}, clock.source());

    CacheFillTicket leader = store.begin_fill("k");
    CacheFillTicket follower = store.begin_fill("k");
    CacheFillTicket other = store.begin_fill("other");

    REQUIRE(leader.is_leader());
    REQUIRE_FALSE(follower.is_leader());
    REQUIRE(other.is_leader());

    SECTION("follower times out while the leader works") {
        REQUIRE_FALSE(follower.wait(10ms).has_value());
    }

    SECTION("leader publishes its entry") {
        auto entry = make_entry("k", "v", clock.now);
        leader.complete(entry);
        auto published = follower.wait(10ms);
        REQUIRE(published.has_value());
        REQUIRE(*published == entry);

        // The next fill starts a new leader
        REQUIRE(store.begin_fill("k").is_leader());
    }

    SECTION("abandoned leader releases followers empty-handed") {
        { CacheFillTicket gone = std::move(leader); }
        auto published = follower.wait(10ms);
        REQUIRE(published.has_value());
        REQUIRE(*published == nullptr);
    }
}

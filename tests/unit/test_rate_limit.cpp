// Rate Limiting Tests

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../../src/gateway/rate_limit.hpp"
#include "../../src/gateway/request_key.hpp"
#include "../../src/http/http.hpp"

using namespace harbor::gateway;
using namespace harbor::http;
using namespace std::chrono_literals;

namespace {

/// Manually advanced clock
struct FakeClock {
    RateClock::time_point now = RateClock::now();

    TimeSource source() {
        return [this] { return now; };
    }
};

}  // namespace

TEST_CASE("TokenBucket basic operations", "[gateway][rate_limit]") {
    auto t0 = RateClock::now();

    SECTION("Initial state") {
        TokenBucket bucket(100, 10, t0);

        REQUIRE(bucket.capacity() == 100);
        REQUIRE(bucket.refill_rate() == 10);
        REQUIRE(bucket.available(t0) == 100);  // Starts full
    }

    SECTION("Insufficient tokens") {
        TokenBucket bucket(10, 1, t0);

        REQUIRE(bucket.consume(t0, 5));
        REQUIRE(bucket.consume(t0, 3));
        REQUIRE_FALSE(bucket.consume(t0, 5));  // Need 5, have 2
        REQUIRE(bucket.available(t0) == 2);
    }

    SECTION("Refill is continuous and capped") {
        TokenBucket bucket(10, 2, t0);
        REQUIRE(bucket.consume(t0, 10));
        REQUIRE(bucket.available(t0) == 0);

        REQUIRE(bucket.available(t0 + 500ms) == 1);
        REQUIRE(bucket.available(t0 + 2s) == 4);
        REQUIRE(bucket.available(t0 + 60s) == 10);
    }

    SECTION("Time until the next token") {
        TokenBucket bucket(1, 4, t0);
        REQUIRE(bucket.time_until_available(t0) == 0ms);
        REQUIRE(bucket.consume(t0));
        REQUIRE(bucket.time_until_available(t0) == 250ms);
        auto remaining = bucket.time_until_available(t0 + 100ms);
        REQUIRE(remaining >= 150ms);
        REQUIRE(remaining <= 151ms);
    }

    SECTION("Reset bucket") {
        TokenBucket bucket(100, 10, t0);
        REQUIRE(bucket.consume(t0, 80));
        bucket.reset(t0);
        REQUIRE(bucket.available(t0) == 100);
    }
}

TEST_CASE("RateLimiter admits a burst then refills", "[gateway][rate_limit]") {
    FakeClock clock;
    RateLimiter limiter(5, 1, 1000, clock.source());

    for (int i = 0; i < 5; ++i) {
        REQUIRE(limiter.allow("10.0.0.1").allowed);
    }

    RateLimitDecision denied = limiter.allow("10.0.0.1");
    REQUIRE_FALSE(denied.allowed);
    REQUIRE(denied.retry_after == 1000ms);

    // Other keys are independent
    REQUIRE(limiter.allow("10.0.0.2").allowed);

    clock.now += 1s;
    REQUIRE(limiter.allow("10.0.0.1").allowed);
    REQUIRE_FALSE(limiter.allow("10.0.0.1").allowed);

    SECTION("reset restores one key") {
        limiter.reset("10.0.0.1");
        REQUIRE(limiter.available("10.0.0.1") == 5);
    }

    SECTION("clear forgets every key") {
        limiter.clear();
        REQUIRE(limiter.key_count() == 0);
        REQUIRE(limiter.available("10.0.0.1") == 5);
    }
}

TEST_CASE("RateLimiter bounds the number of tracked keys", "[gateway][rate_limit]") {
    FakeClock clock;
    RateLimiter limiter(2, 1, 32, clock.source());

    for (int i = 0; i < 1000; ++i) {
        REQUIRE(limiter.allow("client-" + std::to_string(i)).allowed);
    }
    REQUIRE(limiter.key_count() <= 32);
    REQUIRE(limiter.key_count() > 0);

    RateLimiter unbounded(2, 1, 0, clock.source());
    for (int i = 0; i < 200; ++i) {
        (void)unbounded.allow("client-" + std::to_string(i));
    }
    REQUIRE(unbounded.key_count() == 200);
}

TEST_CASE("RateLimiter rejects rates that never refill", "[gateway][rate_limit]") {
    FakeClock clock;
    REQUIRE_THROWS_AS(RateLimiter(5, 0, 1000, clock.source()), std::invalid_argument);
    REQUIRE_THROWS_AS(RateLimiter(5, -1, 1000, clock.source()), std::invalid_argument);
    REQUIRE_THROWS_AS(RateLimiter(0.5, 1, 1000, clock.source()), std::invalid_argument);
    REQUIRE_THROWS_AS(TokenBucket(5, 0, clock.now), std::invalid_argument);
    REQUIRE_NOTHROW(RateLimiter(1, 0.001, 1000, clock.source()));
}

TEST_CASE("Retry-After stays finite for slow rates", "[gateway][rate_limit]") {
    SECTION("rounds up to whole seconds") {
        REQUIRE(retry_after_seconds(0ms) == 1);
        REQUIRE(retry_after_seconds(1ms) == 1);
        REQUIRE(retry_after_seconds(1000ms) == 1);
        REQUIRE(retry_after_seconds(1001ms) == 2);
    }

    SECTION("largest wait does not overflow") {
        int64_t seconds = retry_after_seconds(std::chrono::milliseconds::max());
        REQUIRE(seconds == std::chrono::milliseconds::max().count() / 1000 + 1);
    }

    SECTION("tiny refill rate yields a long but positive wait") {
        FakeClock clock;
        RateLimiter limiter(1, 1e-300, 10, clock.source());
        REQUIRE(limiter.allow("k").allowed);
        RateLimitDecision denied = limiter.allow("k");
        REQUIRE_FALSE(denied.allowed);
        REQUIRE(denied.retry_after > 0ms);
        REQUIRE(retry_after_seconds(denied.retry_after) > 0);
    }
}

TEST_CASE("RateLimiter is safe under concurrent use", "[gateway][rate_limit]") {
    FakeClock clock;
    RateLimiter limiter(100, 1, 1000, clock.source());

    std::atomic<int> allowed{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 50; ++i) {
                if (limiter.allow("shared").allowed) {
                    allowed.fetch_add(1);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    // Clock is frozen, so exactly the burst gets through
    REQUIRE(allowed.load() == 100);
}

TEST_CASE("Request key extraction", "[gateway][rate_limit]") {
    Request request;
    request.client_ip = "198.51.100.4";
    request.headers = {{"X-Api-Key", "secret"}, {"Cookie", "sid=abc123; lang=en"}};

    SECTION("client address") {
        auto key = RequestKeyExtractor::parse("client_ip");
        REQUIRE(key.has_value());
        REQUIRE(key->extract(request) == "198.51.100.4");
        REQUIRE(key->describe() == "client_ip");
    }

    SECTION("header") {
        auto key = RequestKeyExtractor::parse("header:x-api-key");
        REQUIRE(key.has_value());
        REQUIRE(key->source() == RequestKeyExtractor::Source::Header);
        REQUIRE(key->extract(request) == "secret");
        REQUIRE(key->describe() == "header:x-api-key");
    }

    SECTION("cookie") {
        auto key = RequestKeyExtractor::parse("cookie:sid");
        REQUIRE(key.has_value());
        REQUIRE(key->extract(request) == "abc123");
    }

    SECTION("absent header yields an empty key") {
        auto key = RequestKeyExtractor::parse("header:Authorization");
        REQUIRE(key.has_value());
        REQUIRE(key->extract(request).empty());
    }

    SECTION("malformed descriptions") {
        REQUIRE_FALSE(RequestKeyExtractor::parse("header:").has_value());
        REQUIRE_FALSE(RequestKeyExtractor::parse("query:id").has_value());
        REQUIRE_FALSE(RequestKeyExtractor::parse("").has_value());
    }
}

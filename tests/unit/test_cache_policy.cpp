// Harbor Cache Policy Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>

#include "../../src/gateway/cache_policy.hpp"
#include "../../src/gateway/cache_store.hpp"
#include "../../src/http/http.hpp"

using namespace harbor::gateway;
using namespace harbor::http;
using namespace std::chrono_literals;

namespace {

Request get(std::string host, std::string path, std::string query = "") {
    Request request;
    request.method = Method::GET;
    request.host = std::move(host);
    request.path = std::move(path);
    request.query = std::move(query);
    return request;
}

CacheRule rule_with_ttl(uint16_t status, std::chrono::seconds ttl) {
    CacheRule rule;
    rule.ttl_by_status[status] = ttl;
    return rule;
}

Response response_with(StatusCode status, Headers headers = {}) {
    Response response;
    response.status = status;
    response.headers = std::move(headers);
    response.body = "body";
    return response;
}

}  // namespace

TEST_CASE("Cache keys are normalized", "[gateway][cache_policy]") {
    CacheRule rule;

    SECTION("query parameters are sorted") {
        Request a = get("example.com", "/items", "b=2&a=1");
        Request b = get("example.com", "/items", "a=1&b=2");
        REQUIRE(CachePolicy::build_key(a, rule) == "GET http://example.com/items?a=1&b=2");
        REQUIRE(CachePolicy::build_key(a, rule) == CachePolicy::build_key(b, rule));
    }

    SECTION("host is lowercased and the default port dropped") {
        Request request = get("Example.COM:80", "/");
        REQUIRE(CachePolicy::build_key(request, rule) == "GET http://example.com/");

        Request other_port = get("example.com:8080", "/");
        REQUIRE(CachePolicy::build_key(other_port, rule) == "GET http://example.com:8080/");
    }

    SECTION("method is part of the key") {
        Request head = get("example.com", "/");
        head.method = Method::HEAD;
        REQUIRE(CachePolicy::build_key(head, rule) == "HEAD http://example.com/");
    }

    SECTION("vary headers extend the key") {
        rule.vary_headers = {"Accept-Encoding"};
        Request gzip = get("example.com", "/");
        gzip.headers = {{"Accept-Encoding", "gzip"}};
        Request plain = get("example.com", "/");

        REQUIRE(CachePolicy::build_key(gzip, rule) ==
                "GET http://example.com/|accept-encoding=gzip");
        REQUIRE(CachePolicy::build_key(plain, rule) == "GET http://example.com/|accept-encoding=");
    }
}

TEST_CASE("Cache rules match by prefix or glob", "[gateway][cache_policy]") {
    CacheRule api;
    api.path = "/api/";
    CacheRule images;
    images.path = "/static/*.png";
    CachePolicy policy({api, images});

    REQUIRE(policy.match(get("h", "/api/users")) == &policy.rules()[0]);
    REQUIRE(policy.match(get("h", "/static/logo.png")) == &policy.rules()[1]);
    REQUIRE(policy.match(get("h", "/static/app.js")) == nullptr);
    REQUIRE(policy.match(get("h", "/other")) == nullptr);
    REQUIRE_FALSE(policy.empty());
}

TEST_CASE("Cache bypass predicates", "[gateway][cache_policy]") {
    CacheRule rule;
    rule.bypass.cookies = {"session"};
    rule.bypass.headers = {"Authorization"};
    rule.bypass.query_params = {"nocache"};

    Request request = get("example.com", "/");
    REQUIRE_FALSE(CachePolicy::should_bypass(rule, request));

    SECTION("non-cacheable methods") {
        request.method = Method::POST;
        REQUIRE(CachePolicy::should_bypass(rule, request));
    }

    SECTION("method not listed by the rule") {
        rule.methods = {Method::GET};
        request.method = Method::HEAD;
        REQUIRE(CachePolicy::should_bypass(rule, request));
    }

    SECTION("cookie") {
        request.headers = {{"Cookie", "theme=dark; session=xyz"}};
        REQUIRE(CachePolicy::should_bypass(rule, request));
    }

    SECTION("empty or zero values do not bypass") {
        request.headers = {{"Cookie", "session=0"}, {"Authorization", ""}};
        request.query = "nocache=0";
        REQUIRE_FALSE(CachePolicy::should_bypass(rule, request));
    }

    SECTION("header") {
        request.headers = {{"Authorization", "Bearer t"}};
        REQUIRE(CachePolicy::should_bypass(rule, request));
    }

    SECTION("query parameter") {
        request.query = "page=2&nocache=1";
        REQUIRE(CachePolicy::should_bypass(rule, request));
    }
}

TEST_CASE("TTL selection", "[gateway][cache_policy]") {
    CacheRule rule = rule_with_ttl(200, 60s);

    SECTION("status listed") {
        REQUIRE(CachePolicy::ttl_for(rule, response_with(StatusCode::OK)) == 60s);
    }

    SECTION("status not listed") {
        REQUIRE_FALSE(CachePolicy::ttl_for(rule, response_with(StatusCode::NotFound)).has_value());
        rule.ttl_any = 5s;
        REQUIRE(CachePolicy::ttl_for(rule, response_with(StatusCode::NotFound)) == 5s);
    }

    SECTION("Cache-Control overrides the configured TTL") {
        auto max_age = response_with(StatusCode::OK, {{"Cache-Control", "public, max-age=120"}});
        REQUIRE(CachePolicy::ttl_for(rule, max_age) == 120s);

        auto s_maxage = response_with(StatusCode::OK,
                                      {{"Cache-Control", "max-age=120, s-maxage=30"}});
        REQUIRE(CachePolicy::ttl_for(rule, s_maxage) == 30s);

        auto zero = response_with(StatusCode::OK, {{"Cache-Control", "max-age=0"}});
        REQUIRE_FALSE(CachePolicy::ttl_for(rule, zero).has_value());
    }

    SECTION("huge max-age saturates and still caches") {
        auto forever = response_with(StatusCode::OK, {{"Cache-Control", "max-age=31536000000"}});
        auto ttl = CachePolicy::ttl_for(rule, forever);
        REQUIRE(ttl == kMaxDeltaSeconds);

        auto beyond_int64 =
            response_with(StatusCode::OK, {{"Cache-Control", "s-maxage=99999999999999999999"}});
        REQUIRE(CachePolicy::ttl_for(rule, beyond_int64) == kMaxDeltaSeconds);

        CacheStore store;
        auto entry = std::make_shared<CacheEntry>();
        entry->key = "GET http://app.example.com/forever";
        entry->body = "kept";
        entry->created_at = CacheClock::now();
        entry->ttl = *ttl;
        REQUIRE_FALSE(store.put(entry));

        auto lookup = store.get(entry->key);
        REQUIRE(lookup);
        REQUIRE_FALSE(lookup.expired);
        REQUIRE(lookup.state == CacheEntryState::Fresh);
        REQUIRE(lookup.entry->body == "kept");
    }

    SECTION("configured TTL is capped") {
        rule.ttl_by_status[200] = std::chrono::seconds(4000000000LL);
        REQUIRE(CachePolicy::ttl_for(rule, response_with(StatusCode::OK)) == kMaxDeltaSeconds);
    }

    SECTION("negative max-age is ignored") {
        auto negative = response_with(StatusCode::OK, {{"Cache-Control", "max-age=-5"}});
        REQUIRE(CachePolicy::ttl_for(rule, negative) == 60s);
    }

    SECTION("uncacheable responses") {
        REQUIRE_FALSE(CachePolicy::ttl_for(
            rule, response_with(StatusCode::OK, {{"Cache-Control", "no-store"}})));
        REQUIRE_FALSE(CachePolicy::ttl_for(
            rule, response_with(StatusCode::OK, {{"Cache-Control", "private"}})));
        REQUIRE_FALSE(CachePolicy::ttl_for(
            rule, response_with(StatusCode::OK, {{"Set-Cookie", "id=1"}})));
        REQUIRE_FALSE(CachePolicy::ttl_for(rule, response_with(StatusCode::OK, {{"Vary", "*"}})));
    }

    SECTION("Cache-Control ignored when configured") {
        rule.respect_cache_control = false;
        auto response = response_with(StatusCode::OK,
                                      {{"Cache-Control", "no-store"}, {"Set-Cookie", "id=1"}});
        REQUIRE(CachePolicy::ttl_for(rule, response) == 60s);
    }
}

TEST_CASE("Cache-Control parsing", "[gateway][cache_policy]") {
    CacheControl cc = parse_cache_control("No-Cache, max-age=\"300\", s-maxage=bogus");
    REQUIRE(cc.no_cache);
    REQUIRE_FALSE(cc.no_store);
    REQUIRE(cc.max_age == 300s);
    REQUIRE_FALSE(cc.s_maxage.has_value());
}

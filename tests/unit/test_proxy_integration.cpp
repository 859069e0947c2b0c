// Harbor end-to-end tests: client -> Listener -> ProxyEngine -> loopback origins

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../../src/control/config.hpp"
#include "../../src/control/metrics.hpp"
#include "../../src/core/listener.hpp"
#include "../../src/core/server_runner.hpp"
#include "../../src/core/socket.hpp"
#include "../../src/http/http.hpp"
#include "../../src/http/parser.hpp"

using namespace harbor;
using namespace std::chrono_literals;

namespace {

/// Origin server built on the same Listener, answering with its own name
class MockOrigin {
public:
    explicit MockOrigin(std::string name) : name_(std::move(name)) {
        core::ListenerOptions options;
        options.address = "127.0.0.1";
        options.port = 0;
        options.shutdown_timeout = 1000ms;
        listener_ = std::make_unique<core::Listener>(
            options,
            [this](const http::Request& request, const core::CancellationToken&,
                   std::string_view) -> std::optional<http::Response> {
                hits_.fetch_add(1);
                {
                    std::lock_guard lock(mutex_);
                    last_forwarded_for_ = std::string(request.get_header("X-Forwarded-For"));
                }
                http::Response response;
                response.add_header("Content-Type", "text/plain");
                response.add_header("X-Origin", name_);
                response.body = name_ + " " + request.uri();
                return response;
            },
            metrics_);
    }

    ~MockOrigin() { listener_->stop(); }

    [[nodiscard]] std::error_code start() { return listener_->start(); }
    [[nodiscard]] uint16_t port() const { return listener_->port(); }
    [[nodiscard]] int hits() const { return hits_.load(); }

    [[nodiscard]] std::string last_forwarded_for() const {
        std::lock_guard lock(mutex_);
        return last_forwarded_for_;
    }

private:
    std::string name_;
    control::ProxyMetrics metrics_;
    std::unique_ptr<core::Listener> listener_;
    std::atomic<int> hits_{0};
    mutable std::mutex mutex_;
    std::string last_forwarded_for_;
};

/// Blocking test client over one TCP connection
class TestClient {
public:
    explicit TestClient(uint16_t port) {
        std::error_code ec;
        fd_ = core::connect_with_timeout("127.0.0.1", port, 1000ms, core::CancellationToken{}, ec);
    }
    ~TestClient() { core::close_fd(fd_); }

    TestClient(const TestClient&) = delete;
    TestClient& operator=(const TestClient&) = delete;

    [[nodiscard]] bool connected() const { return fd_ >= 0; }

    bool send(std::string_view raw) {
        return !core::send_all(fd_, raw, 1000ms, core::CancellationToken{});
    }

    /// Read one response; nullopt on timeout or close before a full message
    std::optional<http::Response> read_response(bool head = false) {
        http::Parser parser;
        parser.set_skip_body(head);
        http::Response response;

        while (true) {
            if (!pending_.empty()) {
                auto [result, consumed] = parser.parse_response(pending_, response);
                pending_.erase(0, consumed);
                if (result == http::ParseResult::Complete) {
                    return response;
                }
                if (result == http::ParseResult::Error) {
                    return std::nullopt;
                }
            }

            char buffer[4096];
            size_t received = 0;
            auto ec = core::recv_some(fd_, buffer, sizeof(buffer), 2000ms,
                                      core::CancellationToken{}, received);
            if (ec) {
                return std::nullopt;
            }
            if (received == 0) {
                return parser.finish() == http::ParseResult::Complete
                           ? std::optional<http::Response>(response)
                           : std::nullopt;
            }
            pending_.append(buffer, received);
        }
    }

    std::optional<http::Response> get(std::string_view path, std::string_view extra = {}) {
        std::string raw = "GET " + std::string(path) + " HTTP/1.1\r\nHost: app.test\r\n" +
                          std::string(extra) + "\r\n";
        if (!send(raw)) {
            return std::nullopt;
        }
        return read_response();
    }

private:
    int fd_ = -1;
    std::string pending_;
};

control::Config proxy_config(const std::vector<uint16_t>& origin_ports) {
    control::Config config;
    config.server.listen_address = "127.0.0.1";
    config.server.listen_port = 0;
    config.server.shutdown_timeout = 1000;
    config.server.max_request_size = 1024;

    control::UpstreamConfig upstream;
    upstream.name = "app";
    upstream.max_fails = 1;
    upstream.fail_timeout = 30;
    for (uint16_t port : origin_ports) {
        control::BackendConfig backend;
        backend.host = "127.0.0.1";
        backend.port = port;
        upstream.backends.push_back(backend);
    }
    config.upstreams.push_back(upstream);
    config.routes.push_back({"/", "app"});

    config.proxy.connect_timeout = 500;
    config.proxy.read_timeout = 2000;
    config.proxy.expose_upstream_address = true;

    config.admin.enabled = true;
    config.admin.address = "127.0.0.1";
    config.admin.port = 0;
    return config;
}

uint16_t unused_port() {
    int fd = core::create_listening_socket("127.0.0.1", 0, 1);
    uint16_t port = core::local_port(fd);
    core::close_fd(fd);
    return port;
}

}  // namespace

TEST_CASE("Proxy balances requests across live origins", "[integration]") {
    MockOrigin a("alpha");
    MockOrigin b("beta");
    REQUIRE_FALSE(a.start());
    REQUIRE_FALSE(b.start());

    core::ServerRunner runner(proxy_config({a.port(), b.port()}));
    REQUIRE_FALSE(runner.start());
    REQUIRE(runner.port() != 0);

    TestClient client(runner.port());
    REQUIRE(client.connected());

    auto first = client.get("/hello?x=1");
    auto second = client.get("/hello?x=1");
    auto third = client.get("/hello?x=1");
    REQUIRE(first);
    REQUIRE(second);
    REQUIRE(third);

    REQUIRE(first->status_code() == 200);
    REQUIRE(first->body == "alpha /hello?x=1");
    REQUIRE(second->body == "beta /hello?x=1");
    REQUIRE(third->body == "alpha /hello?x=1");
    REQUIRE(first->get_header("Connection") == "keep-alive");
    REQUIRE_FALSE(first->get_header("X-Upstream-Addr").empty());

    // The origin sees who the client was
    REQUIRE(a.last_forwarded_for() == "127.0.0.1");

    runner.stop();
}

TEST_CASE("Proxy fails over from a dead origin", "[integration]") {
    MockOrigin live("live");
    REQUIRE_FALSE(live.start());

    core::ServerRunner runner(proxy_config({unused_port(), live.port()}));
    REQUIRE_FALSE(runner.start());

    TestClient client(runner.port());
    for (int i = 0; i < 4; ++i) {
        auto response = client.get("/");
        REQUIRE(response);
        REQUIRE(response->status_code() == 200);
        REQUIRE(response->body == "live /");
    }
    REQUIRE(live.hits() == 4);

    auto& pools = runner.gateway()->pools;
    REQUIRE(pools.size() == 1);
    REQUIRE(pools.front()->servers().front()->state() == gateway::ServerState::Unhealthy);
}

TEST_CASE("All origins down yields 503 after 502", "[integration]") {
    core::ServerRunner runner(proxy_config({unused_port()}));
    REQUIRE_FALSE(runner.start());

    TestClient client(runner.port());
    auto first = client.get("/");
    REQUIRE(first);
    REQUIRE(first->status_code() == 502);

    // The only server is now unhealthy and inside its fail_timeout
    auto second = client.get("/");
    REQUIRE(second);
    REQUIRE(second->status_code() == 503);
}

TEST_CASE("Pipelined requests are answered in order", "[integration]") {
    MockOrigin origin("solo");
    REQUIRE_FALSE(origin.start());
    core::ServerRunner runner(proxy_config({origin.port()}));
    REQUIRE_FALSE(runner.start());

    TestClient client(runner.port());
    REQUIRE(client.send("GET /one HTTP/1.1\r\nHost: app.test\r\n\r\n"
                        "GET /two HTTP/1.1\r\nHost: app.test\r\n\r\n"
                        "GET /three HTTP/1.1\r\nHost: app.test\r\nConnection: close\r\n\r\n"));

    auto one = client.read_response();
    auto two = client.read_response();
    auto three = client.read_response();
    REQUIRE(one);
    REQUIRE(two);
    REQUIRE(three);
    REQUIRE(one->body == "solo /one");
    REQUIRE(two->body == "solo /two");
    REQUIRE(three->body == "solo /three");
    REQUIRE(three->get_header("Connection") == "close");
}

TEST_CASE("Malformed and oversized requests are rejected", "[integration]") {
    MockOrigin origin("solo");
    REQUIRE_FALSE(origin.start());
    core::ServerRunner runner(proxy_config({origin.port()}));
    REQUIRE_FALSE(runner.start());

    SECTION("garbage request line") {
        TestClient client(runner.port());
        REQUIRE(client.send("THIS IS NOT HTTP\r\n\r\n"));
        auto response = client.read_response();
        REQUIRE(response);
        REQUIRE(response->status_code() == 400);
    }

    SECTION("body over the limit") {
        TestClient client(runner.port());
        std::string body(4096, 'x');
        REQUIRE(client.send("POST /upload HTTP/1.1\r\nHost: app.test\r\nContent-Length: 4096\r\n\r\n" +
                            body));
        auto response = client.read_response();
        REQUIRE(response);
        REQUIRE(response->status_code() == 413);
    }

    REQUIRE(origin.hits() == 0);
}

TEST_CASE("Cached responses skip the origin and can be purged", "[integration]") {
    MockOrigin origin("cached");
    REQUIRE_FALSE(origin.start());

    control::Config config = proxy_config({origin.port()});
    config.cache.enabled = true;
    control::CacheRuleConfig rule;
    rule.path = "/";
    rule.ttl["200"] = 60;
    config.cache.rules.push_back(rule);

    core::ServerRunner runner(config);
    REQUIRE_FALSE(runner.start());
    REQUIRE(runner.admin_port() != 0);

    TestClient client(runner.port());
    auto miss = client.get("/article");
    auto hit = client.get("/article");
    REQUIRE(miss->get_header("X-Cache-Status") == "MISS");
    REQUIRE(hit->get_header("X-Cache-Status") == "HIT");
    REQUIRE(hit->body == miss->body);
    REQUIRE(origin.hits() == 1);

    {
        TestClient admin(runner.admin_port());
        REQUIRE(admin.send("POST /cache/purge?pattern=%2Farticle HTTP/1.1\r\n"
                           "Host: localhost\r\nContent-Length: 0\r\n\r\n"));
        auto purge = admin.read_response();
        REQUIRE(purge);
        REQUIRE(purge->status_code() == 200);
        auto body = nlohmann::json::parse(purge->body);
        REQUIRE(body["purged"] == 0);  // Pattern must match the whole key
    }
    {
        TestClient admin(runner.admin_port());
        REQUIRE(admin.send("POST /cache/purge?pattern=*%2Farticle HTTP/1.1\r\n"
                           "Host: localhost\r\nContent-Length: 0\r\n\r\n"));
        auto purge = admin.read_response();
        REQUIRE(purge);
        auto body = nlohmann::json::parse(purge->body);
        REQUIRE(body["purged"] == 1);
    }

    auto refetched = client.get("/article");
    REQUIRE(refetched->get_header("X-Cache-Status") == "MISS");
    REQUIRE(origin.hits() == 2);

    {
        TestClient admin(runner.admin_port());
        auto status = admin.get("/status");
        REQUIRE(status);
        REQUIRE(status->status_code() == 200);
        auto json = nlohmann::json::parse(status->body);
        REQUIRE(json["status"] == "healthy");
        REQUIRE(json["upstreams"].size() == 1);
        REQUIRE(json["upstreams"][0]["name"] == "app");
    }
}

TEST_CASE("Rate limiting over the wire", "[integration]") {
    MockOrigin origin("limited");
    REQUIRE_FALSE(origin.start());

    control::Config config = proxy_config({origin.port()});
    control::RateLimitConfig zone;
    zone.name = "per_client";
    zone.capacity = 2;
    zone.rate = 0.1;
    config.rate_limits.push_back(zone);

    core::ServerRunner runner(config);
    REQUIRE_FALSE(runner.start());

    TestClient client(runner.port());
    REQUIRE(client.get("/")->status_code() == 200);
    REQUIRE(client.get("/")->status_code() == 200);

    auto limited = client.get("/");
    REQUIRE(limited);
    REQUIRE(limited->status_code() == 429);
    REQUIRE(limited->get_header("Retry-After") == "10");
    REQUIRE(origin.hits() == 2);
}

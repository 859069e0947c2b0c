// Harbor Configuration Layer Unit Tests

#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>

#include "../../src/control/config.hpp"

using namespace harbor::control;

namespace {

Config minimal_config() {
    Config config;
    UpstreamConfig upstream;
    upstream.name = "backend";
    BackendConfig backend;
    backend.host = "10.0.0.1";
    backend.port = 8080;
    upstream.backends.push_back(backend);
    config.upstreams.push_back(upstream);
    config.routes.push_back({"/", "backend"});
    return config;
}

bool has_message(const std::vector<std::string>& messages, std::string_view needle) {
    for (const auto& message : messages) {
        if (message.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

}  // namespace

TEST_CASE("Config defaults", "[control][config]") {
    Config config;
    REQUIRE(config.server.listen_port == 8080);
    REQUIRE(config.server.max_request_size == 1048576);
    REQUIRE(config.proxy.max_attempts == 3);
    REQUIRE(config.proxy.retriable_statuses == std::vector<uint16_t>{502, 503, 504});
    REQUIRE_FALSE(config.proxy.retry_non_idempotent);
    REQUIRE_FALSE(config.cache.enabled);
    REQUIRE(config.admin.enabled);
    REQUIRE(config.admin.address == "127.0.0.1");
}

TEST_CASE("Config JSON deserialization fills defaults", "[control][config]") {
    const char* json = R"({
        "server": { "listen_port": 9000 },
        "upstreams": [
            {
                "name": "app",
                "load_balancing": "least_connections",
                "max_fails": 2,
                "backends": [
                    { "host": "10.0.0.1", "port": 3000, "weight": 3 },
                    { "host": "10.0.0.2", "port": 3000, "role": "backup", "max_fails": 5 }
                ],
                "health_check": { "enabled": true, "path": "/ping" }
            }
        ],
        "routes": [ { "path": "/api", "upstream": "app" } ],
        "cache": {
            "enabled": true,
            "stale_while_revalidate": 30,
            "rules": [ { "path": "/static", "ttl": { "200": 300, "any": 10 } } ]
        },
        "rate_limits": [ { "name": "per_ip", "capacity": 20, "rate": 5 } ]
    })";

    auto maybe_config = ConfigLoader::load_from_json(json);
    REQUIRE(maybe_config.has_value());
    const auto& config = *maybe_config;

    REQUIRE(config.server.listen_port == 9000);
    REQUIRE(config.server.listen_address == "0.0.0.0");

    REQUIRE(config.upstreams.size() == 1);
    const auto& upstream = config.upstreams[0];
    REQUIRE(upstream.load_balancing == "least_connections");
    REQUIRE(upstream.max_fails == 2);
    REQUIRE(upstream.fail_timeout == 10);
    REQUIRE(upstream.backends[0].weight == 3);
    REQUIRE(upstream.backends[0].role == "primary");
    REQUIRE_FALSE(upstream.backends[0].max_fails.has_value());
    REQUIRE(upstream.backends[1].role == "backup");
    REQUIRE(*upstream.backends[1].max_fails == 5);
    REQUIRE(upstream.health_check.enabled);
    REQUIRE(upstream.health_check.path == "/ping");
    REQUIRE(upstream.health_check.interval == 5);
    REQUIRE(upstream.keepalive.pool_size == 32);

    REQUIRE(config.routes[0].path == "/api");

    REQUIRE(config.cache.enabled);
    REQUIRE(config.cache.stale_while_revalidate == 30);
    REQUIRE(config.cache.rules[0].ttl.at("200") == 300);
    REQUIRE(config.cache.rules[0].ttl.at("any") == 10);
    REQUIRE(config.cache.rules[0].methods == std::vector<std::string>{"GET", "HEAD"});

    REQUIRE(config.rate_limits[0].key == "client_ip");
    REQUIRE(config.rate_limits[0].capacity == 20.0);
    REQUIRE(config.rate_limits[0].status == 429);
}

TEST_CASE("Config JSON round trip keeps backend overrides", "[control][config]") {
    Config config = minimal_config();
    config.upstreams[0].backends[0].fail_timeout = 7;

    std::string json = ConfigLoader::to_json(config);
    REQUIRE(json.find("\"fail_timeout\": 7") != std::string::npos);
    REQUIRE(json.find("\"max_fails\": 1") != std::string::npos);

    auto reloaded = ConfigLoader::load_from_json(json);
    REQUIRE(reloaded.has_value());
    REQUIRE(*reloaded->upstreams[0].backends[0].fail_timeout == 7);
    REQUIRE_FALSE(reloaded->upstreams[0].backends[0].max_fails.has_value());
}

TEST_CASE("Config loading rejects bad input", "[control][config]") {
    SECTION("invalid JSON") {
        REQUIRE_FALSE(ConfigLoader::load_from_json("{ not json").has_value());
    }

    SECTION("backend without host") {
        REQUIRE_FALSE(ConfigLoader::load_from_json(
                          R"({"upstreams": [{"name": "a", "backends": [{"port": 80}]}]})")
                          .has_value());
    }

    SECTION("validation errors") {
        REQUIRE_FALSE(ConfigLoader::load_from_json(
                          R"({"routes": [{"path": "/", "upstream": "missing"}]})")
                          .has_value());
    }

    SECTION("missing file") {
        REQUIRE_FALSE(ConfigLoader::load_from_file("/nonexistent/harbor.json").has_value());
    }
}

TEST_CASE("Config loads from file", "[control][config]") {
    auto path = std::filesystem::temp_directory_path() / "harbor_config_test.json";
    {
        std::ofstream out(path);
        out << ConfigLoader::to_json(minimal_config());
    }

    auto config = ConfigLoader::load_from_file(path.string());
    std::filesystem::remove(path);

    REQUIRE(config.has_value());
    REQUIRE(config->upstreams[0].backends[0].host == "10.0.0.1");
}

TEST_CASE("Config validation - valid config", "[control][config]") {
    auto validation = ConfigLoader::validate(minimal_config());
    REQUIRE(validation.valid);
    REQUIRE_FALSE(validation.has_errors());
    REQUIRE(validation.warnings.empty());
}

TEST_CASE("Config validation - routes", "[control][config]") {
    Config config = minimal_config();

    SECTION("route to unknown upstream suggests a close name") {
        config.routes[0].upstream = "backnd";
        auto validation = ConfigLoader::validate(config);
        REQUIRE(validation.has_errors());
        REQUIRE(has_message(validation.errors, "non-existent upstream 'backnd'"));
        REQUIRE(has_message(validation.errors, "Did you mean: backend"));
    }

    SECTION("no suggestion for distant names") {
        config.routes[0].upstream = "payments";
        auto validation = ConfigLoader::validate(config);
        REQUIRE(validation.has_errors());
        REQUIRE_FALSE(has_message(validation.errors, "Did you mean"));
    }

    SECTION("path must be absolute") {
        config.routes[0].path = "api";
        REQUIRE(has_message(ConfigLoader::validate(config).errors, "must start with '/'"));
    }

    SECTION("no routes falls back with a warning") {
        config.routes.clear();
        auto validation = ConfigLoader::validate(config);
        REQUIRE_FALSE(validation.has_errors());
        REQUIRE(has_message(validation.warnings, "all requests go to upstream 'backend'"));
    }
}

TEST_CASE("Config validation - upstreams", "[control][config]") {
    Config config = minimal_config();
    auto& upstream = config.upstreams[0];

    SECTION("unknown balancing policy") {
        upstream.load_balancing = "round_robbin";
        auto validation = ConfigLoader::validate(config);
        REQUIRE(has_message(validation.errors, "Unknown load_balancing strategy"));
        REQUIRE(has_message(validation.errors, "Did you mean: round_robin"));
    }

    SECTION("bad hash key") {
        upstream.load_balancing = "consistent_hash";
        upstream.hash_key = "header:";
        REQUIRE(has_message(ConfigLoader::validate(config).errors, "Invalid hash_key"));
    }

    SECTION("zero weight and port") {
        upstream.backends[0].weight = 0;
        upstream.backends[0].port = 0;
        auto validation = ConfigLoader::validate(config);
        REQUIRE(has_message(validation.errors, "weight 0"));
        REQUIRE(has_message(validation.errors, "port must be > 0"));
    }

    SECTION("only backups") {
        upstream.backends[0].role = "backup";
        REQUIRE(has_message(ConfigLoader::validate(config).errors, "has no primary backend"));
    }

    SECTION("unknown role") {
        upstream.backends[0].role = "standby";
        REQUIRE(has_message(ConfigLoader::validate(config).errors, "Unknown role 'standby'"));
    }

    SECTION("duplicate backend warns") {
        upstream.backends.push_back(upstream.backends[0]);
        auto validation = ConfigLoader::validate(config);
        REQUIRE_FALSE(validation.has_errors());
        REQUIRE(has_message(validation.warnings, "Duplicate backend 10.0.0.1:8080"));
    }

    SECTION("duplicate upstream name") {
        config.upstreams.push_back(upstream);
        REQUIRE(has_message(ConfigLoader::validate(config).errors,
                            "Duplicate upstream name 'backend'"));
    }

    SECTION("fail_timeout zero with max_fails") {
        upstream.fail_timeout = 0;
        REQUIRE(has_message(ConfigLoader::validate(config).errors, "fail_timeout must be > 0"));
    }

    SECTION("health check path") {
        upstream.health_check.enabled = true;
        upstream.health_check.path = "health";
        REQUIRE(has_message(ConfigLoader::validate(config).errors,
                            "health_check path must start with '/'"));
    }
}

TEST_CASE("Config validation - cache", "[control][config]") {
    Config config = minimal_config();
    config.cache.enabled = true;

    SECTION("no rules warns") {
        auto validation = ConfigLoader::validate(config);
        REQUIRE_FALSE(validation.has_errors());
        REQUIRE(has_message(validation.warnings, "no cache rules"));
    }

    SECTION("bad ttl status") {
        CacheRuleConfig rule;
        rule.ttl["2xx"] = 60;
        rule.ttl["999"] = 60;
        config.cache.rules.push_back(rule);
        auto validation = ConfigLoader::validate(config);
        REQUIRE(has_message(validation.errors, "Invalid ttl status '2xx'"));
        REQUIRE(has_message(validation.errors, "Invalid ttl status '999'"));
    }

    SECTION("only GET and HEAD are cacheable") {
        CacheRuleConfig rule;
        rule.ttl["200"] = 60;
        rule.methods = {"GET", "POST"};
        config.cache.rules.push_back(rule);
        REQUIRE(has_message(ConfigLoader::validate(config).errors,
                            "Cache method must be GET or HEAD, got 'POST'"));
    }

    SECTION("disabled cache is not checked") {
        config.cache.enabled = false;
        config.cache.max_entries = 0;
        REQUIRE_FALSE(ConfigLoader::validate(config).has_errors());
    }
}

TEST_CASE("Config validation - rate limits", "[control][config]") {
    Config config = minimal_config();
    RateLimitConfig zone;
    zone.name = "per_ip";

    SECTION("bad key") {
        zone.key = "path";
        config.rate_limits.push_back(zone);
        REQUIRE(has_message(ConfigLoader::validate(config).errors, "Invalid key 'path'"));
    }

    SECTION("capacity and rate") {
        zone.capacity = 0.5;
        zone.rate = 0;
        config.rate_limits.push_back(zone);
        auto validation = ConfigLoader::validate(config);
        REQUIRE(has_message(validation.errors, "Capacity must be >= 1"));
        REQUIRE(has_message(validation.errors, "Rate must be > 0"));
    }

    SECTION("status must be an error") {
        zone.status = 200;
        config.rate_limits.push_back(zone);
        REQUIRE(has_message(ConfigLoader::validate(config).errors, "Status must be 4xx or 5xx"));
    }

    SECTION("duplicate zone names") {
        config.rate_limits.push_back(zone);
        config.rate_limits.push_back(zone);
        REQUIRE(has_message(ConfigLoader::validate(config).errors,
                            "Duplicate rate limit name 'per_ip'"));
    }
}

TEST_CASE("Config validation - server, logging and admin", "[control][config]") {
    Config config = minimal_config();

    SECTION("zero limits") {
        config.server.max_request_size = 0;
        config.proxy.max_attempts = 0;
        config.proxy.read_timeout = 0;
        auto validation = ConfigLoader::validate(config);
        REQUIRE(has_message(validation.errors, "max_request_size must be > 0"));
        REQUIRE(has_message(validation.errors, "max_attempts must be > 0"));
        REQUIRE(has_message(validation.errors, "timeouts must be > 0"));
    }

    SECTION("invalid statuses") {
        config.proxy.retriable_statuses.push_back(700);
        REQUIRE(has_message(ConfigLoader::validate(config).errors, "Invalid retriable status 700"));
    }

    SECTION("logging level and format") {
        config.logging.level = "verbose";
        config.logging.format = "xml";
        auto validation = ConfigLoader::validate(config);
        REQUIRE(has_message(validation.errors, "Unknown logging level 'verbose'"));
        REQUIRE(has_message(validation.errors, "Unknown logging format 'xml'"));
    }

    SECTION("admin port collides with listener") {
        config.admin.port = config.server.listen_port;
        config.admin.address = "0.0.0.0";
        REQUIRE(has_message(ConfigLoader::validate(config).errors, "conflicts with listen_port"));
    }

    SECTION("admin port collision ignored when disabled") {
        config.admin.enabled = false;
        config.admin.port = config.server.listen_port;
        REQUIRE_FALSE(ConfigLoader::validate(config).has_errors());
    }
}

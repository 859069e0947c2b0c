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


// Harbor Configuration - Header
// JSON configuration schema using nlohmann/json for serialization

#pragma once

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace harbor::control {

/// Listener and client-side limits
struct ServerConfig {
    std::string listen_address = "0.0.0.0";
    uint16_t listen_port = 8080;
    uint32_t backlog = 511;

    uint32_t max_connections = 1024;
    uint32_t max_request_size = 1048576;  // 1MB body
    uint32_t max_header_size = 8192;      // 8KB

    // Timeouts (milliseconds)
    uint32_t client_read_timeout = 60000;
    uint32_t keepalive_timeout = 75000;
    uint32_t shutdown_timeout = 30000;

    uint32_t max_keepalive_requests = 1000;
};

/// Active probing of unhealthy backends
struct HealthCheckConfig {
    bool enabled = false;
    uint32_t interval = 5;      // seconds
    std::string path = "/health";
    uint32_t timeout = 2000;    // milliseconds
    std::vector<uint16_t> expected_statuses;  // Empty: any 2xx or 3xx
};

/// Idle upstream connection reuse
struct KeepaliveConfig {
    uint32_t pool_size = 32;       // Idle connections per backend, 0 disables
    uint32_t idle_timeout = 60;    // seconds
    uint32_t max_requests = 1000;  // Per connection, 0 = unlimited
};

/// Backend server configuration
struct BackendConfig {
    std::string host;
    uint16_t port = 80;
    uint32_t weight = 1;
    std::string role = "primary";  // primary, backup
    std::optional<uint32_t> max_fails;
    std::optional<uint32_t> fail_timeout;  // seconds
    uint32_t max_connections = 0;          // 0 = unlimited
};

/// Upstream pool configuration
struct UpstreamConfig {
    std::string name;
    std::vector<BackendConfig> backends;
    std::string load_balancing = "round_robin";
    std::string hash_key = "client_ip";  // client_ip, header:<Name>, cookie:<Name>

    // Passive health
    uint32_t max_fails = 1;
    uint32_t fail_timeout = 10;     // seconds
    uint32_t max_fail_timeout = 0;  // seconds, probation backoff cap

    HealthCheckConfig health_check;
    KeepaliveConfig keepalive;
};

/// Path prefix to upstream mapping
struct RouteConfig {
    std::string path = "/";
    std::string upstream;
};

/// Forwarding behaviour
struct ProxyConfig {
    uint32_t max_attempts = 3;
    uint32_t connect_timeout = 5000;   // milliseconds
    uint32_t send_timeout = 10000;
    uint32_t read_timeout = 30000;
    uint32_t request_timeout = 60000;  // Overall budget, 0 = unbounded

    std::vector<uint16_t> retriable_statuses = {502, 503, 504};
    std::vector<uint16_t> failure_statuses = {500, 502, 503, 504};
    bool retry_non_idempotent = false;

    bool diagnostic_headers = true;
    bool expose_upstream_address = false;
    std::vector<std::string> hide_headers = {"X-Accel-*", "X-Internal-*"};
    bool forwarded_headers = true;  // X-Forwarded-For, X-Real-IP, X-Forwarded-Proto
};

struct CacheBypassConfig {
    std::vector<std::string> cookies;
    std::vector<std::string> headers;
    std::vector<std::string> query_params;
};

/// Cache directive for a path pattern
struct CacheRuleConfig {
    std::string path = "/";
    std::map<std::string, uint32_t> ttl;  // "200" -> seconds, "any" -> fallback
    std::vector<std::string> methods = {"GET", "HEAD"};
    CacheBypassConfig bypass;
    std::vector<std::string> vary_headers;
    uint32_t max_entry_size = 1048576;
    bool respect_cache_control = true;
};

struct CacheConfig {
    bool enabled = false;
    uint32_t max_entries = 10000;
    uint64_t max_bytes = 256ULL * 1024 * 1024;
    uint32_t shards = 16;
    uint32_t stale_while_revalidate = 0;  // seconds
    bool background_refresh = true;
    uint32_t max_background_refreshes = 4;
    uint32_t lock_timeout = 5000;  // milliseconds
    uint32_t sweep_interval = 60;  // seconds
    std::vector<CacheRuleConfig> rules;
};

/// Named rate limit zone
struct RateLimitConfig {
    std::string name;
    std::string key = "client_ip";  // client_ip, header:<Name>, cookie:<Name>
    double capacity = 10.0;         // Burst size
    double rate = 1.0;              // Tokens per second
    uint32_t max_keys = 100000;
    uint16_t status = 429;
};

/// Logging configuration
struct LogConfig {
    std::string level = "info";     // debug, info, warning, error
    std::string format = "text";    // json, text
    std::string output = "stdout";  // "stdout" or a log directory

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Admin (status) endpoint
struct AdminConfig {
    bool enabled = true;
    std::string address = "127.0.0.1";
    uint16_t port = 9090;
};

/// Full Harbor configuration
struct Config {
    ServerConfig server;
    std::vector<UpstreamConfig> upstreams;
    std::vector<RouteConfig> routes;
    ProxyConfig proxy;
    CacheConfig cache;
    std::vector<RateLimitConfig> rate_limits;
    LogConfig logging;
    AdminConfig admin;
};

// All config types use custom from_json/to_json so partial configs fill defaults

inline void from_json(const nlohmann::json& j, ServerConfig& s) {
    s.listen_address = j.value("listen_address", std::string("0.0.0.0"));
    s.listen_port = j.value("listen_port", uint16_t(8080));
    s.backlog = j.value("backlog", 511u);
    s.max_connections = j.value("max_connections", 1024u);
    s.max_request_size = j.value("max_request_size", 1048576u);
    s.max_header_size = j.value("max_header_size", 8192u);
    s.client_read_timeout = j.value("client_read_timeout", 60000u);
    s.keepalive_timeout = j.value("keepalive_timeout", 75000u);
    s.shutdown_timeout = j.value("shutdown_timeout", 30000u);
    s.max_keepalive_requests = j.value("max_keepalive_requests", 1000u);
}

inline void to_json(nlohmann::json& j, const ServerConfig& s) {
    j = nlohmann::json{{"listen_address", s.listen_address},
                       {"listen_port", s.listen_port},
                       {"backlog", s.backlog},
                       {"max_connections", s.max_connections},
                       {"max_request_size", s.max_request_size},
                       {"max_header_size", s.max_header_size},
                       {"client_read_timeout", s.client_read_timeout},
                       {"keepalive_timeout", s.keepalive_timeout},
                       {"shutdown_timeout", s.shutdown_timeout},
                       {"max_keepalive_requests", s.max_keepalive_requests}};
}

inline void from_json(const nlohmann::json& j, HealthCheckConfig& h) {
    h.enabled = j.value("enabled", false);
    h.interval = j.value("interval", 5u);
    h.path = j.value("path", std::string("/health"));
    h.timeout = j.value("timeout", 2000u);
    h.expected_statuses = j.value("expected_statuses", std::vector<uint16_t>{});
}

inline void to_json(nlohmann::json& j, const HealthCheckConfig& h) {
    j = nlohmann::json{{"enabled", h.enabled},
                       {"interval", h.interval},
                       {"path", h.path},
                       {"timeout", h.timeout},
                       {"expected_statuses", h.expected_statuses}};
}

inline void from_json(const nlohmann::json& j, KeepaliveConfig& k) {
    k.pool_size = j.value("pool_size", 32u);
    k.idle_timeout = j.value("idle_timeout", 60u);
    k.max_requests = j.value("max_requests", 1000u);
}

inline void to_json(nlohmann::json& j, const KeepaliveConfig& k) {
    j = nlohmann::json{{"pool_size", k.pool_size},
                       {"idle_timeout", k.idle_timeout},
                       {"max_requests", k.max_requests}};
}

inline void from_json(const nlohmann::json& j, BackendConfig& b) {
    j.at("host").get_to(b.host);  // host is required
    b.port = j.value("port", uint16_t(80));
    b.weight = j.value("weight", 1u);
    b.role = j.value("role", std::string("primary"));
    if (j.contains("max_fails")) {
        b.max_fails = j.at("max_fails").get<uint32_t>();
    }
    if (j.contains("fail_timeout")) {
        b.fail_timeout = j.at("fail_timeout").get<uint32_t>();
    }
    b.max_connections = j.value("max_connections", 0u);
}

inline void to_json(nlohmann::json& j, const BackendConfig& b) {
    j = nlohmann::json{{"host", b.host},
                       {"port", b.port},
                       {"weight", b.weight},
                       {"role", b.role},
                       {"max_connections", b.max_connections}};
    if (b.max_fails) {
        j["max_fails"] = *b.max_fails;
    }
    if (b.fail_timeout) {
        j["fail_timeout"] = *b.fail_timeout;
    }
}

inline void from_json(const nlohmann::json& j, UpstreamConfig& u) {
    j.at("name").get_to(u.name);          // name is required
    j.at("backends").get_to(u.backends);  // backends is required
    u.load_balancing = j.value("load_balancing", std::string("round_robin"));
    u.hash_key = j.value("hash_key", std::string("client_ip"));
    u.max_fails = j.value("max_fails", 1u);
    u.fail_timeout = j.value("fail_timeout", 10u);
    u.max_fail_timeout = j.value("max_fail_timeout", 0u);
    // Use contains() for custom struct types to avoid infinite recursion
    if (j.contains("health_check")) {
        j.at("health_check").get_to(u.health_check);
    }
    if (j.contains("keepalive")) {
        j.at("keepalive").get_to(u.keepalive);
    }
}

inline void to_json(nlohmann::json& j, const UpstreamConfig& u) {
    j = nlohmann::json{{"name", u.name},
                       {"backends", u.backends},
                       {"load_balancing", u.load_balancing},
                       {"hash_key", u.hash_key},
                       {"max_fails", u.max_fails},
                       {"fail_timeout", u.fail_timeout},
                       {"max_fail_timeout", u.max_fail_timeout},
                       {"health_check", u.health_check},
                       {"keepalive", u.keepalive}};
}

inline void from_json(const nlohmann::json& j, RouteConfig& r) {
    r.path = j.value("path", std::string("/"));
    j.at("upstream").get_to(r.upstream);  // upstream is required
}

inline void to_json(nlohmann::json& j, const RouteConfig& r) {
    j = nlohmann::json{{"path", r.path}, {"upstream", r.upstream}};
}

inline void from_json(const nlohmann::json& j, ProxyConfig& p) {
    ProxyConfig defaults;
    p.max_attempts = j.value("max_attempts", 3u);
    p.connect_timeout = j.value("connect_timeout", 5000u);
    p.send_timeout = j.value("send_timeout", 10000u);
    p.read_timeout = j.value("read_timeout", 30000u);
    p.request_timeout = j.value("request_timeout", 60000u);
    p.retriable_statuses = j.value("retriable_statuses", defaults.retriable_statuses);
    p.failure_statuses = j.value("failure_statuses", defaults.failure_statuses);
    p.retry_non_idempotent = j.value("retry_non_idempotent", false);
    p.diagnostic_headers = j.value("diagnostic_headers", true);
    p.expose_upstream_address = j.value("expose_upstream_address", false);
    p.hide_headers = j.value("hide_headers", defaults.hide_headers);
    p.forwarded_headers = j.value("forwarded_headers", true);
}

inline void to_json(nlohmann::json& j, const ProxyConfig& p) {
    j = nlohmann::json{{"max_attempts", p.max_attempts},
                       {"connect_timeout", p.connect_timeout},
                       {"send_timeout", p.send_timeout},
                       {"read_timeout", p.read_timeout},
                       {"request_timeout", p.request_timeout},
                       {"retriable_statuses", p.retriable_statuses},
                       {"failure_statuses", p.failure_statuses},
                       {"retry_non_idempotent", p.retry_non_idempotent},
                       {"diagnostic_headers", p.diagnostic_headers},
                       {"expose_upstream_address", p.expose_upstream_address},
                       {"hide_headers", p.hide_headers},
                       {"forwarded_headers", p.forwarded_headers}};
}

inline void from_json(const nlohmann::json& j, CacheBypassConfig& b) {
    b.cookies = j.value("cookies", std::vector<std::string>{});
    b.headers = j.value("headers", std::vector<std::string>{});
    b.query_params = j.value("query_params", std::vector<std::string>{});
}

inline void to_json(nlohmann::json& j, const CacheBypassConfig& b) {
    j = nlohmann::json{
        {"cookies", b.cookies}, {"headers", b.headers}, {"query_params", b.query_params}};
}

inline void from_json(const nlohmann::json& j, CacheRuleConfig& r) {
    r.path = j.value("path", std::string("/"));
    r.ttl = j.value("ttl", std::map<std::string, uint32_t>{});
    r.methods = j.value("methods", std::vector<std::string>{"GET", "HEAD"});
    if (j.contains("bypass")) {
        j.at("bypass").get_to(r.bypass);
    }
    r.vary_headers = j.value("vary_headers", std::vector<std::string>{});
    r.max_entry_size = j.value("max_entry_size", 1048576u);
    r.respect_cache_control = j.value("respect_cache_control", true);
}

inline void to_json(nlohmann::json& j, const CacheRuleConfig& r) {
    j = nlohmann::json{{"path", r.path},
                       {"ttl", r.ttl},
                       {"methods", r.methods},
                       {"bypass", r.bypass},
                       {"vary_headers", r.vary_headers},
                       {"max_entry_size", r.max_entry_size},
                       {"respect_cache_control", r.respect_cache_control}};
}

inline void from_json(const nlohmann::json& j, CacheConfig& c) {
    c.enabled = j.value("enabled", false);
    c.max_entries = j.value("max_entries", 10000u);
    c.max_bytes = j.value("max_bytes", uint64_t(256ULL * 1024 * 1024));
    c.shards = j.value("shards", 16u);
    c.stale_while_revalidate = j.value("stale_while_revalidate", 0u);
    c.background_refresh = j.value("background_refresh", true);
    c.max_background_refreshes = j.value("max_background_refreshes", 4u);
    c.lock_timeout = j.value("lock_timeout", 5000u);
    c.sweep_interval = j.value("sweep_interval", 60u);
    if (j.contains("rules")) {
        j.at("rules").get_to(c.rules);
    }
}

inline void to_json(nlohmann::json& j, const CacheConfig& c) {
    j = nlohmann::json{{"enabled", c.enabled},
                       {"max_entries", c.max_entries},
                       {"max_bytes", c.max_bytes},
                       {"shards", c.shards},
                       {"stale_while_revalidate", c.stale_while_revalidate},
                       {"background_refresh", c.background_refresh},
                       {"max_background_refreshes", c.max_background_refreshes},
                       {"lock_timeout", c.lock_timeout},
                       {"sweep_interval", c.sweep_interval},
                       {"rules", c.rules}};
}

inline void from_json(const nlohmann::json& j, RateLimitConfig& r) {
    r.name = j.value("name", std::string());
    r.key = j.value("key", std::string("client_ip"));
    r.capacity = j.value("capacity", 10.0);
    r.rate = j.value("rate", 1.0);
    r.max_keys = j.value("max_keys", 100000u);
    r.status = j.value("status", uint16_t(429));
}

inline void to_json(nlohmann::json& j, const RateLimitConfig& r) {
    j = nlohmann::json{{"name", r.name},         {"key", r.key},
                       {"capacity", r.capacity}, {"rate", r.rate},
                       {"max_keys", r.max_keys}, {"status", r.status}};
}

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("text"));
    l.output = j.value("output", std::string("stdout"));
    if (j.contains("rotation")) {
        j.at("rotation").get_to(l.rotation);
    }
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{
        {"level", l.level}, {"format", l.format}, {"output", l.output}, {"rotation", l.rotation}};
}

inline void from_json(const nlohmann::json& j, AdminConfig& a) {
    a.enabled = j.value("enabled", true);
    a.address = j.value("address", std::string("127.0.0.1"));
    a.port = j.value("port", uint16_t(9090));
}

inline void to_json(nlohmann::json& j, const AdminConfig& a) {
    j = nlohmann::json{{"enabled", a.enabled}, {"address", a.address}, {"port", a.port}};
}

inline void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("server")) {
        j.at("server").get_to(c.server);
    }
    if (j.contains("upstreams")) {
        j.at("upstreams").get_to(c.upstreams);
    }
    if (j.contains("routes")) {
        j.at("routes").get_to(c.routes);
    }
    if (j.contains("proxy")) {
        j.at("proxy").get_to(c.proxy);
    }
    if (j.contains("cache")) {
        j.at("cache").get_to(c.cache);
    }
    if (j.contains("rate_limits")) {
        j.at("rate_limits").get_to(c.rate_limits);
    }
    if (j.contains("logging")) {
        j.at("logging").get_to(c.logging);
    }
    if (j.contains("admin")) {
        j.at("admin").get_to(c.admin);
    }
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json::object();
    j["server"] = c.server;
    j["upstreams"] = c.upstreams;
    j["routes"] = c.routes;
    j["proxy"] = c.proxy;
    j["cache"] = c.cache;
    j["rate_limits"] = c.rate_limits;
    j["logging"] = c.logging;
    j["admin"] = c.admin;
}

/// Configuration validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Configuration loader
class ConfigLoader {
public:
    /// Load configuration from JSON file (nullopt on I/O, parse or validation error)
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path);

    /// Load configuration from JSON string
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json);

    /// Validate configuration
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Convert configuration to JSON string
    [[nodiscard]] static std::string to_json(const Config& config);
};

}  // namespace harbor::control

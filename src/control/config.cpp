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


// Harbor Configuration - Implementation

#include "config.hpp"

#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>
#include <set>
#include <sstream>

#include "../core/string_utils.hpp"
#include "../gateway/request_key.hpp"
#include "../gateway/upstream.hpp"
#include "../http/http.hpp"

namespace harbor::control {

namespace {

// Fuzzy suggestion limits for unknown names
constexpr size_t kMaxSuggestionDistance = 2;

std::string suggestion_suffix(const std::string& typo, const std::vector<std::string>& available) {
    auto similar = core::find_similar_strings(typo, available, kMaxSuggestionDistance);
    if (similar.empty()) {
        return "";
    }
    return ". Did you mean: " + similar.front();
}

bool valid_status(uint32_t status) {
    return status >= 100 && status <= 599;
}

void validate_upstream(const UpstreamConfig& upstream, ValidationResult& result) {
    const std::string context = "upstream '" + upstream.name + "'";

    if (upstream.name.empty()) {
        result.add_error("Upstream name cannot be empty");
    }

    if (upstream.backends.empty()) {
        result.add_error("Upstream '" + upstream.name + "' has no backends");
    }

    if (!gateway::parse_balancing_policy(upstream.load_balancing)) {
        static const std::vector<std::string> kPolicies = {
            "round_robin", "weighted_round_robin", "least_connections", "ip_hash",
            "consistent_hash"};
        result.add_error("Unknown load_balancing strategy '" + upstream.load_balancing + "' in " +
                         context + suggestion_suffix(upstream.load_balancing, kPolicies));
    }

    if (!gateway::RequestKeyExtractor::parse(upstream.hash_key)) {
        result.add_error("Invalid hash_key '" + upstream.hash_key + "' in " + context);
    }

    if (upstream.fail_timeout == 0 && upstream.max_fails > 0) {
        result.add_error("fail_timeout must be > 0 in " + context);
    }

    if (upstream.max_fail_timeout > 0 && upstream.max_fail_timeout < upstream.fail_timeout) {
        result.add_warning("max_fail_timeout is below fail_timeout in " + context +
                           " (probation backoff disabled)");
    }

    if (upstream.health_check.enabled) {
        if (upstream.health_check.interval == 0) {
            result.add_error("health_check interval must be > 0 in " + context);
        }
        if (upstream.health_check.timeout == 0) {
            result.add_error("health_check timeout must be > 0 in " + context);
        }
        if (upstream.health_check.path.empty() || upstream.health_check.path.front() != '/') {
            result.add_error("health_check path must start with '/' in " + context);
        }
        for (uint16_t status : upstream.health_check.expected_statuses) {
            if (!valid_status(status)) {
                result.add_error("Invalid expected status " + std::to_string(status) + " in " +
                                 context);
            }
        }
    }

    bool has_primary = false;
    std::set<std::string> addresses;
    for (const auto& backend : upstream.backends) {
        if (backend.host.empty()) {
            result.add_error("Backend host cannot be empty in " + context);
        }

        if (backend.port == 0) {
            result.add_error("Backend port must be > 0 in " + context);
        }

        if (backend.weight == 0) {
            result.add_error("Backend " + backend.host + " has weight 0 in " + context);
        }

        auto role = gateway::parse_server_role(backend.role);
        if (!role) {
            result.add_error("Unknown role '" + backend.role + "' for backend " + backend.host +
                             " in " + context);
        } else if (*role == gateway::ServerRole::Primary) {
            has_primary = true;
        }

        std::string address = backend.host + ":" + std::to_string(backend.port);
        if (!addresses.insert(address).second) {
            result.add_warning("Duplicate backend " + address + " in " + context);
        }
    }

    if (!upstream.backends.empty() && !has_primary) {
        result.add_error(context + " has no primary backend");
    }
}

void validate_cache(const CacheConfig& cache, ValidationResult& result) {
    if (!cache.enabled) {
        return;
    }

    if (cache.max_entries == 0) {
        result.add_error("Cache max_entries must be > 0");
    }
    if (cache.max_bytes == 0) {
        result.add_error("Cache max_bytes must be > 0");
    }
    if (cache.shards == 0) {
        result.add_error("Cache shards must be > 0");
    }
    if (cache.background_refresh && cache.max_background_refreshes == 0) {
        result.add_warning("Cache background_refresh enabled with max_background_refreshes 0");
    }
    if (cache.rules.empty()) {
        result.add_warning("Cache enabled but no cache rules configured");
    }

    for (const auto& rule : cache.rules) {
        const std::string context = "cache rule '" + rule.path + "'";
        if (rule.path.empty()) {
            result.add_error("Cache rule path cannot be empty");
        }
        if (rule.ttl.empty()) {
            result.add_warning(context + " has no ttl entries (nothing will be stored)");
        }
        for (const auto& [status, seconds] : rule.ttl) {
            if (status == "any") {
                continue;
            }
            bool numeric = !status.empty() &&
                           status.find_first_not_of("0123456789") == std::string::npos &&
                           status.size() <= 3;
            if (!numeric || !valid_status(static_cast<uint32_t>(std::stoul(status)))) {
                result.add_error("Invalid ttl status '" + status + "' in " + context);
            }
        }
        for (const auto& method : rule.methods) {
            if (method != "GET" && method != "HEAD") {
                result.add_error("Cache method must be GET or HEAD, got '" + method + "' in " +
                                 context);
            }
        }
    }
}

}  // namespace

// ConfigLoader implementation

std::optional<Config> ConfigLoader::load_from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        fprintf(stderr, "Cannot open configuration file: %s\n", path_str.c_str());
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json = buffer.str();

    return load_from_json(json);
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json) {
    Config config;

    try {
        auto j = nlohmann::json::parse(json);
        config = j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        // Logging is not up yet: configuration errors go to stderr
        fprintf(stderr, "JSON parsing error: %s\n", e.what());
        return std::nullopt;
    }

    auto validation = validate(config);
    for (const auto& warning : validation.warnings) {
        fprintf(stderr, "Configuration warning: %s\n", warning.c_str());
    }
    if (validation.has_errors()) {
        for (const auto& error : validation.errors) {
            fprintf(stderr, "Configuration error: %s\n", error.c_str());
        }
        return std::nullopt;
    }

    return config;
}

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;

    // Server
    if (config.server.listen_port == 0) {
        result.add_error("Server listen_port must be > 0");
    }
    if (config.server.max_request_size == 0) {
        result.add_error("Server max_request_size must be > 0");
    }
    if (config.server.max_header_size == 0) {
        result.add_error("Server max_header_size must be > 0");
    }
    if (config.server.max_connections == 0) {
        result.add_error("Server max_connections must be > 0");
    }

    // Upstreams
    if (config.upstreams.empty()) {
        result.add_warning("No upstreams configured");
    }

    std::vector<std::string> upstream_names;
    for (const auto& upstream : config.upstreams) {
        validate_upstream(upstream, result);
        for (const auto& existing : upstream_names) {
            if (existing == upstream.name) {
                result.add_error("Duplicate upstream name '" + upstream.name + "'");
            }
        }
        upstream_names.push_back(upstream.name);
    }

    // Routes
    if (config.routes.empty() && !config.upstreams.empty()) {
        result.add_warning("No routes configured; all requests go to upstream '" +
                           config.upstreams.front().name + "'");
    }

    for (const auto& route : config.routes) {
        if (route.path.empty() || route.path.front() != '/') {
            result.add_error("Route path '" + route.path + "' must start with '/'");
        }

        if (route.upstream.empty()) {
            result.add_error("Route '" + route.path + "' has no upstream");
            continue;
        }

        bool upstream_found = false;
        for (const auto& name : upstream_names) {
            if (name == route.upstream) {
                upstream_found = true;
                break;
            }
        }
        if (!upstream_found) {
            result.add_error("Route '" + route.path + "' references non-existent upstream '" +
                             route.upstream + "'" +
                             suggestion_suffix(route.upstream, upstream_names));
        }
    }

    // Proxy
    if (config.proxy.max_attempts == 0) {
        result.add_error("Proxy max_attempts must be > 0");
    }
    if (config.proxy.connect_timeout == 0 || config.proxy.send_timeout == 0 ||
        config.proxy.read_timeout == 0) {
        result.add_error("Proxy connect/send/read timeouts must be > 0");
    }
    for (uint16_t status : config.proxy.retriable_statuses) {
        if (!valid_status(status)) {
            result.add_error("Invalid retriable status " + std::to_string(status));
        }
    }
    for (uint16_t status : config.proxy.failure_statuses) {
        if (!valid_status(status)) {
            result.add_error("Invalid failure status " + std::to_string(status));
        }
    }

    validate_cache(config.cache, result);

    // Rate limits
    std::vector<std::string> zone_names;
    for (const auto& zone : config.rate_limits) {
        const std::string context = "rate limit '" + zone.name + "'";
        if (zone.name.empty()) {
            result.add_error("Rate limit name cannot be empty");
        }
        for (const auto& existing : zone_names) {
            if (existing == zone.name) {
                result.add_error("Duplicate rate limit name '" + zone.name + "'");
            }
        }
        zone_names.push_back(zone.name);

        if (!gateway::RequestKeyExtractor::parse(zone.key)) {
            result.add_error("Invalid key '" + zone.key + "' in " + context);
        }
        if (zone.capacity < 1.0) {
            result.add_error("Capacity must be >= 1 in " + context);
        }
        if (zone.rate <= 0.0) {
            result.add_error("Rate must be > 0 in " + context);
        }
        if (zone.status < 400 || zone.status > 599) {
            result.add_error("Status must be 4xx or 5xx in " + context);
        }
    }

    // Logging
    if (config.logging.level != "debug" && config.logging.level != "info" &&
        config.logging.level != "warning" && config.logging.level != "error") {
        result.add_error("Unknown logging level '" + config.logging.level + "'");
    }
    if (config.logging.format != "json" && config.logging.format != "text") {
        result.add_error("Unknown logging format '" + config.logging.format + "'");
    }

    // Admin
    if (config.admin.enabled) {
        if (config.admin.port == 0) {
            result.add_error("Admin port must be > 0");
        } else if (config.admin.port == config.server.listen_port &&
                   (config.admin.address == config.server.listen_address ||
                    config.server.listen_address == "0.0.0.0")) {
            result.add_error("Admin port conflicts with listen_port");
        }
    }

    return result;
}

std::string ConfigLoader::to_json(const Config& config) {
    nlohmann::json j = config;
    return j.dump(2);
}

}  // namespace harbor::control

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


// Harbor Cache Policy - Header
// Which requests use the cache, how keys are built, and how long responses live

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../core/containers.hpp"
#include "../http/http.hpp"

namespace harbor::gateway {

/// Request properties that force a cache bypass. A listed cookie, header
/// or query parameter bypasses when present with a value other than "" or "0".
struct CacheBypass {
    std::vector<std::string> cookies;
    std::vector<std::string> headers;
    std::vector<std::string> query_params;
};

/// Cache directive for a path pattern
struct CacheRule {
    std::string path = "/";  // Prefix, or a glob when it contains '*'
    core::fast_map<uint16_t, std::chrono::seconds> ttl_by_status;
    std::optional<std::chrono::seconds> ttl_any;  // Fallback for unlisted statuses
    std::vector<http::Method> methods = {http::Method::GET, http::Method::HEAD};
    CacheBypass bypass;
    std::vector<std::string> vary_headers;
    size_t max_entry_size = 1024 * 1024;
    bool respect_cache_control = true;

    [[nodiscard]] bool matches_path(std::string_view path) const noexcept;
};

/// Upper bound for any stored lifetime (delta-seconds saturate at 2^31)
inline constexpr std::chrono::seconds kMaxDeltaSeconds{2147483648LL};

/// Parsed Cache-Control directives relevant to a shared cache
struct CacheControl {
    bool no_store = false;
    bool no_cache = false;
    bool is_private = false;
    std::optional<std::chrono::seconds> max_age;
    std::optional<std::chrono::seconds> s_maxage;
};

[[nodiscard]] CacheControl parse_cache_control(std::string_view value);

/// Rule table plus the key and TTL logic around it
class CachePolicy {
public:
    CachePolicy() = default;
    explicit CachePolicy(std::vector<CacheRule> rules);

    /// First rule whose path pattern matches, or nullptr
    [[nodiscard]] const CacheRule* match(const http::Request& request) const noexcept;

    /// True when the request must skip the cache (method or bypass predicate)
    [[nodiscard]] static bool should_bypass(const CacheRule& rule, const http::Request& request);

    /// Deterministic key: "METHOD scheme://host/path?sorted-query" followed by
    /// "|name=value" for each vary header. Host is lowercased without a
    /// default port.
    [[nodiscard]] static std::string build_key(const http::Request& request, const CacheRule& rule);

    /// How long to keep a response, or nullopt if it must not be stored
    [[nodiscard]] static std::optional<std::chrono::seconds> ttl_for(const CacheRule& rule,
                                                                     const http::Response& response);

    [[nodiscard]] bool empty() const noexcept { return rules_.empty(); }
    [[nodiscard]] const std::vector<CacheRule>& rules() const noexcept { return rules_; }

private:
    std::vector<CacheRule> rules_;
};

}  // namespace harbor::gateway

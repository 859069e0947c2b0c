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


// Harbor Cache Policy - Implementation

#include "cache_policy.hpp"

#include <algorithm>
#include <charconv>

#include "../core/string_utils.hpp"

namespace harbor::gateway {

namespace {

bool is_set(std::string_view value) noexcept {
    return !value.empty() && value != "0";
}

std::string normalize_host(std::string_view host, std::string_view scheme) {
    std::string out = core::to_lower(host);
    std::string_view default_port = scheme == "https" ? ":443" : ":80";
    if (out.size() > default_port.size() &&
        std::string_view(out).substr(out.size() - default_port.size()) == default_port) {
        out.resize(out.size() - default_port.size());
    }
    return out;
}

std::optional<std::chrono::seconds> parse_seconds(std::string_view value) {
    value = core::trim(value);
    if (!value.empty() && value.front() == '"' && value.size() >= 2 && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
    }
    if (value.empty() || value.front() == '-') {
        return std::nullopt;
    }
    int64_t seconds = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), seconds);
    if (ptr != value.data() + value.size() || seconds < 0) {
        return std::nullopt;
    }
    // Delta-seconds too large to represent mean "as long as possible"
    if (ec == std::errc::result_out_of_range) {
        return kMaxDeltaSeconds;
    }
    if (ec != std::errc{}) {
        return std::nullopt;
    }
    return std::min(std::chrono::seconds(seconds), kMaxDeltaSeconds);
}

}  // namespace

bool CacheRule::matches_path(std::string_view request_path) const noexcept {
    if (path.find('*') != std::string::npos) {
        return core::glob_match(path, request_path);
    }
    return request_path.substr(0, path.size()) == path;
}

CacheControl parse_cache_control(std::string_view value) {
    CacheControl cc;
    for (std::string_view raw : core::split(value, ',')) {
        std::string_view directive = core::trim(raw);
        size_t eq = directive.find('=');
        std::string name = core::to_lower(core::trim(directive.substr(0, eq)));
        std::string_view arg =
            eq == std::string_view::npos ? std::string_view{} : directive.substr(eq + 1);

        if (name == "no-store") {
            cc.no_store = true;
        } else if (name == "no-cache") {
            cc.no_cache = true;
        } else if (name == "private") {
            cc.is_private = true;
        } else if (name == "max-age") {
            cc.max_age = parse_seconds(arg);
        } else if (name == "s-maxage") {
            cc.s_maxage = parse_seconds(arg);
        }
    }
    return cc;
}

CachePolicy::CachePolicy(std::vector<CacheRule> rules) : rules_(std::move(rules)) {}

const CacheRule* CachePolicy::match(const http::Request& request) const noexcept {
    for (const auto& rule : rules_) {
        if (rule.matches_path(request.path)) {
            return &rule;
        }
    }
    return nullptr;
}

bool CachePolicy::should_bypass(const CacheRule& rule, const http::Request& request) {
    // Only GET and HEAD are ever served from the cache
    if (request.method != http::Method::GET && request.method != http::Method::HEAD) {
        return true;
    }
    if (std::find(rule.methods.begin(), rule.methods.end(), request.method) == rule.methods.end()) {
        return true;
    }

    for (const auto& cookie : rule.bypass.cookies) {
        if (is_set(request.get_cookie(cookie))) {
            return true;
        }
    }
    for (const auto& header : rule.bypass.headers) {
        if (is_set(request.get_header(header))) {
            return true;
        }
    }
    for (const auto& param : rule.bypass.query_params) {
        if (is_set(core::query_param(request.query, param))) {
            return true;
        }
    }
    return false;
}

std::string CachePolicy::build_key(const http::Request& request, const CacheRule& rule) {
    std::string key;
    key.reserve(64 + request.path.size() + request.query.size());

    key += http::to_string(request.method);
    key += ' ';
    key += request.scheme;
    key += "://";
    key += normalize_host(request.host, request.scheme);
    key += request.path.empty() ? std::string_view("/") : std::string_view(request.path);

    if (!request.query.empty()) {
        std::vector<std::string_view> params;
        for (std::string_view pair : core::split(request.query, '&')) {
            if (!pair.empty()) {
                params.push_back(pair);
            }
        }
        std::sort(params.begin(), params.end());
        if (!params.empty()) {
            key += '?';
            for (size_t i = 0; i < params.size(); ++i) {
                if (i > 0) {
                    key += '&';
                }
                key += params[i];
            }
        }
    }

    for (const auto& name : rule.vary_headers) {
        key += '|';
        key += core::to_lower(name);
        key += '=';
        key += request.get_header(name);
    }
    return key;
}

std::optional<std::chrono::seconds> CachePolicy::ttl_for(const CacheRule& rule,
                                                         const http::Response& response) {
    std::optional<std::chrono::seconds> ttl;
    auto it = rule.ttl_by_status.find(response.status_code());
    if (it != rule.ttl_by_status.end()) {
        ttl = it->second;
    } else {
        ttl = rule.ttl_any;
    }
    if (!ttl) {
        return std::nullopt;
    }

    if (response.get_header("Vary") == "*") {
        return std::nullopt;
    }

    if (rule.respect_cache_control) {
        if (response.has_header("Set-Cookie")) {
            return std::nullopt;
        }
        std::string_view header = response.get_header("Cache-Control");
        if (!header.empty()) {
            CacheControl cc = parse_cache_control(header);
            if (cc.no_store || cc.no_cache || cc.is_private) {
                return std::nullopt;
            }
            if (cc.s_maxage) {
                ttl = cc.s_maxage;
            } else if (cc.max_age) {
                ttl = cc.max_age;
            }
        }
    }

    if (ttl->count() <= 0) {
        return std::nullopt;
    }
    return std::min(*ttl, kMaxDeltaSeconds);
}

}  // namespace harbor::gateway

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


// Harbor HTTP Protocol - Header
// Owned HTTP/1.x message types shared by Listener, ProxyEngine and CacheStore

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace harbor::http {

/// HTTP methods
enum class Method : uint8_t {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD,
    OPTIONS,
    PATCH,
    CONNECT,
    TRACE,
    UNKNOWN
};

/// HTTP version
enum class Version : uint8_t { HTTP_1_0, HTTP_1_1, UNKNOWN };

/// HTTP status codes (any other value may be carried via static_cast)
enum class StatusCode : uint16_t {
    // 2xx Success
    OK = 200,
    Created = 201,
    Accepted = 202,
    NoContent = 204,
    PartialContent = 206,

    // 3xx Redirection
    MovedPermanently = 301,
    Found = 302,
    SeeOther = 303,
    NotModified = 304,
    TemporaryRedirect = 307,
    PermanentRedirect = 308,

    // 4xx Client Error
    BadRequest = 400,
    Unauthorized = 401,
    Forbidden = 403,
    NotFound = 404,
    MethodNotAllowed = 405,
    RequestTimeout = 408,
    Gone = 410,
    PayloadTooLarge = 413,
    URITooLong = 414,
    TooManyRequests = 429,
    RequestHeaderFieldsTooLarge = 431,

    // 5xx Server Error
    InternalServerError = 500,
    NotImplemented = 501,
    BadGateway = 502,
    ServiceUnavailable = 503,
    GatewayTimeout = 504,
};

/// HTTP header (name-value pair). Order and duplicates are preserved.
struct Header {
    std::string name;
    std::string value;
};

using Headers = std::vector<Header>;

/// Inbound request as handed over by the Listener
struct Request {
    Method method = Method::UNKNOWN;
    Version version = Version::HTTP_1_1;

    std::string scheme = "http";
    std::string host;   // Authority from the Host header
    std::string path;   // URI without query string
    std::string query;  // Query string without '?'

    Headers headers;
    std::string body;

    std::string client_ip;
    uint16_t client_port = 0;
    std::chrono::system_clock::time_point arrival_time = std::chrono::system_clock::now();

    /// path plus "?query" when a query is present
    [[nodiscard]] std::string uri() const;

    [[nodiscard]] const Header* find_header(std::string_view name) const noexcept;

    [[nodiscard]] std::string_view get_header(std::string_view name,
                                              std::string_view default_value = {}) const noexcept;

    [[nodiscard]] bool has_header(std::string_view name) const noexcept;

    /// Cookie value by name from the Cookie header(s); empty if absent
    [[nodiscard]] std::string_view get_cookie(std::string_view name) const noexcept;

    [[nodiscard]] bool keep_alive() const noexcept;
};

/// Response produced by an upstream, the cache or the engine itself
struct Response {
    Version version = Version::HTTP_1_1;
    StatusCode status = StatusCode::OK;

    Headers headers;
    std::string body;

    [[nodiscard]] uint16_t status_code() const noexcept { return static_cast<uint16_t>(status); }

    [[nodiscard]] const Header* find_header(std::string_view name) const noexcept;

    [[nodiscard]] std::string_view get_header(std::string_view name,
                                              std::string_view default_value = {}) const noexcept;

    [[nodiscard]] bool has_header(std::string_view name) const noexcept;

    /// Append a header (keeps existing headers with the same name)
    void add_header(std::string_view name, std::string_view value);

    /// Replace all headers with this name by a single one
    void set_header(std::string_view name, std::string_view value);

    /// Remove every header with this name; returns true if any was removed
    bool remove_header(std::string_view name);

    [[nodiscard]] bool keep_alive() const noexcept;
};

// Conversion functions

[[nodiscard]] std::string_view to_string(Method method) noexcept;

[[nodiscard]] Method parse_method(std::string_view str) noexcept;

[[nodiscard]] std::string_view to_string(Version version) noexcept;

[[nodiscard]] std::string_view to_reason_phrase(StatusCode code) noexcept;

/// Case-insensitive header name comparison
[[nodiscard]] bool header_name_equals(std::string_view a, std::string_view b) noexcept;

/// True for Connection, Keep-Alive, Transfer-Encoding and the other
/// per-connection headers that must not be forwarded
[[nodiscard]] bool is_hop_by_hop_header(std::string_view name) noexcept;

/// True for methods whose repetition has no additional effect
[[nodiscard]] bool is_idempotent(Method method) noexcept;

/// Simple engine-generated response with a one-line text body
[[nodiscard]] Response make_error_response(StatusCode status);

/// Serialize a response for the client. The body is framed with
/// Content-Length; for HEAD requests the body is omitted.
[[nodiscard]] std::string serialize_response(const Response& response, bool keep_alive,
                                             bool head_request = false);

}  // namespace harbor::http

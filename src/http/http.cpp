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


// Harbor HTTP Protocol - Implementation

#include "http.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>

namespace harbor::http {

namespace {

template <typename HeaderList>
const Header* find_in(const HeaderList& headers, std::string_view name) noexcept {
    for (const auto& header : headers) {
        if (header_name_equals(header.name, name)) {
            return &header;
        }
    }
    return nullptr;
}

bool contains_token(std::string_view list, std::string_view token) noexcept {
    size_t pos = 0;
    while (pos <= list.size()) {
        size_t comma = list.find(',', pos);
        std::string_view item =
            list.substr(pos, comma == std::string_view::npos ? std::string_view::npos : comma - pos);
        while (!item.empty() && (item.front() == ' ' || item.front() == '\t')) item.remove_prefix(1);
        while (!item.empty() && (item.back() == ' ' || item.back() == '\t')) item.remove_suffix(1);
        if (header_name_equals(item, token)) {
            return true;
        }
        if (comma == std::string_view::npos) {
            break;
        }
        pos = comma + 1;
    }
    return false;
}

bool connection_keep_alive(Version version, std::string_view connection) noexcept {
    // HTTP/1.1 defaults to keep-alive, HTTP/1.0 to close
    if (version == Version::HTTP_1_1) {
        return !contains_token(connection, "close");
    }
    return contains_token(connection, "keep-alive");
}

}  // namespace

// Request helper methods

std::string Request::uri() const {
    if (query.empty()) {
        return path;
    }
    return fmt::format("{}?{}", path, query);
}

const Header* Request::find_header(std::string_view name) const noexcept {
    return find_in(headers, name);
}

std::string_view Request::get_header(std::string_view name,
                                     std::string_view default_value) const noexcept {
    const Header* header = find_header(name);
    return header ? std::string_view(header->value) : default_value;
}

bool Request::has_header(std::string_view name) const noexcept {
    return find_header(name) != nullptr;
}

std::string_view Request::get_cookie(std::string_view name) const noexcept {
    for (const auto& header : headers) {
        if (!header_name_equals(header.name, "Cookie")) {
            continue;
        }

        std::string_view cookies = header.value;
        while (!cookies.empty()) {
            size_t semi = cookies.find(';');
            std::string_view pair = cookies.substr(0, semi);
            while (!pair.empty() && pair.front() == ' ') pair.remove_prefix(1);

            size_t eq = pair.find('=');
            if (eq != std::string_view::npos && pair.substr(0, eq) == name) {
                return pair.substr(eq + 1);
            }
            if (semi == std::string_view::npos) {
                break;
            }
            cookies.remove_prefix(semi + 1);
        }
    }
    return {};
}

bool Request::keep_alive() const noexcept {
    return connection_keep_alive(version, get_header("Connection"));
}

// Response helper methods

const Header* Response::find_header(std::string_view name) const noexcept {
    return find_in(headers, name);
}

std::string_view Response::get_header(std::string_view name,
                                      std::string_view default_value) const noexcept {
    const Header* header = find_header(name);
    return header ? std::string_view(header->value) : default_value;
}

bool Response::has_header(std::string_view name) const noexcept {
    return find_header(name) != nullptr;
}

void Response::add_header(std::string_view name, std::string_view value) {
    headers.push_back({std::string(name), std::string(value)});
}

void Response::set_header(std::string_view name, std::string_view value) {
    remove_header(name);
    add_header(name, value);
}

bool Response::remove_header(std::string_view name) {
    auto it = std::remove_if(headers.begin(), headers.end(),
                             [name](const Header& h) { return header_name_equals(h.name, name); });
    bool found = it != headers.end();
    headers.erase(it, headers.end());
    return found;
}

bool Response::keep_alive() const noexcept {
    return connection_keep_alive(version, get_header("Connection"));
}

// Conversion functions

std::string_view to_string(Method method) noexcept {
    switch (method) {
        case Method::GET:
            return "GET";
        case Method::POST:
            return "POST";
        case Method::PUT:
            return "PUT";
        case Method::DELETE:
            return "DELETE";
        case Method::HEAD:
            return "HEAD";
        case Method::OPTIONS:
            return "OPTIONS";
        case Method::PATCH:
            return "PATCH";
        case Method::CONNECT:
            return "CONNECT";
        case Method::TRACE:
            return "TRACE";
        case Method::UNKNOWN:
            return "UNKNOWN";
    }
    return "UNKNOWN";
}

Method parse_method(std::string_view str) noexcept {
    if (str == "GET")
        return Method::GET;
    if (str == "POST")
        return Method::POST;
    if (str == "PUT")
        return Method::PUT;
    if (str == "DELETE")
        return Method::DELETE;
    if (str == "HEAD")
        return Method::HEAD;
    if (str == "OPTIONS")
        return Method::OPTIONS;
    if (str == "PATCH")
        return Method::PATCH;
    if (str == "CONNECT")
        return Method::CONNECT;
    if (str == "TRACE")
        return Method::TRACE;
    return Method::UNKNOWN;
}

std::string_view to_string(Version version) noexcept {
    switch (version) {
        case Version::HTTP_1_0:
            return "HTTP/1.0";
        case Version::HTTP_1_1:
            return "HTTP/1.1";
        case Version::UNKNOWN:
            return "HTTP/1.1";
    }
    return "HTTP/1.1";
}

std::string_view to_reason_phrase(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::OK:
            return "OK";
        case StatusCode::Created:
            return "Created";
        case StatusCode::Accepted:
            return "Accepted";
        case StatusCode::NoContent:
            return "No Content";
        case StatusCode::PartialContent:
            return "Partial Content";
        case StatusCode::MovedPermanently:
            return "Moved Permanently";
        case StatusCode::Found:
            return "Found";
        case StatusCode::SeeOther:
            return "See Other";
        case StatusCode::NotModified:
            return "Not Modified";
        case StatusCode::TemporaryRedirect:
            return "Temporary Redirect";
        case StatusCode::PermanentRedirect:
            return "Permanent Redirect";
        case StatusCode::BadRequest:
            return "Bad Request";
        case StatusCode::Unauthorized:
            return "Unauthorized";
        case StatusCode::Forbidden:
            return "Forbidden";
        case StatusCode::NotFound:
            return "Not Found";
        case StatusCode::MethodNotAllowed:
            return "Method Not Allowed";
        case StatusCode::RequestTimeout:
            return "Request Timeout";
        case StatusCode::Gone:
            return "Gone";
        case StatusCode::PayloadTooLarge:
            return "Payload Too Large";
        case StatusCode::URITooLong:
            return "URI Too Long";
        case StatusCode::TooManyRequests:
            return "Too Many Requests";
        case StatusCode::RequestHeaderFieldsTooLarge:
            return "Request Header Fields Too Large";
        case StatusCode::InternalServerError:
            return "Internal Server Error";
        case StatusCode::NotImplemented:
            return "Not Implemented";
        case StatusCode::BadGateway:
            return "Bad Gateway";
        case StatusCode::ServiceUnavailable:
            return "Service Unavailable";
        case StatusCode::GatewayTimeout:
            return "Gateway Timeout";
    }
    return "Unknown";
}

bool header_name_equals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool is_hop_by_hop_header(std::string_view name) noexcept {
    static constexpr std::array<std::string_view, 8> kHopByHop = {
        "Connection", "Keep-Alive", "Proxy-Connection", "Proxy-Authenticate",
        "TE",         "Trailer",    "Transfer-Encoding", "Upgrade"};
    return std::any_of(kHopByHop.begin(), kHopByHop.end(),
                       [name](std::string_view h) { return header_name_equals(h, name); });
}

bool is_idempotent(Method method) noexcept {
    return method != Method::POST && method != Method::PATCH && method != Method::CONNECT;
}

Response make_error_response(StatusCode status) {
    Response response;
    response.status = status;
    response.body = fmt::format("{}\n", to_reason_phrase(status));
    response.add_header("Content-Type", "text/plain");
    return response;
}

std::string serialize_response(const Response& response, bool keep_alive, bool head_request) {
    uint16_t code = response.status_code();
    bool bodyless_status = (code >= 100 && code < 200) || code == 204 || code == 304;

    std::string out;
    out.reserve(256 + (head_request ? 0 : response.body.size()));

    out += fmt::format("HTTP/1.1 {} {}\r\n", code, to_reason_phrase(response.status));

    std::string_view upstream_length;
    for (const auto& header : response.headers) {
        if (is_hop_by_hop_header(header.name)) {
            continue;
        }
        if (header_name_equals(header.name, "Content-Length")) {
            upstream_length = header.value;
            continue;
        }
        out += header.name;
        out += ": ";
        out += header.value;
        out += "\r\n";
    }

    if (!bodyless_status) {
        // A HEAD answer relayed from upstream carries no body but keeps its length
        if (head_request && response.body.empty() && !upstream_length.empty()) {
            out += fmt::format("Content-Length: {}\r\n", upstream_length);
        } else {
            out += fmt::format("Content-Length: {}\r\n", response.body.size());
        }
    }

    out += keep_alive ? "Connection: keep-alive\r\n" : "Connection: close\r\n";
    out += "\r\n";

    if (!head_request && !bodyless_status) {
        out += response.body;
    }
    return out;
}

}  // namespace harbor::http

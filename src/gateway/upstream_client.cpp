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


// Harbor Upstream Client - Implementation

#include "upstream_client.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <iterator>
#include <string_view>

#include "../core/logging.hpp"
#include "../core/socket.hpp"
#include "../http/parser.hpp"
#include "connection_pool.hpp"
#include "errors.hpp"

namespace harbor::gateway {

namespace {

constexpr size_t kReadBufferSize = 16 * 1024;

/// Phase timeout clipped to what is left of the deadline
std::chrono::milliseconds bounded(std::chrono::milliseconds phase, Clock::time_point deadline) {
    if (deadline == Clock::time_point::max()) {
        return phase;
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    if (left <= std::chrono::milliseconds::zero()) {
        return std::chrono::milliseconds::zero();
    }
    return std::min(phase, left);
}

bool deadline_passed(Clock::time_point deadline) {
    return deadline != Clock::time_point::max() && Clock::now() >= deadline;
}

/// Headers named in the request's Connection header are hop-by-hop too
bool listed_in_connection(std::string_view name, std::string_view connection) {
    while (!connection.empty()) {
        size_t comma = connection.find(',');
        std::string_view token = connection.substr(0, comma);
        while (!token.empty() && (token.front() == ' ' || token.front() == '\t')) {
            token.remove_prefix(1);
        }
        while (!token.empty() && (token.back() == ' ' || token.back() == '\t')) {
            token.remove_suffix(1);
        }
        if (!token.empty() && http::header_name_equals(token, name)) {
            return true;
        }
        if (comma == std::string_view::npos) {
            break;
        }
        connection.remove_prefix(comma + 1);
    }
    return false;
}

bool is_reset_like(std::error_code ec) {
    return ec == std::errc::connection_reset || ec == std::errc::broken_pipe ||
           ec == std::errc::connection_aborted;
}

}  // namespace

std::string build_upstream_request(const http::Request& request, const UpstreamServer& server,
                                   const ForwardingOptions& options) {
    std::string out;
    out.reserve(512 + request.body.size());

    std::string uri = request.uri();
    if (uri.empty()) {
        uri = "/";
    }
    fmt::format_to(std::back_inserter(out), "{} {} HTTP/1.1\r\n", http::to_string(request.method),
                   uri);
    fmt::format_to(std::back_inserter(out), "Host: {}\r\n",
                   request.host.empty() ? std::string_view(server.address())
                                        : std::string_view(request.host));

    std::string_view connection = request.get_header("Connection");
    std::string forwarded_for;

    for (const auto& header : request.headers) {
        const std::string& name = header.name;
        if (http::is_hop_by_hop_header(name) || listed_in_connection(name, connection)) {
            continue;
        }
        if (http::header_name_equals(name, "Host") ||
            http::header_name_equals(name, "Content-Length") ||
            http::header_name_equals(name, "Expect")) {
            continue;
        }
        if (options.add_forwarded_for && http::header_name_equals(name, "X-Forwarded-For")) {
            if (!forwarded_for.empty()) {
                forwarded_for += ", ";
            }
            forwarded_for += header.value;
            continue;
        }
        if ((options.add_real_ip && http::header_name_equals(name, "X-Real-IP")) ||
            (options.add_forwarded_proto && http::header_name_equals(name, "X-Forwarded-Proto"))) {
            continue;
        }
        fmt::format_to(std::back_inserter(out), "{}: {}\r\n", name, header.value);
    }

    if (options.add_forwarded_for && !request.client_ip.empty()) {
        if (!forwarded_for.empty()) {
            forwarded_for += ", ";
        }
        forwarded_for += request.client_ip;
    }
    if (!forwarded_for.empty()) {
        fmt::format_to(std::back_inserter(out), "X-Forwarded-For: {}\r\n", forwarded_for);
    }
    if (options.add_real_ip && !request.client_ip.empty()) {
        fmt::format_to(std::back_inserter(out), "X-Real-IP: {}\r\n", request.client_ip);
    }
    if (options.add_forwarded_proto) {
        fmt::format_to(std::back_inserter(out), "X-Forwarded-Proto: {}\r\n", request.scheme);
    }

    bool body_method = request.method == http::Method::POST ||
                       request.method == http::Method::PUT ||
                       request.method == http::Method::PATCH;
    if (!request.body.empty() || body_method) {
        fmt::format_to(std::back_inserter(out), "Content-Length: {}\r\n", request.body.size());
    }
    out += "Connection: keep-alive\r\n\r\n";
    out += request.body;
    return out;
}

HttpUpstreamTransport::HttpUpstreamTransport(ConnectionManager& connections,
                                             ForwardingOptions options)
    : connections_(connections), options_(options) {}

ExchangeResult HttpUpstreamTransport::exchange(UpstreamServer& server,
                                               const http::Request& request,
                                               const ExchangeTimeouts& timeouts,
                                               const core::CancellationToken& cancel) {
    std::string wire = build_upstream_request(request, server, options_);

    bool stale_connection = false;
    ExchangeResult result =
        exchange_once(server, request, wire, timeouts, cancel, true, stale_connection);
    if (!stale_connection || cancel.is_cancelled()) {
        return result;
    }

    // The idle connection was closed by the upstream before it saw the
    // request; one retry on a fresh connection is not a health signal
    if (auto* logger = logging::get_current_logger()) {
        LOG_DEBUG(logger, "[UPSTREAM] Stale keep-alive connection to {}, reconnecting",
                  server.address());
    }
    return exchange_once(server, request, wire, timeouts, cancel, false, stale_connection);
}

ExchangeResult HttpUpstreamTransport::exchange_once(UpstreamServer& server,
                                                    const http::Request& request,
                                                    const std::string& wire,
                                                    const ExchangeTimeouts& timeouts,
                                                    const core::CancellationToken& cancel,
                                                    bool allow_reuse, bool& stale_connection) {
    ExchangeResult result;
    stale_connection = false;

    auto fail = [&](std::error_code ec) {
        result.error = ec;
        result.response = http::Response{};
        return result;
    };

    if (cancel.is_cancelled()) {
        return fail(ProxyErrc::client_disconnected);
    }
    if (deadline_passed(timeouts.deadline)) {
        return fail(ProxyErrc::deadline_exceeded);
    }

    std::error_code ec;
    UpstreamConnection conn = connections_.connect(
        server, bounded(timeouts.connect, timeouts.deadline), cancel, ec, allow_reuse);
    if (!conn.valid()) {
        if (ec == std::errc::timed_out && deadline_passed(timeouts.deadline)) {
            return fail(ProxyErrc::deadline_exceeded);
        }
        return fail(classify_connect_error(ec));
    }
    result.reused_connection = conn.reused();

    ec = core::send_all(conn.fd(), wire, bounded(timeouts.send, timeouts.deadline), cancel);
    if (ec) {
        conn.close();
        if (ec == std::errc::timed_out && deadline_passed(timeouts.deadline)) {
            return fail(ProxyErrc::deadline_exceeded);
        }
        if (result.reused_connection && is_reset_like(ec)) {
            stale_connection = true;
        }
        return fail(classify_io_error(ec, true));
    }

    http::Parser parser;
    parser.set_skip_body(request.method == http::Method::HEAD);
    parser.set_max_header_size(options_.max_response_header_size);
    parser.set_max_body_size(options_.max_response_body_size);

    std::array<char, kReadBufferSize> buffer;
    bool any_bytes = false;
    bool complete = false;
    bool reusable = true;

    while (!complete) {
        auto wait = bounded(timeouts.read, timeouts.deadline);
        if (wait == std::chrono::milliseconds::zero()) {
            return fail(ProxyErrc::deadline_exceeded);
        }

        size_t received = 0;
        ec = core::recv_some(conn.fd(), buffer.data(), buffer.size(), wait, cancel, received);
        if (ec) {
            conn.close();
            if (ec == std::errc::timed_out && deadline_passed(timeouts.deadline)) {
                return fail(ProxyErrc::deadline_exceeded);
            }
            if (!any_bytes && result.reused_connection && is_reset_like(ec)) {
                stale_connection = true;
            }
            return fail(classify_io_error(ec, false));
        }

        if (received == 0) {
            // Upstream closed: completes a close-delimited body, otherwise truncation
            http::ParseResult finished = parser.finish();
            conn.close();
            if (finished == http::ParseResult::Complete) {
                complete = true;
                reusable = false;
                break;
            }
            if (!any_bytes) {
                stale_connection = result.reused_connection;
                return fail(ProxyErrc::connection_reset);
            }
            return fail(ProxyErrc::bad_response);
        }
        any_bytes = true;

        std::string_view data(buffer.data(), received);
        for (;;) {
            auto [parse_result, consumed] = parser.parse_response(data, result.response);
            if (parse_result == http::ParseResult::Error) {
                if (auto* logger = logging::get_current_logger()) {
                    LOG_WARNING(logger, "[UPSTREAM] Invalid response from {}: {}",
                                server.address(), parser.error_message());
                }
                return fail(ProxyErrc::bad_response);
            }
            if (parse_result == http::ParseResult::Incomplete) {
                break;
            }

            data.remove_prefix(std::min(consumed, data.size()));
            uint16_t code = result.response.status_code();
            if (code >= 100 && code < 200 && code != 101) {
                // Interim response: discard and parse the final one
                result.response = http::Response{};
                parser.reset();
                if (data.empty()) {
                    break;
                }
                continue;
            }

            complete = true;
            if (!data.empty()) {
                // Bytes after the response mean the connection is out of sync
                reusable = false;
            }
            break;
        }
    }

    if (reusable && result.response.keep_alive() && result.response.status_code() != 101) {
        conn.release();
    } else {
        conn.close();
    }
    return result;
}

}  // namespace harbor::gateway

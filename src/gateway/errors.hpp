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


// Harbor Proxy Errors - Header
// Error taxonomy for admission, selection, transport and cache failures

#pragma once

#include <string>
#include <system_error>
#include <type_traits>

namespace harbor::gateway {

enum class ProxyErrc {
    ok = 0,
    admission_denied,      // Rate limit exceeded (429)
    no_healthy_upstream,   // Nothing eligible in the pool (503)
    connect_refused,       // Upstream refused or reset during connect
    connect_timeout,       // TCP handshake did not finish in time
    send_timeout,          // Request bytes could not be written in time
    read_timeout,          // No complete response in time
    connection_reset,      // Upstream closed or reset mid-exchange
    bad_response,          // Unparseable or truncated response
    bad_status,            // Response status in the failure set
    client_disconnected,   // Client went away; never a health signal
    deadline_exceeded,     // Overall request budget spent (504)
    cache_failure,         // Entry not stored; request continues as a miss
};

/// Error category for ProxyErrc values
class ProxyErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "harbor.proxy"; }
    [[nodiscard]] std::string message(int ev) const override;
};

[[nodiscard]] const ProxyErrorCategory& proxy_category() noexcept;

[[nodiscard]] inline std::error_code make_error_code(ProxyErrc e) noexcept {
    return {static_cast<int>(e), proxy_category()};
}

/// True for outcomes that count against the upstream's health
[[nodiscard]] bool is_upstream_failure(std::error_code ec) noexcept;

/// True for failures that happened before any request byte reached the
/// upstream, so even non-idempotent requests may be retried
[[nodiscard]] bool failed_before_send(std::error_code ec) noexcept;

/// Map socket-level errors from connect/send/recv to the taxonomy
[[nodiscard]] std::error_code classify_connect_error(std::error_code ec) noexcept;
[[nodiscard]] std::error_code classify_io_error(std::error_code ec, bool sending) noexcept;

}  // namespace harbor::gateway

template <>
struct std::is_error_code_enum<harbor::gateway::ProxyErrc> : std::true_type {};

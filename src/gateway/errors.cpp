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


// Harbor Proxy Errors - Implementation

#include "errors.hpp"

namespace harbor::gateway {

std::string ProxyErrorCategory::message(int ev) const {
    switch (static_cast<ProxyErrc>(ev)) {
        case ProxyErrc::ok:
            return "success";
        case ProxyErrc::admission_denied:
            return "rate limit exceeded";
        case ProxyErrc::no_healthy_upstream:
            return "no healthy upstream";
        case ProxyErrc::connect_refused:
            return "upstream connection refused";
        case ProxyErrc::connect_timeout:
            return "upstream connect timed out";
        case ProxyErrc::send_timeout:
            return "upstream send timed out";
        case ProxyErrc::read_timeout:
            return "upstream read timed out";
        case ProxyErrc::connection_reset:
            return "upstream closed the connection";
        case ProxyErrc::bad_response:
            return "invalid upstream response";
        case ProxyErrc::bad_status:
            return "upstream returned a failure status";
        case ProxyErrc::client_disconnected:
            return "client disconnected";
        case ProxyErrc::deadline_exceeded:
            return "request deadline exceeded";
        case ProxyErrc::cache_failure:
            return "cache store failure";
    }
    return "unknown proxy error";
}

const ProxyErrorCategory& proxy_category() noexcept {
    static ProxyErrorCategory instance;
    return instance;
}

bool is_upstream_failure(std::error_code ec) noexcept {
    if (ec.category() != proxy_category()) {
        return static_cast<bool>(ec);
    }
    switch (static_cast<ProxyErrc>(ec.value())) {
        case ProxyErrc::connect_refused:
        case ProxyErrc::connect_timeout:
        case ProxyErrc::send_timeout:
        case ProxyErrc::read_timeout:
        case ProxyErrc::connection_reset:
        case ProxyErrc::bad_response:
        case ProxyErrc::bad_status:
            return true;
        default:
            return false;
    }
}

bool failed_before_send(std::error_code ec) noexcept {
    return ec == ProxyErrc::connect_refused || ec == ProxyErrc::connect_timeout;
}

std::error_code classify_connect_error(std::error_code ec) noexcept {
    if (!ec) {
        return {};
    }
    if (ec == std::errc::operation_canceled) {
        return ProxyErrc::client_disconnected;
    }
    if (ec == std::errc::timed_out) {
        return ProxyErrc::connect_timeout;
    }
    // Refused, unreachable, unresolvable: the server is not taking connections
    return ProxyErrc::connect_refused;
}

std::error_code classify_io_error(std::error_code ec, bool sending) noexcept {
    if (!ec) {
        return {};
    }
    if (ec == std::errc::operation_canceled) {
        return ProxyErrc::client_disconnected;
    }
    if (ec == std::errc::timed_out) {
        return sending ? ProxyErrc::send_timeout : ProxyErrc::read_timeout;
    }
    return ProxyErrc::connection_reset;
}

}  // namespace harbor::gateway

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


// Harbor Upstream Client - Header
// One request/response exchange with one upstream server

#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <system_error>
#include <vector>

#include "../core/cancellation.hpp"
#include "../http/http.hpp"
#include "upstream.hpp"

namespace harbor::gateway {

class ConnectionManager;

/// Per-attempt time limits. The deadline caps every phase; a phase timeout
/// never extends past it.
struct ExchangeTimeouts {
    std::chrono::milliseconds connect{5000};
    std::chrono::milliseconds send{10000};
    std::chrono::milliseconds read{30000};  // Between successive reads
    Clock::time_point deadline = Clock::time_point::max();
};

/// Outcome of one attempt. On error the response is empty.
struct ExchangeResult {
    std::error_code error;
    http::Response response;
    bool reused_connection = false;
};

/// How request bytes reach an upstream. ProxyEngine only sees this
/// interface; tests substitute scripted transports.
class UpstreamTransport {
public:
    virtual ~UpstreamTransport() = default;

    /// Exchange one request with server. Errors are ProxyErrc values.
    [[nodiscard]] virtual ExchangeResult exchange(UpstreamServer& server,
                                                  const http::Request& request,
                                                  const ExchangeTimeouts& timeouts,
                                                  const core::CancellationToken& cancel) = 0;
};

/// Request headers added for the upstream
struct ForwardingOptions {
    bool add_forwarded_for = true;    // X-Forwarded-For (appended)
    bool add_real_ip = true;          // X-Real-IP
    bool add_forwarded_proto = true;  // X-Forwarded-Proto
    size_t max_response_header_size = 64 * 1024;
    size_t max_response_body_size = 64 * 1024 * 1024;
};

/// Serialize the request as sent upstream: hop-by-hop headers stripped,
/// forwarding headers added, Content-Length framing, keep-alive requested
[[nodiscard]] std::string build_upstream_request(const http::Request& request,
                                                 const UpstreamServer& server,
                                                 const ForwardingOptions& options);

/// HTTP/1.1 transport over pooled keep-alive connections
class HttpUpstreamTransport final : public UpstreamTransport {
public:
    HttpUpstreamTransport(ConnectionManager& connections, ForwardingOptions options = {});

    [[nodiscard]] ExchangeResult exchange(UpstreamServer& server, const http::Request& request,
                                          const ExchangeTimeouts& timeouts,
                                          const core::CancellationToken& cancel) override;

private:
    ExchangeResult exchange_once(UpstreamServer& server, const http::Request& request,
                                 const std::string& wire, const ExchangeTimeouts& timeouts,
                                 const core::CancellationToken& cancel, bool allow_reuse,
                                 bool& stale_connection);

    ConnectionManager& connections_;
    ForwardingOptions options_;
};

}  // namespace harbor::gateway

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

// Harbor Admin Server - Implementation

#include "admin_server.hpp"

#include <poll.h>
#include <sys/socket.h>

#include <array>

#include <nlohmann/json.hpp>

#include "../control/health.hpp"
#include "../gateway/cache_store.hpp"
#include "../gateway/upstream.hpp"
#include "../http/parser.hpp"
#include "logging.hpp"
#include "socket.hpp"
#include "string_utils.hpp"

namespace harbor::core {

namespace {

constexpr std::chrono::milliseconds kIoTimeout{5000};
constexpr size_t kMaxAdminRequest = 16384;

http::Response json_response(http::StatusCode status, std::string body) {
    http::Response response;
    response.status = status;
    response.body = std::move(body);
    response.add_header("Content-Type", "application/json");
    return response;
}

http::Response json_error(http::StatusCode status, std::string_view message) {
    nlohmann::json j{{"error", std::string(http::to_reason_phrase(status))},
                     {"message", message}};
    return json_response(status, j.dump());
}

}  // namespace

AdminServer::AdminServer(control::AdminConfig config,
                         std::vector<std::shared_ptr<gateway::UpstreamPool>> pools,
                         const control::ProxyMetrics& metrics,
                         std::shared_ptr<gateway::CacheStore> cache)
    : config_(std::move(config)),
      pools_(std::move(pools)),
      metrics_(metrics),
      cache_(std::move(cache)) {}

AdminServer::~AdminServer() {
    stop();
}

std::error_code AdminServer::start() {
    if (running_.load(std::memory_order_relaxed)) {
        return std::make_error_code(std::errc::operation_in_progress);
    }

    listen_fd_ = create_listening_socket(config_.address, config_.port, 32);
    if (listen_fd_ < 0) {
        return std::make_error_code(std::errc::address_not_available);
    }
    bound_port_ = local_port(listen_fd_);

    running_.store(true, std::memory_order_relaxed);

    if (auto* logger = logging::get_current_logger()) {
        LOG_INFO(logger, "Admin endpoint listening on {}:{}", config_.address, bound_port_);
    }
    return {};
}

void AdminServer::stop() {
    running_.store(false, std::memory_order_relaxed);
}

void AdminServer::run() {
    while (running_.load(std::memory_order_relaxed)) {
        pollfd pfd{};
        pfd.fd = listen_fd_;
        pfd.events = POLLIN;
        if (poll(&pfd, 1, 50) <= 0) {
            continue;  // Timeout or EINTR: re-check running_
        }

        int client_fd = accept(listen_fd_, nullptr, nullptr);
        if (client_fd < 0) {
            continue;
        }

        // Handle connection (blocking)
        handle_connection(client_fd);
        close_fd(client_fd);
    }

    close_fd(listen_fd_);
    listen_fd_ = -1;
}

void AdminServer::handle_connection(int client_fd) {
    if (auto ec = set_nonblocking(client_fd); ec) {
        return;
    }

    CancellationToken never;
    http::Parser parser;
    parser.set_max_body_size(kMaxAdminRequest);
    http::Request request;

    std::array<char, 4096> buffer;
    http::ParseResult state = http::ParseResult::Incomplete;
    while (state == http::ParseResult::Incomplete) {
        size_t received = 0;
        auto ec = recv_some(client_fd, buffer.data(), buffer.size(), kIoTimeout, never, received);
        if (ec || received == 0) {
            return;
        }
        state = parser.parse_request(std::string_view(buffer.data(), received), request).first;
    }

    http::Response response = state == http::ParseResult::Complete
                                  ? handle(request)
                                  : json_error(http::StatusCode::BadRequest, "malformed request");

    std::string wire = http::serialize_response(response, false,
                                                request.method == http::Method::HEAD);
    if (auto ec = send_all(client_fd, wire, kIoTimeout, never); ec) {
        if (auto* logger = logging::get_current_logger()) {
            LOG_DEBUG(logger, "Admin response not sent: {}", ec.message());
        }
    }
}

http::Response AdminServer::handle(const http::Request& request) const {
    if (request.method == http::Method::GET || request.method == http::Method::HEAD) {
        if (request.path == "/status") {
            auto health = control::collect_health(pools_, metrics_.snapshot(), started_);
            return json_response(http::StatusCode::OK, control::HealthResponse::to_json(health));
        }

        if (request.path == "/health") {
            auto health = control::collect_health(pools_, metrics_.snapshot(), started_);
            http::Response response;
            response.status = static_cast<http::StatusCode>(
                control::HealthResponse::to_http_status(health.status));
            response.body = control::HealthResponse::to_text(health);
            response.add_header("Content-Type", "text/plain");
            return response;
        }

        if (request.path == "/metrics") {
            return json_response(http::StatusCode::OK,
                                 control::metrics_to_json(metrics_.snapshot(), cache_.get()));
        }
    }

    if (request.path == "/cache/purge") {
        if (request.method != http::Method::POST) {
            return json_error(http::StatusCode::MethodNotAllowed, "use POST");
        }
        return purge(request);
    }

    return json_error(http::StatusCode::NotFound, "unknown admin endpoint");
}

http::Response AdminServer::purge(const http::Request& request) const {
    if (!cache_) {
        return json_error(http::StatusCode::ServiceUnavailable, "cache is not enabled");
    }

    std::string_view key = query_param(request.query, "key");
    std::string_view pattern = query_param(request.query, "pattern");
    if (key.empty() == pattern.empty()) {
        return json_error(http::StatusCode::BadRequest, "pass exactly one of key or pattern");
    }

    auto decoded = url_decode(key.empty() ? pattern : key);
    if (!decoded || decoded->empty()) {
        return json_error(http::StatusCode::BadRequest, "invalid percent-encoding");
    }

    size_t removed = 0;
    if (!key.empty()) {
        removed = cache_->purge(*decoded) ? 1 : 0;
    } else {
        removed = cache_->purge_matching(*decoded);
    }

    if (auto* logger = logging::get_current_logger()) {
        LOG_INFO(logger, "[CACHE] Purge '{}' removed {} entries", *decoded, removed);
    }

    nlohmann::json j{{"status", "ok"}, {"purged", removed}};
    return json_response(http::StatusCode::OK, j.dump());
}

}  // namespace harbor::core

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

// Harbor Listener - Implementation

#include "listener.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

#include <array>
#include <cerrno>
#include <tuple>

#include "../http/parser.hpp"
#include "logging.hpp"
#include "socket.hpp"

namespace harbor::core {

namespace {

constexpr size_t kReadBufferSize = 16384;
constexpr int kAcceptPollMs = 50;
constexpr std::chrono::milliseconds kErrorSendTimeout{1000};

}  // namespace

Listener::Listener(ListenerOptions options, RequestHandler handler, control::ProxyMetrics& metrics)
    : options_(std::move(options)), handler_(std::move(handler)), metrics_(metrics) {}

Listener::~Listener() {
    stop();
}

std::error_code Listener::start() {
    if (running_.exchange(true)) {
        return std::make_error_code(std::errc::operation_in_progress);
    }

    listen_fd_ = create_listening_socket(options_.address, options_.port, options_.backlog);
    if (listen_fd_ < 0) {
        std::error_code ec(errno, std::system_category());
        running_.store(false, std::memory_order_release);
        return ec ? ec : std::make_error_code(std::errc::address_not_available);
    }
    bound_port_ = local_port(listen_fd_);

    draining_.store(false, std::memory_order_relaxed);
    force_cancel_.store(false, std::memory_order_relaxed);
    idle_cancel_ = CancellationToken::create();

    accept_thread_ = std::thread([this] { accept_loop(); });

    if (auto* logger = logging::get_current_logger()) {
        LOG_INFO(logger, "Listening on {}:{} (max_connections={})", options_.address, bound_port_,
                 options_.max_connections);
    }
    return {};
}

void Listener::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    close_fd(listen_fd_);
    listen_fd_ = -1;

    // Idle keep-alive readers observe this within one poll slice
    draining_.store(true, std::memory_order_release);
    idle_cancel_.cancel();

    std::unique_lock lock(threads_mutex_);
    bool drained = threads_cv_.wait_for(lock, options_.shutdown_timeout, [this] {
        return active_.load(std::memory_order_relaxed) == 0;
    });
    if (!drained) {
        if (auto* logger = logging::get_current_logger()) {
            LOG_WARNING(logger, "Shutdown grace period expired, cancelling {} connections",
                        active_.load(std::memory_order_relaxed));
        }
        force_cancel_.store(true, std::memory_order_release);
    }

    auto threads = std::move(threads_);
    threads_.clear();
    finished_.clear();
    lock.unlock();

    for (auto& [id, thread] : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void Listener::accept_loop() {
    while (running_.load(std::memory_order_acquire)) {
        reap_finished();

        pollfd pfd{};
        pfd.fd = listen_fd_;
        pfd.events = POLLIN;
        int rc = poll(&pfd, 1, kAcceptPollMs);
        if (rc <= 0) {
            continue;  // Timeout or EINTR: re-check running_
        }

        sockaddr_in client_addr{};
        socklen_t client_len = sizeof(client_addr);
        int client_fd = accept4(listen_fd_, reinterpret_cast<sockaddr*>(&client_addr),
                                &client_len, SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                if (auto* logger = logging::get_current_logger()) {
                    LOG_WARNING(logger, "accept failed: {}",
                                std::error_code(errno, std::system_category()).message());
                }
            }
            continue;
        }

        if (active_.load(std::memory_order_relaxed) >= options_.max_connections) {
            reject(client_fd);
            continue;
        }

        char ip_buf[INET_ADDRSTRLEN] = {};
        inet_ntop(AF_INET, &client_addr.sin_addr, ip_buf, sizeof(ip_buf));
        uint16_t client_port = ntohs(client_addr.sin_port);

        if (auto ec = set_nodelay(client_fd); ec) {
            if (auto* logger = logging::get_current_logger()) {
                LOG_DEBUG(logger, "TCP_NODELAY failed for {}: {}", ip_buf, ec.message());
            }
        }

        active_.fetch_add(1, std::memory_order_relaxed);
        metrics_.record_connection();

        std::lock_guard lock(threads_mutex_);
        std::thread thread([this, client_fd, ip = std::string(ip_buf), client_port]() mutable {
            serve(client_fd, std::move(ip), client_port);
        });
        auto id = thread.get_id();
        threads_.emplace(id, std::move(thread));
    }
}

void Listener::reap_finished() {
    std::vector<std::thread> done;
    {
        std::lock_guard lock(threads_mutex_);
        for (auto id : finished_) {
            auto it = threads_.find(id);
            if (it != threads_.end()) {
                done.push_back(std::move(it->second));
                threads_.erase(it);
            }
        }
        finished_.clear();
    }
    for (auto& thread : done) {
        thread.join();
    }
}

void Listener::reject(int fd) {
    metrics_.record_connection_rejected();
    if (auto* logger = logging::get_current_logger()) {
        LOG_WARNING(logger, "Connection limit reached ({}), rejecting client",
                    options_.max_connections);
    }
    send_error(fd, http::StatusCode::ServiceUnavailable);
    close_fd(fd);
}

void Listener::send_error(int fd, http::StatusCode status) {
    http::Response response = http::make_error_response(status);
    std::string wire = http::serialize_response(response, false);
    metrics_.record_status_code(response.status_code());

    auto cancel = CancellationToken::create();
    cancel.set_probe([this] { return force_cancel_.load(std::memory_order_acquire); });
    if (auto ec = send_all(fd, wire, kErrorSendTimeout, cancel); !ec) {
        metrics_.record_bytes_sent(wire.size());
    }
}

void Listener::serve(int fd, std::string client_ip, uint16_t client_port) {
    std::array<char, kReadBufferSize> buffer;
    std::string pending;  // Pipelined bytes that followed the previous request
    uint32_t served = 0;

    // Cancelled when the client hangs up or the grace period runs out
    auto request_cancel = CancellationToken::create();
    request_cancel.set_probe(
        [this, fd] { return force_cancel_.load(std::memory_order_acquire) || peer_hung_up(fd); });

    while (!draining_.load(std::memory_order_acquire)) {
        http::Request request;
        request.client_ip = client_ip;
        request.client_port = client_port;

        http::Parser parser;
        parser.set_max_header_size(options_.max_header_size);
        parser.set_max_body_size(options_.max_request_size);

        http::ParseResult state = http::ParseResult::Incomplete;
        size_t consumed = 0;
        if (!pending.empty()) {
            std::tie(state, consumed) = parser.parse_request(pending, request);
            pending.erase(0, std::min(consumed, pending.size()));
        }

        bool closed = false;
        while (state == http::ParseResult::Incomplete) {
            bool idle = !parser.message_started();
            auto timeout = (idle && served > 0) ? options_.keepalive_timeout
                                                : options_.client_read_timeout;
            const CancellationToken& wait_cancel = idle ? idle_cancel_ : request_cancel;

            size_t received = 0;
            auto ec = recv_some(fd, buffer.data(), buffer.size(), timeout, wait_cancel, received);
            if (ec || received == 0) {
                if (ec == std::errc::timed_out && !idle) {
                    send_error(fd, http::StatusCode::RequestTimeout);
                }
                closed = true;
                break;
            }
            metrics_.record_bytes_received(received);

            std::string_view data(buffer.data(), received);
            std::tie(state, consumed) = parser.parse_request(data, request);
            if (state == http::ParseResult::Complete && consumed < data.size()) {
                pending.append(data.substr(consumed));
            }
        }
        if (closed) {
            break;
        }

        if (state == http::ParseResult::Error) {
            auto status = parser.limit_exceeded() ? http::StatusCode::PayloadTooLarge
                                                  : http::StatusCode::BadRequest;
            if (auto* logger = logging::get_current_logger()) {
                LOG_DEBUG(logger, "Rejecting request from {}: {}", client_ip,
                          parser.error_message());
            }
            send_error(fd, status);
            break;
        }

        auto started = std::chrono::steady_clock::now();
        std::string correlation_id(request.get_header("X-Correlation-ID"));
        if (!logging::is_valid_correlation_id(correlation_id)) {
            correlation_id = logging::generate_correlation_id();
        }

        std::optional<http::Response> response = handler_(request, request_cancel, correlation_id);
        if (!response) {
            break;  // Client went away; nothing to send
        }

        ++served;
        bool keep_alive = request.keep_alive() &&
                          !draining_.load(std::memory_order_acquire) &&
                          (options_.max_keepalive_requests == 0 ||
                           served < options_.max_keepalive_requests);

        std::string wire = http::serialize_response(*response, keep_alive,
                                                    request.method == http::Method::HEAD);
        auto ec = send_all(fd, wire, options_.client_read_timeout, request_cancel);

        auto duration_us = std::chrono::duration_cast<std::chrono::microseconds>(
                               std::chrono::steady_clock::now() - started)
                               .count();
        if (auto* logger = logging::get_current_logger()) {
            LOG_REQUEST(logger, http::to_string(request.method), request.path,
                        response->status_code(), duration_us, client_ip, correlation_id);
        }

        if (ec) {
            break;
        }
        metrics_.record_bytes_sent(wire.size());

        if (!keep_alive) {
            break;
        }
    }

    close_fd(fd);
    metrics_.record_connection_close();

    std::lock_guard lock(threads_mutex_);
    finished_.push_back(std::this_thread::get_id());
    active_.fetch_sub(1, std::memory_order_relaxed);
    threads_cv_.notify_all();
}

}  // namespace harbor::core

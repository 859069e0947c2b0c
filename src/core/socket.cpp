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


// Harbor Socket Utilities - Implementation

#include "socket.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <mutex>

#include "containers.hpp"

namespace harbor::core {

namespace {

// Blocking waits are sliced so cancellation is observed promptly
constexpr std::chrono::milliseconds kPollSlice{50};

std::mutex g_dns_mutex;
fast_map<std::string, in_addr> g_dns_cache;

std::error_code last_error() {
    return std::error_code(errno, std::system_category());
}

/// Wait until fd reports one of events, the timeout elapses or cancel fires
std::error_code wait_for(int fd, short events, std::chrono::milliseconds timeout,
                         const CancellationToken& cancel) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        if (cancel.is_cancelled()) {
            return std::make_error_code(std::errc::operation_canceled);
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return std::make_error_code(std::errc::timed_out);
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        auto slice = std::min(remaining, kPollSlice);

        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = events;
        int rc = poll(&pfd, 1, static_cast<int>(std::max<int64_t>(slice.count(), 1)));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            return last_error();
        }
        if (rc > 0) {
            // Errors and hang-ups are reported by the following syscall
            return {};
        }
    }
}

}  // namespace

int create_listening_socket(std::string_view address, uint16_t port, int backlog) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return -1;
    }

    if (auto ec = set_reuseaddr(fd); ec) {
        close_fd(fd);
        return -1;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    std::string addr_str{address};
    if (inet_pton(AF_INET, addr_str.c_str(), &addr.sin_addr) <= 0) {
        close_fd(fd);
        return -1;
    }

    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        close_fd(fd);
        return -1;
    }

    if (listen(fd, backlog) < 0) {
        close_fd(fd);
        return -1;
    }

    if (auto ec = set_nonblocking(fd); ec) {
        close_fd(fd);
        return -1;
    }

    return fd;
}

std::error_code set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return last_error();
    }
    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        return last_error();
    }
    return {};
}

std::error_code set_blocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return last_error();
    }
    if (fcntl(fd, F_SETFL, flags & ~O_NONBLOCK) < 0) {
        return last_error();
    }
    return {};
}

std::error_code set_reuseaddr(int fd) {
    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        return last_error();
    }
    return {};
}

std::error_code set_nodelay(int fd) {
    int flag = 1;
    if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag)) < 0) {
        return last_error();
    }
    return {};
}

void close_fd(int fd) {
    if (fd >= 0) {
        close(fd);
    }
}

uint16_t local_port(int fd) noexcept {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

std::error_code resolve_ipv4(const std::string& host, uint16_t port, sockaddr_in& out) {
    out = sockaddr_in{};
    out.sin_family = AF_INET;
    out.sin_port = htons(port);

    // Literal addresses skip the resolver
    if (inet_pton(AF_INET, host.c_str(), &out.sin_addr) == 1) {
        return {};
    }

    {
        std::lock_guard lock(g_dns_mutex);
        auto it = g_dns_cache.find(host);
        if (it != g_dns_cache.end()) {
            out.sin_addr = it->second;
            return {};
        }
    }

    addrinfo hints{};
    addrinfo* result = nullptr;
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    if (getaddrinfo(host.c_str(), nullptr, &hints, &result) != 0 || !result) {
        return std::make_error_code(std::errc::host_unreachable);
    }

    out.sin_addr = reinterpret_cast<sockaddr_in*>(result->ai_addr)->sin_addr;
    freeaddrinfo(result);

    std::lock_guard lock(g_dns_mutex);
    g_dns_cache[host] = out.sin_addr;
    return {};
}

int connect_with_timeout(const std::string& host, uint16_t port,
                         std::chrono::milliseconds timeout, const CancellationToken& cancel,
                         std::error_code& ec) {
    sockaddr_in addr{};
    if (ec = resolve_ipv4(host, port, addr); ec) {
        return -1;
    }

    int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        ec = last_error();
        return -1;
    }

    if (ec = set_nonblocking(fd); ec) {
        close_fd(fd);
        return -1;
    }

    if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        if (errno != EINPROGRESS) {
            ec = last_error();
            close_fd(fd);
            return -1;
        }

        if (ec = wait_for(fd, POLLOUT, timeout, cancel); ec) {
            close_fd(fd);
            return -1;
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
            ec = last_error();
            close_fd(fd);
            return -1;
        }
        if (so_error != 0) {
            ec = std::error_code(so_error, std::system_category());
            close_fd(fd);
            return -1;
        }
    }

    // Latency matters more than segment count for request/response traffic
    (void)set_nodelay(fd);

    ec.clear();
    return fd;
}

std::error_code send_all(int fd, std::string_view data, std::chrono::milliseconds timeout,
                         const CancellationToken& cancel) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    size_t sent = 0;

    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            return last_error();
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return std::make_error_code(std::errc::timed_out);
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (auto ec = wait_for(fd, POLLOUT, remaining, cancel); ec) {
            return ec;
        }
    }

    return {};
}

std::error_code recv_some(int fd, char* buffer, size_t capacity,
                          std::chrono::milliseconds timeout, const CancellationToken& cancel,
                          size_t& received) {
    received = 0;
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        ssize_t n = recv(fd, buffer, capacity, MSG_DONTWAIT);
        if (n >= 0) {
            received = static_cast<size_t>(n);
            return {};
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            return last_error();
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return std::make_error_code(std::errc::timed_out);
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (auto ec = wait_for(fd, POLLIN, remaining, cancel); ec) {
            return ec;
        }
    }
}

bool peer_hung_up(int fd) noexcept {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLRDHUP;
    if (poll(&pfd, 1, 0) <= 0) {
        return false;
    }
    return (pfd.revents & (POLLRDHUP | POLLHUP | POLLERR)) != 0;
}

}  // namespace harbor::core

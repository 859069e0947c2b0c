#pragma once

#include <netinet/in.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

#include "cancellation.hpp"

namespace harbor::core {

/// Create a non-blocking listening socket; returns -1 on failure
[[nodiscard]] int create_listening_socket(std::string_view address, uint16_t port, int backlog);

[[nodiscard]] std::error_code set_nonblocking(int fd);
[[nodiscard]] std::error_code set_blocking(int fd);
[[nodiscard]] std::error_code set_reuseaddr(int fd);
[[nodiscard]] std::error_code set_nodelay(int fd);

void close_fd(int fd);

/// Local port a socket is bound to (0 on failure)
[[nodiscard]] uint16_t local_port(int fd) noexcept;

/// Resolve an IPv4 address; results for host names are cached process-wide
[[nodiscard]] std::error_code resolve_ipv4(const std::string& host, uint16_t port,
                                           sockaddr_in& out);

/// Non-blocking connect bounded by timeout. On success returns the fd (left
/// non-blocking, TCP_NODELAY set). On failure returns -1 and sets ec to
/// connection_refused, timed_out, operation_canceled or the system error.
[[nodiscard]] int connect_with_timeout(const std::string& host, uint16_t port,
                                       std::chrono::milliseconds timeout,
                                       const CancellationToken& cancel, std::error_code& ec);

/// Write all bytes within timeout
[[nodiscard]] std::error_code send_all(int fd, std::string_view data,
                                       std::chrono::milliseconds timeout,
                                       const CancellationToken& cancel);

/// Read whatever is available within timeout. received == 0 with no error
/// means the peer closed the connection.
[[nodiscard]] std::error_code recv_some(int fd, char* buffer, size_t capacity,
                                        std::chrono::milliseconds timeout,
                                        const CancellationToken& cancel, size_t& received);

/// True if the peer has hung up (POLLRDHUP/POLLHUP/POLLERR), never blocks
[[nodiscard]] bool peer_hung_up(int fd) noexcept;

}  // namespace harbor::core

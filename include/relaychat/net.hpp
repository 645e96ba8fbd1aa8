#ifndef RELAYCHAT_NET_HPP
#define RELAYCHAT_NET_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

// Thin wrappers over POSIX sockets: listening, connecting, timeouts and
// exact-length reads / full writes that handle short reads and writes.
namespace relaychat {
namespace net {

enum class IoStatus { OK, CLOSED, TIMEOUT, ERROR };

// Binds and listens on host:port (port 0 picks an ephemeral port).
// Throws std::runtime_error if nothing could be bound.
int tcp_listen(const std::string& host, std::uint16_t port, int backlog);

// Connects to the first address of host:port that accepts.
// Throws std::runtime_error on failure.
int tcp_connect(const std::string& host, std::uint16_t port);

// Blocks in accept(); returns -1 on failure with errno set.
int tcp_accept(int listen_fd, std::string& peer_addr);

std::uint16_t local_port(int fd);

// A zero duration disables the timeout.
bool set_recv_timeout(int fd, std::chrono::milliseconds timeout);

// Reads exactly n bytes. CLOSED is only reported when the peer closed before
// the first byte; got tells how many bytes arrived in any case.
IoStatus read_n(int fd, void* buf, std::size_t n, std::size_t& got);

// Writes all n bytes with MSG_NOSIGNAL. A non-zero timeout bounds the whole
// write, however the peer paces its reads: once it has passed, TIMEOUT is
// returned and part of the data may already be on the wire.
IoStatus write_all(int fd, const void* buf, std::size_t n,
                   std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

void shutdown_both(int fd);
void close_fd(int fd);

std::string errno_str();

}
}

#endif

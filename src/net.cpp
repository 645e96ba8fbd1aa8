#include "relaychat/net.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <poll.h>
#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>

namespace relaychat {
namespace net {

namespace {

std::string describe(const sockaddr* sa) {
    char host[INET6_ADDRSTRLEN] = {0};
    std::uint16_t port = 0;

    if (sa->sa_family == AF_INET) {
        auto* in = reinterpret_cast<const sockaddr_in*>(sa);
        inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host));
        port = ntohs(in->sin_port);
    } else if (sa->sa_family == AF_INET6) {
        auto* in6 = reinterpret_cast<const sockaddr_in6*>(sa);
        inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
        port = ntohs(in6->sin6_port);
    } else {
        return "unknown";
    }
    return std::string(host) + ":" + std::to_string(port);
}

bool set_timeout(int fd, int option, std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    return setsockopt(fd, SOL_SOCKET, option, &tv, sizeof(tv)) == 0;
}

addrinfo* resolve(const std::string& host, std::uint16_t port, bool passive) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    if (passive) hints.ai_flags = AI_PASSIVE;

    addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    int rc = getaddrinfo(host.empty() ? nullptr : host.c_str(), service.c_str(), &hints, &res);
    if (rc != 0) {
        throw std::runtime_error("cannot resolve " + host + ":" + service + ": " + gai_strerror(rc));
    }
    return res;
}

}

int tcp_listen(const std::string& host, std::uint16_t port, int backlog) {
    addrinfo* res = resolve(host, port, true);

    int fd = -1;
    std::string last_error = "no usable address";
    for (addrinfo* p = res; p != nullptr; p = p->ai_next) {
        fd = socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (fd < 0) {
            last_error = "socket(): " + errno_str();
            continue;
        }

        int opt = 1;
        setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        if (bind(fd, p->ai_addr, p->ai_addrlen) < 0) {
            last_error = "bind(): " + errno_str();
        } else if (listen(fd, backlog) < 0) {
            last_error = "listen(): " + errno_str();
        } else {
            break;
        }
        close(fd);
        fd = -1;
    }
    freeaddrinfo(res);

    if (fd < 0) {
        throw std::runtime_error("cannot listen on " + host + ":" + std::to_string(port) +
                                 ": " + last_error);
    }
    return fd;
}

int tcp_connect(const std::string& host, std::uint16_t port) {
    addrinfo* res = resolve(host, port, false);

    int fd = -1;
    std::string last_error = "no usable address";
    for (addrinfo* p = res; p != nullptr; p = p->ai_next) {
        fd = socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (fd < 0) {
            last_error = errno_str();
            continue;
        }
        if (connect(fd, p->ai_addr, p->ai_addrlen) == 0) break;
        last_error = errno_str();
        close(fd);
        fd = -1;
    }
    freeaddrinfo(res);

    if (fd < 0) {
        throw std::runtime_error("cannot connect to " + host + ":" + std::to_string(port) +
                                 ": " + last_error);
    }
    return fd;
}

int tcp_accept(int listen_fd, std::string& peer_addr) {
    sockaddr_storage cli{};
    socklen_t cli_len = sizeof(cli);
    int cfd = accept(listen_fd, reinterpret_cast<sockaddr*>(&cli), &cli_len);
    if (cfd >= 0) {
        peer_addr = describe(reinterpret_cast<sockaddr*>(&cli));
    }
    return cfd;
}

std::uint16_t local_port(int fd) {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) return 0;

    if (addr.ss_family == AF_INET) {
        return ntohs(reinterpret_cast<sockaddr_in*>(&addr)->sin_port);
    }
    if (addr.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port);
    }
    return 0;
}

bool set_recv_timeout(int fd, std::chrono::milliseconds timeout) {
    return set_timeout(fd, SO_RCVTIMEO, timeout);
}

IoStatus read_n(int fd, void* buf, std::size_t n, std::size_t& got) {
    char* p = static_cast<char*>(buf);
    got = 0;
    while (got < n) {
        ssize_t r = recv(fd, p + got, n - got, 0);
        if (r > 0) {
            got += static_cast<std::size_t>(r);
            continue;
        }
        if (r == 0) return IoStatus::CLOSED;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return IoStatus::TIMEOUT;
        return IoStatus::ERROR;
    }
    return IoStatus::OK;
}

IoStatus write_all(int fd, const void* buf, std::size_t n, std::chrono::milliseconds timeout) {
    using clock = std::chrono::steady_clock;
    const bool bounded = timeout.count() > 0;
    const clock::time_point deadline = clock::now() + timeout;
    const int flags = MSG_NOSIGNAL | (bounded ? MSG_DONTWAIT : 0);

    const char* p = static_cast<const char*>(buf);
    std::size_t left = n;
    while (left > 0) {
        ssize_t w = send(fd, p, left, flags);
        if (w > 0) {
            p += w;
            left -= static_cast<std::size_t>(w);
            continue;
        }
        if (w < 0 && errno == EINTR) continue;
        if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            if (!bounded) return IoStatus::TIMEOUT;
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
            if (remaining.count() <= 0) return IoStatus::TIMEOUT;

            pollfd pfd{};
            pfd.fd = fd;
            pfd.events = POLLOUT;
            int r = poll(&pfd, 1, static_cast<int>(remaining.count()));
            if (r == 0) return IoStatus::TIMEOUT;
            if (r < 0 && errno != EINTR) return IoStatus::ERROR;
            // Writable, hung up or interrupted: the next send() tells which.
            continue;
        }
        if (w < 0 && (errno == EPIPE || errno == ECONNRESET)) return IoStatus::CLOSED;
        return IoStatus::ERROR;
    }
    return IoStatus::OK;
}

void shutdown_both(int fd) {
    if (fd >= 0) shutdown(fd, SHUT_RDWR);
}

void close_fd(int fd) {
    if (fd >= 0) close(fd);
}

std::string errno_str() {
    return std::string(std::strerror(errno));
}

}
}

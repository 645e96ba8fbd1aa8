#include "relaychat/connection.hpp"

#include <utility>
#include <vector>

#include "relaychat/frame.hpp"
#include "relaychat/net.hpp"
#include "relaychat/tslog.hpp"

using namespace tslog;

namespace relaychat {

const char* read_status_to_string(ReadStatus status) {
    switch (status) {
        case ReadStatus::Ok:           return "ok";
        case ReadStatus::EndOfStream:  return "end of stream";
        case ReadStatus::FramingError: return "framing error";
        case ReadStatus::Timeout:      return "timeout";
    }
    return "unknown";
}

Connection::Connection(int fd, std::string peer)
    : fd_(fd), peer_(std::move(peer)) {}

Connection::~Connection() {
    net::shutdown_both(fd_);
    net::close_fd(fd_);
}

ReadStatus Connection::read_message(Message& out) {
    std::uint8_t prefix[kLengthPrefixSize];
    std::size_t got = 0;

    switch (net::read_n(fd_, prefix, sizeof(prefix), got)) {
        case net::IoStatus::OK:
            break;
        case net::IoStatus::CLOSED:
            if (got == 0) return ReadStatus::EndOfStream;
            Logger::instance().warn("Truncated frame header from " + peer_);
            close();
            return ReadStatus::FramingError;
        case net::IoStatus::TIMEOUT:
            if (got == 0) return ReadStatus::Timeout;
            close();
            return ReadStatus::FramingError;
        case net::IoStatus::ERROR:
            // Reset by peer or shut down locally: the stream is over.
            return ReadStatus::EndOfStream;
    }

    try {
        std::uint32_t len = decode_length_prefix(prefix);
        std::vector<std::uint8_t> body(len);

        if (net::read_n(fd_, body.data(), body.size(), got) != net::IoStatus::OK) {
            Logger::instance().warn("Truncated frame from " + peer_ + " (" +
                                    std::to_string(got) + " of " + std::to_string(len) + " bytes)");
            close();
            return ReadStatus::FramingError;
        }

        out = decode_frame_body(body);
        out.sender_id = kNoClient;
        return ReadStatus::Ok;
    } catch (const FramingError& e) {
        Logger::instance().warn("Malformed frame from " + peer_ + ": " + e.what());
        close();
        return ReadStatus::FramingError;
    }
}

bool Connection::write_message(const Message& msg) {
    std::vector<std::uint8_t> frame;
    try {
        frame = encode_frame(msg);
    } catch (const FramingError& e) {
        Logger::instance().error("Cannot encode message for " + peer_ + ": " + e.what());
        return false;
    }

    std::lock_guard<std::mutex> lg(write_mtx_);
    if (!alive_.load()) return false;

    net::IoStatus st = net::write_all(fd_, frame.data(), frame.size(), write_timeout_);
    if (st == net::IoStatus::OK) return true;

    if (st == net::IoStatus::TIMEOUT) {
        Logger::instance().warn("Write timeout to " + peer_);
    } else {
        Logger::instance().info("Write to " + peer_ + " failed: " + net::errno_str());
    }
    // A partial frame may have been sent, so the stream cannot be reused.
    close();
    return false;
}

void Connection::set_read_timeout(std::chrono::milliseconds timeout) {
    if (!net::set_recv_timeout(fd_, timeout)) {
        Logger::instance().warn("setsockopt(SO_RCVTIMEO) failed for " + peer_ + ": " + net::errno_str());
    }
}

void Connection::set_write_timeout(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lg(write_mtx_);
    write_timeout_ = timeout;
}

void Connection::close() {
    bool was_alive = alive_.exchange(false);
    if (was_alive) {
        net::shutdown_both(fd_);
    }
}

void Connection::assign_identity(ClientId id, const std::string& name) {
    id_ = id;
    name_ = name;
}

}

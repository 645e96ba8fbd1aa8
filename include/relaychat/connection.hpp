#ifndef RELAYCHAT_CONNECTION_HPP
#define RELAYCHAT_CONNECTION_HPP

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>

#include "relaychat/message.hpp"

namespace relaychat {

enum class ReadStatus { Ok, EndOfStream, FramingError, Timeout };

const char* read_status_to_string(ReadStatus status);

// One framed duplex stream. The connection owns the socket: close() shuts it
// down so blocked readers and writers return, and the descriptor itself is
// released by the destructor.
//
// Reads must come from a single thread (the session that owns the
// connection). Writes may come from any thread and are serialized.
class Connection {
public:
    Connection(int fd, std::string peer);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Blocks until one full frame is read. A stream that ends between frames
    // is EndOfStream; one that ends inside a frame, or carries a malformed
    // frame, is FramingError and closes the connection.
    ReadStatus read_message(Message& out);

    // Returns false on any write failure (reset, broken pipe, timeout or an
    // already closed connection). A failed write closes the connection.
    bool write_message(const Message& msg);

    void set_read_timeout(std::chrono::milliseconds timeout);
    // Bounds each write_message() as a whole, not each send() inside it.
    void set_write_timeout(std::chrono::milliseconds timeout);

    void close();
    bool alive() const { return alive_.load(); }

    // Set once by the server when the handshake succeeds, before the
    // connection is shared with other threads.
    void assign_identity(ClientId id, const std::string& name);

    ClientId id() const { return id_; }
    const std::string& display_name() const { return name_; }
    const std::string& peer() const { return peer_; }

private:
    int fd_;
    std::string peer_;
    ClientId id_{kNoClient};
    std::string name_;
    std::atomic<bool> alive_{true};
    std::mutex write_mtx_;
    std::chrono::milliseconds write_timeout_{0};  // guarded by write_mtx_
};

}

#endif

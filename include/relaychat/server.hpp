#ifndef RELAYCHAT_SERVER_HPP
#define RELAYCHAT_SERVER_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>

#include "relaychat/broadcaster.hpp"
#include "relaychat/client_registry.hpp"
#include "relaychat/config.hpp"
#include "relaychat/connection.hpp"
#include "relaychat/outbound_queue.hpp"

namespace relaychat {

enum class SessionState { Connecting, Handshaking, Active, Closing, Closed };

const char* session_state_to_string(SessionState state);

class ChatServer {
public:
    explicit ChatServer(ServerConfig cfg);
    ~ChatServer();

    ChatServer(const ChatServer&) = delete;
    ChatServer& operator=(const ChatServer&) = delete;

    // Binds, listens and starts the accept and dispatcher threads.
    // Throws std::runtime_error if the address cannot be bound.
    void start();

    // Blocks until the accept loop has ended (after request_stop or stop).
    void wait();

    // Only stores a flag and shuts the listening socket down, so it can be
    // called from a signal handler.
    void request_stop();

    // Stops accepting, closes every session and waits for their teardown,
    // then drains the dispatcher. Safe to call more than once.
    void stop();

    std::uint16_t port() const { return bound_port_; }
    bool running() const { return running_.load(); }

    const ClientRegistry& registry() const { return registry_; }
    std::size_t session_count() const;

private:
    void accept_loop();
    void dispatch_loop();
    void client_handler(std::shared_ptr<Connection> conn);
    bool handshake(const std::shared_ptr<Connection>& conn);
    void reject(Connection& conn, const std::string& reason);
    void enqueue(Message msg, ClientId exclude_id);
    void end_session(const std::shared_ptr<Connection>& conn);

    ServerConfig cfg_;
    int listen_fd_{-1};
    std::uint16_t bound_port_{0};
    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<ClientId> next_id_{1};

    ClientRegistry registry_;
    Broadcaster broadcaster_;
    OutboundQueue outbound_;

    std::thread accept_thr_;
    std::thread dispatch_thr_;
    std::mutex join_mtx_;

    // Every live session, registered or still handshaking. Used to cut them
    // all off on shutdown; broadcasts only ever look at the registry.
    mutable std::mutex sessions_mtx_;
    std::condition_variable sessions_cv_;
    std::unordered_set<std::shared_ptr<Connection>> sessions_;
};

}

#endif

#include "relaychat/server.hpp"

#include <cerrno>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "relaychat/net.hpp"
#include "relaychat/tslog.hpp"

using namespace tslog;

namespace relaychat {

namespace {

constexpr std::chrono::milliseconds DISPATCH_POLL{200};
constexpr std::chrono::milliseconds ACCEPT_BACKOFF{100};

std::string join_names(const std::vector<std::string>& names) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& n : names) {
        if (!first) oss << ", ";
        oss << n;
        first = false;
    }
    return oss.str();
}

}

const char* session_state_to_string(SessionState state) {
    switch (state) {
        case SessionState::Connecting:  return "connecting";
        case SessionState::Handshaking: return "handshaking";
        case SessionState::Active:      return "active";
        case SessionState::Closing:     return "closing";
        case SessionState::Closed:      return "closed";
    }
    return "unknown";
}

ChatServer::ChatServer(ServerConfig cfg)
    : cfg_(std::move(cfg)), broadcaster_(registry_) {}

ChatServer::~ChatServer() {
    stop();
    net::close_fd(listen_fd_);
}

void ChatServer::start() {
    if (running_.load() || stopped_.load()) return;

    listen_fd_ = net::tcp_listen(cfg_.host, cfg_.port, cfg_.backlog);
    bound_port_ = net::local_port(listen_fd_);
    running_.store(true);

    Logger::instance().info("Listening on " + cfg_.host + ":" + std::to_string(bound_port_) +
                            " (max " + std::to_string(cfg_.max_clients) + " clients)");

    dispatch_thr_ = std::thread(&ChatServer::dispatch_loop, this);
    accept_thr_ = std::thread(&ChatServer::accept_loop, this);
}

void ChatServer::wait() {
    std::lock_guard<std::mutex> lg(join_mtx_);
    if (accept_thr_.joinable()) accept_thr_.join();
}

void ChatServer::request_stop() {
    running_.store(false);
    if (listen_fd_ >= 0) {
        net::shutdown_both(listen_fd_);
    }
}

void ChatServer::stop() {
    if (stopped_.exchange(true)) return;

    request_stop();
    wait();

    {
        std::unique_lock<std::mutex> lock(sessions_mtx_);
        if (!sessions_.empty()) {
            Logger::instance().info("Closing " + std::to_string(sessions_.size()) + " sessions");
        }
        for (const auto& conn : sessions_) {
            conn->close();
        }
        sessions_cv_.wait(lock, [this]{ return sessions_.empty(); });
    }

    outbound_.close();
    if (dispatch_thr_.joinable()) dispatch_thr_.join();

    Logger::instance().info("Server stopped");
}

std::size_t ChatServer::session_count() const {
    std::lock_guard<std::mutex> lg(sessions_mtx_);
    return sessions_.size();
}

void ChatServer::accept_loop() {
    while (running_.load()) {
        std::string peer;
        int cfd = net::tcp_accept(listen_fd_, peer);

        if (cfd < 0) {
            int err = errno;
            if (!running_.load()) break;
            if (err == EINTR || err == ECONNABORTED) continue;

            Logger::instance().error("accept() failed: " + net::errno_str());
            if (err == EMFILE || err == ENFILE || err == ENOBUFS || err == ENOMEM) {
                std::this_thread::sleep_for(ACCEPT_BACKOFF);
                continue;
            }
            if (err == EBADF || err == EINVAL || err == ENOTSOCK) break;
            continue;
        }

        auto conn = std::make_shared<Connection>(cfd, peer);
        conn->set_write_timeout(cfg_.write_timeout);

        bool full = false;
        {
            std::lock_guard<std::mutex> lg(sessions_mtx_);
            if (sessions_.size() >= cfg_.max_clients) {
                full = true;
            } else {
                sessions_.insert(conn);
            }
        }

        if (full) {
            Logger::instance().warn("Refusing " + peer + ": server is full");
            reject(*conn, "server is full");
            continue;
        }

        Logger::instance().info("Connection from " + peer);
        std::thread(&ChatServer::client_handler, this, conn).detach();
    }
    Logger::instance().debug("Accept loop finished");
}

void ChatServer::dispatch_loop() {
    Outbound item;
    while (!outbound_.drained()) {
        if (!outbound_.pop(item, DISPATCH_POLL)) continue;
        broadcaster_.broadcast(item.msg, item.exclude_id);
    }
}

void ChatServer::client_handler(std::shared_ptr<Connection> conn) {
    SessionState state = SessionState::Handshaking;
    Logger::instance().debug(conn->peer() + ": " + session_state_to_string(state));

    if (handshake(conn)) {
        state = SessionState::Active;
        Logger::instance().debug(conn->peer() + ": " + session_state_to_string(state));

        Message in;
        bool keep_going = true;
        while (keep_going) {
            ReadStatus st = conn->read_message(in);
            if (st != ReadStatus::Ok) {
                Logger::instance().info("Client " + conn->display_name() + " disconnected (" +
                                        read_status_to_string(st) + ")");
                break;
            }

            switch (in.kind) {
                case MessageKind::Chat:
                    Logger::instance().info("Message from " + conn->display_name() + ": " + in.body);
                    enqueue(make_chat(conn->id(), conn->display_name(), in.body), conn->id());
                    break;
                case MessageKind::Handshake:
                case MessageKind::Join:
                case MessageKind::Leave:
                case MessageKind::System:
                    Logger::instance().warn("Protocol violation from " + conn->display_name() +
                                            ": unexpected " + kind_to_string(in.kind) + " frame");
                    keep_going = false;
                    break;
            }
        }

        state = SessionState::Closing;
        Logger::instance().debug(conn->peer() + ": " + session_state_to_string(state));

        if (registry_.deregister_client(conn->id())) {
            enqueue(make_leave(conn->id(), conn->display_name()), kNoClient);
        }
        conn->close();
        Logger::instance().info("User " + conn->display_name() + " left the chat");
    }

    state = SessionState::Closed;
    Logger::instance().debug(conn->peer() + ": " + session_state_to_string(state));
    end_session(conn);
}

bool ChatServer::handshake(const std::shared_ptr<Connection>& conn) {
    conn->set_read_timeout(cfg_.handshake_timeout);

    Message first;
    ReadStatus st = conn->read_message(first);
    if (st != ReadStatus::Ok) {
        Logger::instance().warn("Handshake from " + conn->peer() + " failed: " +
                                read_status_to_string(st));
        if (st == ReadStatus::Timeout) {
            reject(*conn, "handshake timed out");
        } else {
            conn->close();
        }
        return false;
    }

    if (first.kind != MessageKind::Handshake) {
        Logger::instance().warn("Handshake from " + conn->peer() + " failed: got " +
                                kind_to_string(first.kind) + " frame first");
        reject(*conn, "expected a handshake");
        return false;
    }

    std::string name = normalize_display_name(first.body);
    if (name.empty()) {
        Logger::instance().warn("Handshake from " + conn->peer() + " failed: invalid name");
        reject(*conn, "invalid display name");
        return false;
    }

    conn->set_read_timeout(std::chrono::milliseconds(0));

    ClientId id = next_id_.fetch_add(1);
    conn->assign_identity(id, name);

    if (registry_.register_client(id, conn) != RegisterResult::Ok) {
        Logger::instance().error("Client id " + std::to_string(id) + " is already registered");
        reject(*conn, "internal error");
        return false;
    }

    Logger::instance().info("User " + name + " (id " + std::to_string(id) + ") joined from " +
                            conn->peer() + "; online: " + join_names(registry_.display_names()));
    enqueue(make_join(id, name), kNoClient);
    return true;
}

void ChatServer::reject(Connection& conn, const std::string& reason) {
    if (!conn.write_message(make_system("connection rejected: " + reason))) {
        Logger::instance().debug("Could not tell " + conn.peer() + " why it was rejected");
    }
    conn.close();
}

void ChatServer::enqueue(Message msg, ClientId exclude_id) {
    if (!outbound_.push(Outbound{std::move(msg), exclude_id})) {
        Logger::instance().warn("Dropping broadcast: dispatcher already stopped");
    }
}

void ChatServer::end_session(const std::shared_ptr<Connection>& conn) {
    std::lock_guard<std::mutex> lg(sessions_mtx_);
    sessions_.erase(conn);
    sessions_cv_.notify_all();
}

}

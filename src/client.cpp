#include "relaychat/client.hpp"

#include <cerrno>
#include <cstddef>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <utility>

#include <poll.h>
#include <unistd.h>

#include "relaychat/net.hpp"
#include "relaychat/tslog.hpp"

using namespace tslog;

namespace relaychat {

namespace {

constexpr int INPUT_POLL_MS = 200;
constexpr std::size_t INPUT_CHUNK = 4096;

}

ChatClient::ChatClient(ClientConfig cfg, std::istream& input, std::ostream& output, int input_fd)
    : cfg_(std::move(cfg)),
      name_(normalize_display_name(cfg_.name)),
      in_(input),
      out_(output),
      input_fd_(input_fd) {}

ChatClient::~ChatClient() {
    stop();
    if (recv_th_.joinable()) recv_th_.join();
}

bool ChatClient::is_quit_command(const std::string& line) {
    return line == "/quit" || line == "/exit" || line == "!exit";
}

int ChatClient::run() {
    std::string endpoint = cfg_.host + ":" + std::to_string(cfg_.port);
    if (name_.empty()) {
        print("Error: invalid display name '" + cfg_.name + "'");
        Logger::instance().error("Invalid display name: " + cfg_.name);
        return 1;
    }

    try {
        conn_ = std::make_unique<Connection>(net::tcp_connect(cfg_.host, cfg_.port), endpoint);
    } catch (const std::runtime_error& e) {
        print(std::string("Error: ") + e.what());
        Logger::instance().error(e.what());
        return 1;
    }
    Logger::instance().info("Connected to " + endpoint);

    if (!conn_->write_message(make_handshake(name_))) {
        // The server may already have said why it hung up.
        Message reason;
        if (conn_->read_message(reason) == ReadStatus::Ok) print(render(reason));
        print("Error: the server closed the connection during the handshake");
        Logger::instance().error("Handshake write to " + endpoint + " failed");
        return 1;
    }

    print("=== Connected to " + endpoint + " as " + name_ + " (type /quit to leave) ===");

    running_.store(true);
    recv_th_ = std::thread(&ChatClient::receive_loop, this);

    input_loop();

    stop();
    if (recv_th_.joinable()) recv_th_.join();

    Logger::instance().info("Client finished");
    print("Disconnected.");
    return refused_.load() ? 1 : 0;
}

void ChatClient::stop() {
    running_.store(false);
    if (conn_) conn_->close();
}

void ChatClient::receive_loop() {
    Message msg;
    while (running_.load()) {
        ReadStatus st = conn_->read_message(msg);
        if (st != ReadStatus::Ok) {
            if (running_.load()) {
                print("[SYSTEM] Connection closed by server.");
                Logger::instance().info(std::string("Receive loop ended: ") + read_status_to_string(st));
            }
            break;
        }

        if (msg.kind == MessageKind::Join && msg.sender_name == name_) {
            admitted_.store(true);
        } else if (msg.kind == MessageKind::System && !admitted_.load()) {
            // The server only talks to a client it has not admitted to refuse it.
            refused_.store(true);
        }
        print(render(msg));
    }
    running_.store(false);
}

void ChatClient::input_loop() {
    std::string line;
    while (running_.load() && next_line(line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        if (is_quit_command(line)) {
            print("Leaving the chat...");
            break;
        }

        Message msg = make_chat(kNoClient, name_, line);
        if (!conn_->write_message(msg)) {
            print("[SYSTEM] Could not send the message.");
            Logger::instance().error("Send failed");
            break;
        }
        print(render(msg));
    }
}

bool ChatClient::next_line(std::string& line) {
    if (input_fd_ < 0) return static_cast<bool>(std::getline(in_, line));

    // Reads the descriptor directly: lines already buffered by an istream
    // would be invisible to poll().
    while (running_.load()) {
        std::string::size_type nl = pending_.find('\n');
        if (nl != std::string::npos) {
            line = pending_.substr(0, nl);
            pending_.erase(0, nl + 1);
            return true;
        }
        if (input_eof_) {
            if (pending_.empty()) return false;
            line.swap(pending_);
            pending_.clear();
            return true;
        }

        pollfd pfd{};
        pfd.fd = input_fd_;
        pfd.events = POLLIN;
        int r = poll(&pfd, 1, INPUT_POLL_MS);
        if (r < 0 && errno != EINTR) return false;
        if (r <= 0) continue;

        char buf[INPUT_CHUNK];
        ssize_t n = ::read(input_fd_, buf, sizeof(buf));
        if (n > 0) {
            pending_.append(buf, static_cast<std::size_t>(n));
        } else if (n == 0) {
            input_eof_ = true;
        } else if (errno != EINTR && errno != EAGAIN) {
            Logger::instance().error("Reading input failed: " + net::errno_str());
            return false;
        }
    }
    return false;
}

void ChatClient::print(const std::string& line) {
    std::lock_guard<std::mutex> lg(out_mtx_);
    out_ << line << std::endl;
}

}

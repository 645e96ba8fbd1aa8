#ifndef RELAYCHAT_CLIENT_HPP
#define RELAYCHAT_CLIENT_HPP

#include <atomic>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "relaychat/config.hpp"
#include "relaychat/connection.hpp"

namespace relaychat {

class ChatClient {
public:
    // When input_fd is a valid descriptor the input loop reads lines from it
    // with poll() instead of from input, so it notices the server going away
    // while no input arrives. This works for terminals, pipes and files.
    ChatClient(ClientConfig cfg, std::istream& input, std::ostream& output, int input_fd = -1);
    ~ChatClient();

    ChatClient(const ChatClient&) = delete;
    ChatClient& operator=(const ChatClient&) = delete;

    // Connects, sends the handshake and runs the input and receive loops
    // until either ends. Returns the process exit code: 0 after a session
    // the server accepted, 1 if connecting failed or the server refused us.
    int run();

    // Ends both loops. Safe to call from any thread.
    void stop();

    static bool is_quit_command(const std::string& line);

private:
    void receive_loop();
    void input_loop();
    bool next_line(std::string& line);
    void print(const std::string& line);

    ClientConfig cfg_;
    std::string name_;
    std::istream& in_;
    std::ostream& out_;
    int input_fd_;
    std::string pending_;
    bool input_eof_{false};

    std::unique_ptr<Connection> conn_;
    std::thread recv_th_;
    std::atomic<bool> running_{false};
    std::atomic<bool> admitted_{false};
    std::atomic<bool> refused_{false};
    std::mutex out_mtx_;
};

}

#endif

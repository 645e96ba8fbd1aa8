#ifndef RELAYCHAT_CONFIG_HPP
#define RELAYCHAT_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "relaychat/tslog.hpp"

namespace relaychat {

constexpr const char* DEFAULT_HOST = "127.0.0.1";
constexpr std::uint16_t DEFAULT_PORT = 9999;
constexpr int BACKLOG = 10;

struct ServerConfig {
    std::string host{DEFAULT_HOST};
    std::uint16_t port{DEFAULT_PORT};
    int backlog{BACKLOG};
    std::size_t max_clients{64};
    std::chrono::milliseconds handshake_timeout{10000};
    std::chrono::milliseconds write_timeout{5000};
    std::string log_target{"server.log"};
    tslog::Level log_level{tslog::Level::DEBUG};
    bool show_help{false};
};

struct ClientConfig {
    std::string host{DEFAULT_HOST};
    std::uint16_t port{DEFAULT_PORT};
    std::string name;
    std::string log_target{"client.log"};
    tslog::Level log_level{tslog::Level::INFO};
    bool show_help{false};
};

// Positional arguments come first in the order shown by the usage text;
// --key=value options may appear anywhere. Throws std::invalid_argument.
ServerConfig parse_server_args(int argc, const char* const* argv);
ClientConfig parse_client_args(int argc, const char* const* argv);

std::string server_usage(const std::string& prog);
std::string client_usage(const std::string& prog);

std::uint16_t parse_port(const std::string& text, bool allow_zero);

}

#endif

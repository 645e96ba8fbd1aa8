#include <gtest/gtest.h>

#include <stdexcept>
#include <utility>
#include <vector>

#include "relaychat/config.hpp"

using namespace relaychat;

namespace {

template <typename Config, typename Parser>
Config parse(Parser parser, std::vector<const char*> args) {
    args.insert(args.begin(), "prog");
    return parser(static_cast<int>(args.size()), args.data());
}

ServerConfig server(std::vector<const char*> args) {
    return parse<ServerConfig>(parse_server_args, std::move(args));
}

ClientConfig client(std::vector<const char*> args) {
    return parse<ClientConfig>(parse_client_args, std::move(args));
}

}

TEST(ConfigTest, ServerDefaults) {
    ServerConfig cfg = server({});
    EXPECT_EQ(cfg.host, "127.0.0.1");
    EXPECT_EQ(cfg.port, 9999);
    EXPECT_EQ(cfg.max_clients, 64u);
    EXPECT_EQ(cfg.log_target, "server.log");
    EXPECT_EQ(cfg.log_level, tslog::Level::DEBUG);
    EXPECT_FALSE(cfg.show_help);
}

TEST(ConfigTest, ServerPositionalAndOptions) {
    ServerConfig cfg = server({"0.0.0.0", "--level=warn", "7000", "--log=stderr",
                               "--max-clients=3", "--handshake-timeout=250", "--write-timeout=100"});
    EXPECT_EQ(cfg.host, "0.0.0.0");
    EXPECT_EQ(cfg.port, 7000);
    EXPECT_EQ(cfg.log_level, tslog::Level::WARN);
    EXPECT_EQ(cfg.log_target, "stderr");
    EXPECT_EQ(cfg.max_clients, 3u);
    EXPECT_EQ(cfg.handshake_timeout.count(), 250);
    EXPECT_EQ(cfg.write_timeout.count(), 100);
}

TEST(ConfigTest, ServerAcceptsEphemeralPort) {
    EXPECT_EQ(server({"localhost", "0"}).port, 0);
}

TEST(ConfigTest, ServerRejectsBadInput) {
    EXPECT_THROW(server({"host", "http"}), std::invalid_argument);
    EXPECT_THROW(server({"host", "70000"}), std::invalid_argument);
    EXPECT_THROW(server({"host", "99x"}), std::invalid_argument);
    EXPECT_THROW(server({"a", "1", "extra"}), std::invalid_argument);
    EXPECT_THROW(server({"--verbose=1"}), std::invalid_argument);
    EXPECT_THROW(server({"--log"}), std::invalid_argument);
    EXPECT_THROW(server({"--max-clients=0"}), std::invalid_argument);
    EXPECT_THROW(server({"--level=loud"}), std::invalid_argument);
}

TEST(ConfigTest, HelpFlag) {
    EXPECT_TRUE(server({"--help"}).show_help);
    EXPECT_TRUE(client({"-h"}).show_help);
    EXPECT_NE(server_usage("relaychat_server").find("--max-clients"), std::string::npos);
    EXPECT_NE(client_usage("relaychat_client").find("name"), std::string::npos);
}

TEST(ConfigTest, ClientPositionals) {
    ClientConfig cfg = client({"example.org", "4242", "alice"});
    EXPECT_EQ(cfg.host, "example.org");
    EXPECT_EQ(cfg.port, 4242);
    EXPECT_EQ(cfg.name, "alice");
    EXPECT_EQ(cfg.log_target, "client.log");
    EXPECT_EQ(cfg.log_level, tslog::Level::INFO);
}

TEST(ConfigTest, ClientNameIsOptional) {
    ClientConfig cfg = client({"10.0.0.1"});
    EXPECT_EQ(cfg.host, "10.0.0.1");
    EXPECT_EQ(cfg.port, 9999);
    EXPECT_TRUE(cfg.name.empty());
}

TEST(ConfigTest, ClientRejectsPortZero) {
    EXPECT_THROW(client({"localhost", "0"}), std::invalid_argument);
    EXPECT_THROW(client({"--max-clients=2"}), std::invalid_argument);
}

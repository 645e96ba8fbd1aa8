#include <csignal>
#include <exception>
#include <iostream>
#include <string>

#include "relaychat/config.hpp"
#include "relaychat/server.hpp"
#include "relaychat/tslog.hpp"

using namespace tslog;
using namespace relaychat;

namespace {

ChatServer* g_server = nullptr;

void sigint_handler(int) {
    if (g_server) g_server->request_stop();
}

}

int main(int argc, char** argv) {
    ServerConfig cfg;
    try {
        cfg = parse_server_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n" << server_usage(argv[0]);
        return 1;
    }
    if (cfg.show_help) {
        std::cout << server_usage(argv[0]);
        return 0;
    }

    try {
        Logger::instance().init(cfg.log_target, cfg.log_level);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    Logger::instance().info("=== Chat server starting ===");

    std::signal(SIGPIPE, SIG_IGN);

    ChatServer server(cfg);
    try {
        server.start();
    } catch (const std::exception& e) {
        Logger::instance().error(std::string("Startup failed: ") + e.what());
        Logger::instance().shutdown();
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    g_server = &server;
    std::signal(SIGINT, sigint_handler);
    std::signal(SIGTERM, sigint_handler);

    std::cout << "Server listening on " << cfg.host << ":" << server.port() << std::endl;

    server.wait();
    Logger::instance().info("Interrupt received, shutting down");
    server.stop();

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_server = nullptr;

    Logger::instance().info("Server shut down");
    Logger::instance().shutdown();

    std::cout << "Server shut down cleanly." << std::endl;
    return 0;
}

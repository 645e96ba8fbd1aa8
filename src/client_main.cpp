#include <cerrno>
#include <csignal>
#include <exception>
#include <iostream>
#include <string>

#include <unistd.h>

#include "relaychat/client.hpp"
#include "relaychat/config.hpp"
#include "relaychat/message.hpp"
#include "relaychat/tslog.hpp"

using namespace tslog;
using namespace relaychat;

namespace {

// One byte at a time, so nothing past the name is taken from stdin before the
// client starts reading it.
bool read_name_line(std::string& out) {
    out.clear();
    char c;
    for (;;) {
        ssize_t n = ::read(STDIN_FILENO, &c, 1);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return !out.empty();
        if (c == '\n') return true;
        out.push_back(c);
    }
}

}

int main(int argc, char** argv) {
    ClientConfig cfg;
    try {
        cfg = parse_client_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n" << client_usage(argv[0]);
        return 1;
    }
    if (cfg.show_help) {
        std::cout << client_usage(argv[0]);
        return 0;
    }

    try {
        Logger::instance().init(cfg.log_target, cfg.log_level);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    Logger::instance().info("Client starting: " + cfg.host + ":" + std::to_string(cfg.port));

    std::signal(SIGPIPE, SIG_IGN);

    while (normalize_display_name(cfg.name).empty()) {
        std::cout << "Enter your display name: " << std::flush;
        if (!read_name_line(cfg.name)) {
            Logger::instance().shutdown();
            return 1;
        }
    }

    ChatClient client(cfg, std::cin, std::cout, STDIN_FILENO);
    int rc = client.run();

    Logger::instance().info("Client exiting with code " + std::to_string(rc));
    Logger::instance().shutdown();
    return rc;
}

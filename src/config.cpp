#include "relaychat/config.hpp"

#include <sstream>
#include <stdexcept>
#include <vector>

namespace relaychat {

namespace {

struct Option {
    std::string key;
    std::string value;
};

// Splits argv into positional arguments and --key=value options.
void split_args(int argc, const char* const* argv,
                std::vector<std::string>& positional, std::vector<Option>& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            options.push_back({"help", ""});
        } else if (arg.rfind("--", 0) == 0) {
            auto eq = arg.find('=');
            if (eq == std::string::npos) {
                throw std::invalid_argument("option needs a value: " + arg);
            }
            options.push_back({arg.substr(2, eq - 2), arg.substr(eq + 1)});
        } else {
            positional.push_back(arg);
        }
    }
}

long long parse_number(const std::string& key, const std::string& text, long long min, long long max) {
    std::size_t used = 0;
    long long v = 0;
    try {
        v = std::stoll(text, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid value for " + key + ": '" + text + "'");
    }
    if (used != text.size() || v < min || v > max) {
        throw std::invalid_argument("invalid value for " + key + ": '" + text + "'");
    }
    return v;
}

}

std::uint16_t parse_port(const std::string& text, bool allow_zero) {
    return static_cast<std::uint16_t>(parse_number("port", text, allow_zero ? 0 : 1, 65535));
}

ServerConfig parse_server_args(int argc, const char* const* argv) {
    std::vector<std::string> positional;
    std::vector<Option> options;
    split_args(argc, argv, positional, options);

    ServerConfig cfg;
    if (positional.size() > 2) {
        throw std::invalid_argument("too many arguments");
    }
    if (positional.size() > 0) cfg.host = positional[0];
    if (positional.size() > 1) cfg.port = parse_port(positional[1], true);

    for (const auto& opt : options) {
        if (opt.key == "help") {
            cfg.show_help = true;
        } else if (opt.key == "log") {
            cfg.log_target = opt.value;
        } else if (opt.key == "level") {
            cfg.log_level = tslog::parse_level(opt.value);
        } else if (opt.key == "max-clients") {
            cfg.max_clients = static_cast<std::size_t>(parse_number(opt.key, opt.value, 1, 100000));
        } else if (opt.key == "handshake-timeout") {
            cfg.handshake_timeout = std::chrono::milliseconds(parse_number(opt.key, opt.value, 1, 3600000));
        } else if (opt.key == "write-timeout") {
            cfg.write_timeout = std::chrono::milliseconds(parse_number(opt.key, opt.value, 1, 3600000));
        } else {
            throw std::invalid_argument("unknown option: --" + opt.key);
        }
    }
    return cfg;
}

ClientConfig parse_client_args(int argc, const char* const* argv) {
    std::vector<std::string> positional;
    std::vector<Option> options;
    split_args(argc, argv, positional, options);

    ClientConfig cfg;
    if (positional.size() > 3) {
        throw std::invalid_argument("too many arguments");
    }
    if (positional.size() > 0) cfg.host = positional[0];
    if (positional.size() > 1) cfg.port = parse_port(positional[1], false);
    if (positional.size() > 2) cfg.name = positional[2];

    for (const auto& opt : options) {
        if (opt.key == "help") {
            cfg.show_help = true;
        } else if (opt.key == "log") {
            cfg.log_target = opt.value;
        } else if (opt.key == "level") {
            cfg.log_level = tslog::parse_level(opt.value);
        } else {
            throw std::invalid_argument("unknown option: --" + opt.key);
        }
    }
    return cfg;
}

std::string server_usage(const std::string& prog) {
    std::ostringstream oss;
    oss << "Usage: " << prog << " [host] [port] [options]\n"
        << "  host                     address to bind (default " << DEFAULT_HOST << ")\n"
        << "  port                     port to listen on (default " << DEFAULT_PORT << ")\n"
        << "  --log=FILE               log file, or stdout/stderr (default server.log)\n"
        << "  --level=LEVEL            debug, info, warn or error (default debug)\n"
        << "  --max-clients=N          concurrent connections (default 64)\n"
        << "  --handshake-timeout=MS   time allowed for the nickname (default 10000)\n"
        << "  --write-timeout=MS       time before a stalled client is dropped (default 5000)\n";
    return oss.str();
}

std::string client_usage(const std::string& prog) {
    std::ostringstream oss;
    oss << "Usage: " << prog << " [host] [port] [name] [options]\n"
        << "  host                     server address (default " << DEFAULT_HOST << ")\n"
        << "  port                     server port (default " << DEFAULT_PORT << ")\n"
        << "  name                     display name (asked for when omitted)\n"
        << "  --log=FILE               log file, or stdout/stderr (default client.log)\n"
        << "  --level=LEVEL            debug, info, warn or error (default info)\n";
    return oss.str();
}

}

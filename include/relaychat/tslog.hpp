#ifndef RELAYCHAT_TSLOG_HPP
#define RELAYCHAT_TSLOG_HPP

#include <string>
#include <memory>

namespace tslog {

enum class Level { DEBUG = 0, INFO, WARN, ERROR };

// Process-wide asynchronous logger. Entries are queued by the calling thread
// and written by a single background worker, so log calls never block on I/O.
class Logger {
public:
    static Logger& instance();

    // target is a file path (opened in append mode), "stdout" or "stderr".
    // Throws std::runtime_error if the file cannot be opened. Calling init
    // while the logger is running has no effect.
    void init(const std::string& target, Level level = Level::DEBUG);

    void log(Level level, const std::string& msg);

    void debug(const std::string& msg);
    void info(const std::string& msg);
    void warn(const std::string& msg);
    void error(const std::string& msg);

    // Writes out everything already queued, then stops the worker.
    void shutdown();

    void set_level(Level level);
    Level level() const;
    bool running() const;

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    struct Impl;
    std::unique_ptr<Impl> pimpl;
};

std::string level_to_string(Level l);

// Accepts "debug", "info", "warn"/"warning" and "error" in any case.
Level parse_level(const std::string& name);

}

#endif

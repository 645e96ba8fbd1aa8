#include "relaychat/tslog.hpp"

#include <thread>
#include <mutex>
#include <condition_variable>
#include <vector>
#include <fstream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <atomic>
#include <iostream>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <memory>
#include <stdexcept>

namespace tslog {

namespace {

struct LogEntry {
    Level level;
    std::string message;
    std::chrono::system_clock::time_point ts;
    std::thread::id tid;
};

// "2024-05-01 12:00:00.042 [INFO ] [TID:1234] message"
std::string format_line(const LogEntry& e) {
    auto tt = std::chrono::system_clock::to_time_t(e.ts);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        e.ts.time_since_epoch()) % 1000;
    std::tm tm;
    localtime_r(&tt, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << " [" << level_to_string(e.level) << "] [TID:" << e.tid << "] "
        << e.message << '\n';
    return oss.str();
}

}

struct Logger::Impl {
    std::mutex mtx;
    std::condition_variable cv;
    std::vector<LogEntry> pending;
    std::thread worker;
    std::atomic<bool> running{false};
    std::atomic<Level> min_level{Level::DEBUG};
    std::unique_ptr<std::ofstream> file;
    std::ostream* out{nullptr};  // set by init, only touched by the worker after that

    // Takes everything queued in one go and writes it outside the lock, with a
    // single flush per batch.
    void worker_loop() {
        std::vector<LogEntry> batch;
        for (;;) {
            {
                std::unique_lock<std::mutex> lock(mtx);
                cv.wait(lock, [this] { return !pending.empty() || !running.load(); });
                if (pending.empty()) break;
                batch.swap(pending);
            }
            for (const LogEntry& e : batch) *out << format_line(e);
            out->flush();
            batch.clear();
        }
    }
};

Logger::Logger() : pimpl(std::make_unique<Impl>()) {}
Logger::~Logger() { shutdown(); }

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

void Logger::init(const std::string& target, Level level) {
    std::lock_guard<std::mutex> lg(pimpl->mtx);
    if (pimpl->running.load()) return;

    // A previous shutdown() leaves the worker joined and the file closed.
    pimpl->min_level.store(level);
    pimpl->file.reset();
    pimpl->out = nullptr;

    if (target == "stdout") {
        pimpl->out = &std::cout;
    } else if (target == "stderr") {
        pimpl->out = &std::cerr;
    } else {
        auto file = std::make_unique<std::ofstream>(target, std::ios::app);
        if (!file->is_open()) throw std::runtime_error("cannot open log file: " + target);
        pimpl->file = std::move(file);
        pimpl->out = pimpl->file.get();
    }

    pimpl->running.store(true);
    pimpl->worker = std::thread(&Impl::worker_loop, pimpl.get());
}

void Logger::log(Level level, const std::string& msg) {
    if (!pimpl->running.load()) return;
    if (level < pimpl->min_level.load()) return;

    LogEntry e{level, msg, std::chrono::system_clock::now(), std::this_thread::get_id()};
    {
        std::lock_guard<std::mutex> lg(pimpl->mtx);
        if (!pimpl->running.load()) return;
        pimpl->pending.push_back(std::move(e));
    }
    pimpl->cv.notify_one();
}

void Logger::debug(const std::string& msg) { log(Level::DEBUG, msg); }
void Logger::info(const std::string& msg)  { log(Level::INFO, msg); }
void Logger::warn(const std::string& msg)  { log(Level::WARN, msg); }
void Logger::error(const std::string& msg) { log(Level::ERROR, msg); }

void Logger::shutdown() {
    {
        std::lock_guard<std::mutex> lg(pimpl->mtx);
        if (!pimpl->running.load()) return;
        pimpl->running.store(false);
    }
    pimpl->cv.notify_all();
    if (pimpl->worker.joinable()) pimpl->worker.join();
    pimpl->file.reset();
    pimpl->out = nullptr;
}

void Logger::set_level(Level level) {
    pimpl->min_level.store(level);
}

Level Logger::level() const {
    return pimpl->min_level.load();
}

bool Logger::running() const {
    return pimpl->running.load();
}

std::string level_to_string(Level l) {
    switch (l) {
        case Level::DEBUG: return "DEBUG";
        case Level::INFO:  return "INFO ";
        case Level::WARN:  return "WARN ";
        case Level::ERROR: return "ERROR";
    }
    return "?????";
}

Level parse_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return Level::DEBUG;
    if (lower == "info") return Level::INFO;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    throw std::invalid_argument("unknown log level: " + name);
}

}

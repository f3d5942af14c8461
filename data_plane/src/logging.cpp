#include "segxfer/logging.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace segxfer {

namespace {

std::atomic<int> current_level{static_cast<int>(LogLevel::info)};

std::mutex &output_mutex() {
    static std::mutex mutex;
    return mutex;
}

const char *level_tag(LogLevel level) {
    switch (level) {
    case LogLevel::debug:
        return "DEBUG";
    case LogLevel::info:
        return "INFO";
    case LogLevel::warning:
        return "WARN";
    case LogLevel::error:
        return "ERROR";
    }
    return "?";
}

} // namespace

void set_log_level(LogLevel level) noexcept { current_level.store(static_cast<int>(level)); }

LogLevel log_level() noexcept { return static_cast<LogLevel>(current_level.load()); }

bool parse_log_level(const std::string &text, LogLevel &out) {
    if (text == "debug") {
        out = LogLevel::debug;
    } else if (text == "info") {
        out = LogLevel::info;
    } else if (text == "warning" || text == "warn") {
        out = LogLevel::warning;
    } else if (text == "error") {
        out = LogLevel::error;
    } else {
        return false;
    }
    return true;
}

void log_message(LogLevel level, const std::string &message) {
    if (static_cast<int>(level) < current_level.load()) {
        return;
    }
    std::lock_guard<std::mutex> lock(output_mutex());
    std::ostream &out = level >= LogLevel::warning ? std::cerr : std::cout;
    out << "[segxfer] " << level_tag(level) << ' ' << message << std::endl;
}

} // namespace segxfer

#pragma once

#include <string>

namespace segxfer {

enum class LogLevel { debug = 0, info = 1, warning = 2, error = 3 };

void set_log_level(LogLevel level) noexcept;

LogLevel log_level() noexcept;

// Accepts "debug", "info", "warning" (or "warn") and "error".
bool parse_log_level(const std::string &text, LogLevel &out);

void log_message(LogLevel level, const std::string &message);

inline void log_debug(const std::string &message) { log_message(LogLevel::debug, message); }
inline void log_info(const std::string &message) { log_message(LogLevel::info, message); }
inline void log_warning(const std::string &message) { log_message(LogLevel::warning, message); }
inline void log_error(const std::string &message) { log_message(LogLevel::error, message); }

} // namespace segxfer

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace gambit::util {

enum class LogLevel {
  Debug = 1,
  Info = 2,
  Warn = 3,
  Error = 4,
};

struct LogRecord {
  LogLevel level = LogLevel::Info;
  std::int64_t unix_ts = 0;
  std::string component;
  std::string message;
};

using LogSink = std::function<void(const LogRecord&)>;

// Replaces the process-wide sink. An empty sink restores the std::clog writer.
void set_log_sink(LogSink sink);
void set_log_level(LogLevel minimum);

void log(LogLevel level, std::string_view component, std::string_view message);

inline void log_debug(std::string_view component, std::string_view message) {
  log(LogLevel::Debug, component, message);
}
inline void log_info(std::string_view component, std::string_view message) {
  log(LogLevel::Info, component, message);
}
inline void log_warn(std::string_view component, std::string_view message) {
  log(LogLevel::Warn, component, message);
}
inline void log_error(std::string_view component, std::string_view message) {
  log(LogLevel::Error, component, message);
}

std::string_view log_level_name(LogLevel level);

}  // namespace gambit::util

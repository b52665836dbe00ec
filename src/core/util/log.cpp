#include "core/util/log.hpp"

#include <iostream>
#include <mutex>
#include <utility>

#include "core/util/canonical.hpp"

namespace gambit::util {
namespace {

std::mutex& sink_mutex() {
  static std::mutex mutex;
  return mutex;
}

LogSink& active_sink() {
  static LogSink sink;
  return sink;
}

LogLevel& minimum_level() {
  static LogLevel level = LogLevel::Info;
  return level;
}

void write_to_clog(const LogRecord& record) {
  std::clog << record.unix_ts << " [" << log_level_name(record.level) << "] " << record.component
            << ": " << record.message << '\n';
}

}  // namespace

void set_log_sink(LogSink sink) {
  std::scoped_lock lock(sink_mutex());
  active_sink() = std::move(sink);
}

void set_log_level(LogLevel minimum) {
  std::scoped_lock lock(sink_mutex());
  minimum_level() = minimum;
}

void log(LogLevel level, std::string_view component, std::string_view message) {
  std::scoped_lock lock(sink_mutex());
  if (static_cast<int>(level) < static_cast<int>(minimum_level())) {
    return;
  }

  const LogRecord record{
      .level = level,
      .unix_ts = unix_timestamp_now(),
      .component = std::string{component},
      .message = std::string{message},
  };
  if (active_sink()) {
    active_sink()(record);
  } else {
    write_to_clog(record);
  }
}

std::string_view log_level_name(LogLevel level) {
  switch (level) {
    case LogLevel::Debug:
      return "debug";
    case LogLevel::Info:
      return "info";
    case LogLevel::Warn:
      return "warn";
    case LogLevel::Error:
      return "error";
  }
  return "info";
}

}  // namespace gambit::util

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <source_location>
#include <string>
#include <string_view>
#include <utility>

namespace sparqlkit {

enum class LogLevel { DEBUG, INFO, WARN, ERROR, OFF };

class Logger {
 public:
  static Logger& getInstance() {
    static Logger instance;
    return instance;
  }

  void setLevel(LogLevel level) {
    switch (level) {
      case LogLevel::DEBUG:
        spdlog::set_level(spdlog::level::debug);
        break;
      case LogLevel::INFO:
        spdlog::set_level(spdlog::level::info);
        break;
      case LogLevel::WARN:
        spdlog::set_level(spdlog::level::warn);
        break;
      case LogLevel::ERROR:
        spdlog::set_level(spdlog::level::err);
        break;
      case LogLevel::OFF:
        spdlog::set_level(spdlog::level::off);
        break;
    }
  }

  [[nodiscard]] LogLevel getLevel() const {
    switch (spdlog::get_level()) {
      case spdlog::level::trace:
      case spdlog::level::debug:
        return LogLevel::DEBUG;
      case spdlog::level::warn:
        return LogLevel::WARN;
      case spdlog::level::err:
      case spdlog::level::critical:
        return LogLevel::ERROR;
      case spdlog::level::off:
        return LogLevel::OFF;
      default:
        return LogLevel::INFO;
    }
  }

  void setLogToFile(const std::string& filename) {
    try {
      auto file_sink =
          std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, true);
      auto file_logger =
          std::make_shared<spdlog::logger>("sparqlkit_file", file_sink);
      spdlog::set_default_logger(file_logger);
    } catch (const spdlog::spdlog_ex& ex) {
      spdlog::error("Log initialization failed: {}", ex.what());
    }
  }

  template <typename... Args>
  void log(spdlog::level::level_enum level,
           const std::source_location& location,
           spdlog::format_string_t<Args...> fmt, Args&&... args) {
    if (!spdlog::should_log(level)) {
      return;
    }
    std::string_view path(location.file_name());
    size_t pos = path.find_last_of("/\\");
    std::string_view filename =
        (pos == std::string_view::npos) ? path : path.substr(pos + 1);

    std::string message =
        spdlog::fmt_lib::format(fmt, std::forward<Args>(args)...);
    spdlog::log(level, "{} [{}:{}]", message, filename, location.line());
  }

 private:
  Logger() { spdlog::set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v"); }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;
};

// The location is captured at the call site through the default argument.
inline void log_debug(
    const std::string& message,
    const std::source_location& location = std::source_location::current()) {
  Logger::getInstance().log(spdlog::level::debug, location, "{}", message);
}

inline void log_info(
    const std::string& message,
    const std::source_location& location = std::source_location::current()) {
  Logger::getInstance().log(spdlog::level::info, location, "{}", message);
}

inline void log_warn(
    const std::string& message,
    const std::source_location& location = std::source_location::current()) {
  Logger::getInstance().log(spdlog::level::warn, location, "{}", message);
}

inline void log_error(
    const std::string& message,
    const std::source_location& location = std::source_location::current()) {
  Logger::getInstance().log(spdlog::level::err, location, "{}", message);
}

// Prefixes every message with a component name, e.g. "Query: ...".
class ContextLogger {
 public:
  explicit ContextLogger(std::string prefix) : prefix_(std::move(prefix)) {}

  template <typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) const {
    if (!spdlog::should_log(spdlog::level::debug)) return;
    log_debug(prefix_ + ": " +
              spdlog::fmt_lib::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) const {
    log_info(prefix_ + ": " +
             spdlog::fmt_lib::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) const {
    log_warn(prefix_ + ": " +
             spdlog::fmt_lib::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) const {
    log_error(prefix_ + ": " +
              spdlog::fmt_lib::format(fmt, std::forward<Args>(args)...));
  }

  [[nodiscard]] const std::string& prefix() const { return prefix_; }

 private:
  std::string prefix_;
};

}  // namespace sparqlkit

#endif  // LOGGER_HPP

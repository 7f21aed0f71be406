#ifndef STATEMENTS_OBSERVABILITY_LOGGER_HPP_
#define STATEMENTS_OBSERVABILITY_LOGGER_HPP_

#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace statements {
namespace observability {

/**
 * Log levels for structured logging.
 */
enum class LogLevel {
  DEBUG,
  INFO,
  WARN,
  ERROR,
  FATAL
};

// Case-insensitive "debug", "info", "warn", "error" or "fatal".
std::optional<LogLevel> parseLogLevel(std::string_view name);

/**
 * Structured logger writing one JSON object per line.
 * Thread-safe and supports correlation IDs for tying records of one run
 * together.
 */
class Logger {
 public:
  static Logger& getInstance();

  // Non-copyable
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  // Set minimum log level
  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;

  // Set output stream (default: std::clog)
  void setOutputStream(std::ostream& stream);

  // Logging methods
  void debug(const std::string& message,
             const std::string& component = "",
             const std::string& correlation_id = "");

  void info(const std::string& message,
            const std::string& component = "",
            const std::string& correlation_id = "");

  void warn(const std::string& message,
            const std::string& component = "",
            const std::string& correlation_id = "");

  void error(const std::string& message,
             const std::string& component = "",
             const std::string& correlation_id = "");

  void fatal(const std::string& message,
             const std::string& component = "",
             const std::string& correlation_id = "");

  // Structured logging with key-value pairs, emitted on destruction.
  class LogBuilder {
   public:
    LogBuilder(LogLevel level, const std::string& message,
               const std::string& component = "",
               const std::string& correlation_id = "");

    ~LogBuilder();

    LogBuilder& field(const std::string& key, const std::string& value);
    LogBuilder& field(const std::string& key, const char* value);
    LogBuilder& field(const std::string& key, int value);
    LogBuilder& field(const std::string& key, size_t value);
    LogBuilder& field(const std::string& key, double value);
    LogBuilder& field(const std::string& key, bool value);

   private:
    LogLevel level_;
    std::string message_;
    std::string component_;
    std::string correlation_id_;
    nlohmann::json fields_ = nlohmann::json::object();
  };

 private:
  Logger();
  ~Logger() = default;

  void log(LogLevel level, const std::string& message,
           const std::string& component,
           const std::string& correlation_id,
           const nlohmann::json& fields = nlohmann::json::object());

  std::string levelToString(LogLevel level) const;
  std::string getCurrentTimestamp() const;
  std::string getThreadId() const;

  LogLevel min_level_;
  std::ostream* output_stream_;
  mutable std::mutex mutex_;
};

// Convenience macros for logging
#define STATEMENTS_LOG_DEBUG(msg) statements::observability::Logger::getInstance().debug(msg, __func__)
#define STATEMENTS_LOG_INFO(msg) statements::observability::Logger::getInstance().info(msg, __func__)
#define STATEMENTS_LOG_WARN(msg) statements::observability::Logger::getInstance().warn(msg, __func__)
#define STATEMENTS_LOG_ERROR(msg) statements::observability::Logger::getInstance().error(msg, __func__)
#define STATEMENTS_LOG_FATAL(msg) statements::observability::Logger::getInstance().fatal(msg, __func__)

// Structured logging helper
#define STATEMENTS_LOG_BUILDER(level, msg) \
  statements::observability::Logger::LogBuilder(level, msg, __func__)

}  // namespace observability
}  // namespace statements

#endif  // STATEMENTS_OBSERVABILITY_LOGGER_HPP_

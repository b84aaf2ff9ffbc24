#ifndef LOGGER_HPP_
#define LOGGER_HPP_

#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>

namespace statement_recon {
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

/**
 * Structured logger writing one JSON object per line.
 * Thread-safe; every entry may carry a correlation id so that all lines of one
 * ingestion session can be grouped.
 */
class Logger {
 public:
  static Logger& getInstance();

  // Non-copyable
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;

  // Set output stream (default: std::cout)
  void setOutputStream(std::ostream& stream);

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

  // Structured logging with key-value pairs, emitted when the builder goes out of scope
  class LogBuilder {
   public:
    LogBuilder(LogLevel level, const std::string& message,
               const std::string& component = "",
               const std::string& correlation_id = "");

    ~LogBuilder();

    LogBuilder& field(const std::string& key, const std::string& value);
    LogBuilder& field(const std::string& key, const char* value);
    LogBuilder& field(const std::string& key, int value);
    LogBuilder& field(const std::string& key, long long value);
    LogBuilder& field(const std::string& key, size_t value);
    LogBuilder& field(const std::string& key, double value);
    LogBuilder& field(const std::string& key, bool value);

   private:
    LogLevel level_;
    std::string message_;
    std::string component_;
    std::string correlation_id_;
    std::unordered_map<std::string, std::string> fields_;
  };

  static std::string levelToString(LogLevel level);

 private:
  Logger();
  ~Logger() = default;

  void log(LogLevel level, const std::string& message,
           const std::string& component,
           const std::string& correlation_id,
           const std::unordered_map<std::string, std::string>& fields = {});

  static std::string escape(const std::string& raw);
  std::string getCurrentTimestamp() const;
  std::string getThreadId() const;

  LogLevel min_level_;
  std::ostream* output_stream_;
  mutable std::mutex mutex_;
};

#define RECON_LOG_DEBUG(msg, component) \
  statement_recon::observability::Logger::getInstance().debug(msg, component)
#define RECON_LOG_INFO(msg, component) \
  statement_recon::observability::Logger::getInstance().info(msg, component)
#define RECON_LOG_WARN(msg, component) \
  statement_recon::observability::Logger::getInstance().warn(msg, component)
#define RECON_LOG_ERROR(msg, component) \
  statement_recon::observability::Logger::getInstance().error(msg, component)

// Structured logging helper
#define RECON_LOG_BUILDER(level, msg, component, correlation_id) \
  statement_recon::observability::Logger::LogBuilder(level, msg, component, correlation_id)

}  // namespace observability
}  // namespace statement_recon

#endif  // LOGGER_HPP_

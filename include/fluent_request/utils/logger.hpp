#pragma once

#include <chrono>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace fluent_request::utils {

enum class LogLevel {
  Debug,
  Info,
  Warning,
  Error,
  None
};

struct SourceLocation {
  const char* file = "unknown";
  int line = 0;
};

struct LogRecord {
  LogLevel level;
  std::chrono::system_clock::time_point time;
  std::string component;
  std::string text;
  SourceLocation where;
};

class LogSink {
 public:
  virtual ~LogSink() = default;
  virtual void write(const LogRecord& record) = 0;
};

// Drops records below the minimum level and fans the rest out to its sinks
class Logger {
 public:
  explicit Logger(LogLevel min_level = LogLevel::Info);

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void set_level(LogLevel level);
  [[nodiscard]] LogLevel level() const;
  void add_sink(std::unique_ptr<LogSink> sink);

  void log(LogLevel level, std::string_view component, std::string_view text,
           SourceLocation where = {});

 private:
  LogLevel m_min_level;
  std::vector<std::unique_ptr<LogSink>> m_sinks;
  mutable std::mutex m_mutex;
};

// One line per record: "[HH:MM:SS.mmm] [LEVEL] [component] text"
class ConsoleSink : public LogSink {
 public:
  // stderr, colored when it is a terminal
  ConsoleSink();
  // Any stream, never colored
  explicit ConsoleSink(std::ostream& out);

  void write(const LogRecord& record) override;

 private:
  std::ostream& m_out;
  bool m_colored;
};

class LoggerManager {
 public:
  static Logger& get_instance();
  static void set_instance(std::unique_ptr<Logger> logger);
  static std::unique_ptr<Logger> create_default_logger();

 private:
  static std::unique_ptr<Logger> s_logger;
  static std::mutex s_mutex;
};

std::string to_string(LogLevel level);

// Unknown names map to Info
LogLevel log_level_from_string(std::string_view name);

}  // namespace fluent_request::utils

#define FR_LOG(level, component, message)                       \
  fluent_request::utils::LoggerManager::get_instance().log(     \
      level, component, message,                                \
      fluent_request::utils::SourceLocation{__FILE__, __LINE__})

#define FR_LOG_DEBUG(component, message) \
  FR_LOG(fluent_request::utils::LogLevel::Debug, component, message)
#define FR_LOG_INFO(component, message) \
  FR_LOG(fluent_request::utils::LogLevel::Info, component, message)
#define FR_LOG_WARNING(component, message) \
  FR_LOG(fluent_request::utils::LogLevel::Warning, component, message)
#define FR_LOG_ERROR(component, message) \
  FR_LOG(fluent_request::utils::LogLevel::Error, component, message)

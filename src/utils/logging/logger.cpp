#include "fluent_request/utils/logger.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>

#include <unistd.h>

namespace fluent_request {
namespace utils {

namespace {
    std::string_view tag(LogLevel level) {
        switch (level) {
            case LogLevel::Debug: return "DEBUG";
            case LogLevel::Info: return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error: return "ERROR";
            default: return "?";
        }
    }

    std::string_view color(LogLevel level) {
        switch (level) {
            case LogLevel::Debug: return "\033[36m";
            case LogLevel::Info: return "\033[32m";
            case LogLevel::Warning: return "\033[33m";
            case LogLevel::Error: return "\033[31m";
            default: return {};
        }
    }

    void write_clock(std::ostream& out, std::chrono::system_clock::time_point time) {
        const auto seconds = std::chrono::system_clock::to_time_t(time);
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            time.time_since_epoch()).count() % 1000;
        std::tm local{};
        localtime_r(&seconds, &local);
        out << std::put_time(&local, "%H:%M:%S") << '.'
            << std::setfill('0') << std::setw(3) << millis;
    }
}

Logger::Logger(LogLevel min_level) : m_min_level(min_level) {}

void Logger::set_level(LogLevel level) {
    std::lock_guard lock(m_mutex);
    m_min_level = level;
}

LogLevel Logger::level() const {
    std::lock_guard lock(m_mutex);
    return m_min_level;
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard lock(m_mutex);
    m_sinks.push_back(std::move(sink));
}

void Logger::log(LogLevel level, std::string_view component, std::string_view text,
                 SourceLocation where) {
    std::lock_guard lock(m_mutex);
    if (level == LogLevel::None || level < m_min_level || m_sinks.empty()) {
        return;
    }

    const LogRecord record{level, std::chrono::system_clock::now(),
                           std::string(component), std::string(text), where};
    for (const auto& sink : m_sinks) {
        sink->write(record);
    }
}

ConsoleSink::ConsoleSink() : m_out(std::cerr), m_colored(isatty(STDERR_FILENO) != 0) {}

ConsoleSink::ConsoleSink(std::ostream& out) : m_out(out), m_colored(false) {}

void ConsoleSink::write(const LogRecord& record) {
    if (m_colored) {
        m_out << color(record.level);
    }
    m_out << '[';
    write_clock(m_out, record.time);
    m_out << "] [" << tag(record.level) << "] [" << record.component << "] " << record.text;
    if (m_colored) {
        m_out << "\033[0m";
    }
    m_out << '\n';
}

std::unique_ptr<Logger> LoggerManager::s_logger;
std::mutex LoggerManager::s_mutex;

Logger& LoggerManager::get_instance() {
    std::lock_guard lock(s_mutex);
    if (!s_logger) {
        s_logger = create_default_logger();
    }
    return *s_logger;
}

void LoggerManager::set_instance(std::unique_ptr<Logger> logger) {
    std::lock_guard lock(s_mutex);
    s_logger = std::move(logger);
}

std::unique_ptr<Logger> LoggerManager::create_default_logger() {
    auto logger = std::make_unique<Logger>(LogLevel::Info);
    logger->add_sink(std::make_unique<ConsoleSink>());
    return logger;
}

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
        case LogLevel::None: return "none";
        default: return "info";
    }
}

LogLevel log_level_from_string(std::string_view name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "warning" || name == "warn") return LogLevel::Warning;
    if (name == "error") return LogLevel::Error;
    if (name == "none") return LogLevel::None;
    return LogLevel::Info;
}

} // namespace utils
} // namespace fluent_request

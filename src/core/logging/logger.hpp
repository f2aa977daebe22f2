#pragma once
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <optional>
#include <string>
#include <mutex>

namespace wrapmcp::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::optional<LogLevel> parse_level(const std::string& text) {
        if (text == "debug" || text == "trace") return LogLevel::DEBUG;
        if (text == "info") return LogLevel::INFO;
        if (text == "warn" || text == "warning") return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        return std::nullopt;
    }

    // 2. Global Logger Setup
    // Writes to stderr: stdout carries the upstream protocol.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            level_ = level;
        }

        void set_colors(bool enabled) {
            std::lock_guard<std::mutex> lock(mutex_);
            colors_ = enabled;
        }

        bool enabled(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            return static_cast<int>(level) >= static_cast<int>(level_);
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_); // Thread safety!
            if (static_cast<int>(level) < static_cast<int>(level_)) {
                return;
            }

            std::cerr << timestamp() << " "
                      << (colors_ ? level_color(level) : "")
                      << "[" << level_to_string(level) << "]"
                      << (colors_ ? "\033[0m" : "") << " "
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        LogLevel level_ = LogLevel::INFO;
        bool colors_ = false;

        static std::string timestamp() {
            const auto now = std::chrono::system_clock::now();
            const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
            const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                                    now.time_since_epoch()).count() % 1000;
            std::tm tm{};
            gmtime_r(&seconds, &tm);
            char buffer[32];
            std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &tm);
            char full[40];
            std::snprintf(full, sizeof(full), "%s.%03dZ", buffer, static_cast<int>(millis));
            return full;
        }

        static std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }

        static const char* level_color(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "\033[34m";
                case LogLevel::INFO:  return "\033[32m";
                case LogLevel::WARN:  return "\033[33m";
                case LogLevel::ERROR: return "\033[31m";
                default: return "";
            }
        }
    };

    // 3. Helper macros; the message is only built when the level is enabled
    #define WRAPMCP_LOG_AT(level, msg)                                              \
        do {                                                                        \
            if (wrapmcp::core::logging::Logger::get().enabled(level)) {             \
                wrapmcp::core::logging::Logger::get().log(level, msg);              \
            }                                                                       \
        } while (0)

    #define LOG_DEBUG(msg) WRAPMCP_LOG_AT(wrapmcp::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  WRAPMCP_LOG_AT(wrapmcp::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  WRAPMCP_LOG_AT(wrapmcp::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) WRAPMCP_LOG_AT(wrapmcp::core::logging::LogLevel::ERROR, msg)

} // namespace wrapmcp::core::logging

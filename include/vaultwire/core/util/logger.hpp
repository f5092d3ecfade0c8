/**
 * @file logger.hpp
 * @brief Logging utilities for VaultWire.
 *
 * Provides a singleton Logger class and logging macros for different log levels.
 * The default sink prints a wall-clock timestamp; warnings and errors go to stderr.
 */
#pragma once
#include <string>
#include <string_view>
#include <functional>
#include <mutex>
#include <chrono>
#include <ctime>
#include <iostream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <optional>

namespace vaultwire {

    /**
     * @enum LogLevel
     * @brief Log levels for the logger.
     */
    enum class LogLevel { Trace, Debug, Info, Warn, Error, Off };

    /**
     * @brief Parse a level name ("trace", "DEBUG", "warn", ...) case-insensitively.
     * @param name Level name from configuration
     * @return Matching LogLevel, or std::nullopt for an unknown name
     */
    inline std::optional<LogLevel> parseLogLevel(std::string_view name) {
        std::string lower(name);
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "trace") return LogLevel::Trace;
        if (lower == "debug") return LogLevel::Debug;
        if (lower == "info")  return LogLevel::Info;
        if (lower == "warn" || lower == "warning") return LogLevel::Warn;
        if (lower == "error") return LogLevel::Error;
        if (lower == "off")   return LogLevel::Off;
        return std::nullopt;
    }

    /**
     * @class Logger
     * @brief Singleton logger class for VaultWire.
     *
     * Provides thread-safe logging with customizable log sinks and log levels.
     */
    class Logger {
    public:
        using Sink = std::function<void(LogLevel, const std::string&)>;

        /**
         * @brief Get the singleton Logger instance.
         * @return Reference to the Logger instance
         */
        static Logger& inst() {
            static Logger L;  return L;
        }

        /**
         * @brief Set the minimum log level.
         * @param lvl LogLevel to set
         */
        void setLevel(LogLevel lvl) {
            std::scoped_lock lk(m_);
            level_ = lvl;
        }

        LogLevel level() const {
            std::scoped_lock lk(m_);
            return level_;
        }

        /**
         * @brief Set a custom log sink function. Passing an empty function restores the default sink.
         * @param s Sink function to use
         */
        void setSink(Sink s) {
            std::scoped_lock lk(m_);
            sink_ = s ? std::move(s) : defaultSink();
        }

        /**
         * @brief Log a message at the specified log level.
         * @param lvl LogLevel for the message
         * @param msg Message to log
         */
        void log(LogLevel lvl, const std::string& msg) {
            std::scoped_lock lk(m_);
            if (lvl < level_ || lvl == LogLevel::Off) return;
            sink_(lvl, msg);
        }

        static const char* levelName(LogLevel l) {
            static const char* names[]{ "TRACE","DEBUG","INFO","WARN","ERROR","OFF" };
            return names[static_cast<int>(l)];
        }

    private:
        Logger() : sink_(defaultSink()) {}

        static Sink defaultSink() {
            return [](LogLevel l, const std::string& m) {
                const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
                std::tm tm{};
#ifdef _WIN32
                localtime_s(&tm, &now);
#else
                localtime_r(&now, &tm);
#endif
                std::ostream& os = l >= LogLevel::Warn ? std::cerr : std::cout;
                os << std::put_time(&tm, "%H:%M:%S") << " [" << levelName(l) << "] " << m << '\n';
            };
        }

        mutable std::mutex m_;
        LogLevel   level_{ LogLevel::Info };
        Sink       sink_;
    };

#define LOG_TRACE(msg) ::vaultwire::Logger::inst().log(::vaultwire::LogLevel::Trace, msg)
#define LOG_DEBUG(msg) ::vaultwire::Logger::inst().log(::vaultwire::LogLevel::Debug, msg)
#define LOG_INFO(msg)  ::vaultwire::Logger::inst().log(::vaultwire::LogLevel::Info,  msg)
#define LOG_WARN(msg)  ::vaultwire::Logger::inst().log(::vaultwire::LogLevel::Warn,  msg)
#define LOG_ERROR(msg) ::vaultwire::Logger::inst().log(::vaultwire::LogLevel::Error, msg)
}

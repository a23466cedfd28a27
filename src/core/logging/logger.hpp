#pragma once
#include <iostream>
#include <string>
#include <mutex>
#include "core/config/timestamp.hpp"

namespace a2a::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger Setup
    // Timestamped lines on std::clog: stdout carries protocol traffic.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_session_tag(const std::string& tag) {
            std::lock_guard<std::mutex> lock(mutex_);
            session_tag_ = tag;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        LogLevel min_level() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return min_level_;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::clog << a2a::core::config::now_iso8601() << " "
                      << "[" << level_to_string(level) << "] "
                      << (session_tag_.empty() ? "" : "[" + session_tag_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string session_tag_;
        LogLevel min_level_ = LogLevel::INFO;

        static const char* level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    // 3. Helper macros for clean syntax everywhere else in the code
    #define A2A_LOG_DEBUG(msg) a2a::core::logging::Logger::get().log(a2a::core::logging::LogLevel::DEBUG, msg)
    #define A2A_LOG_INFO(msg)  a2a::core::logging::Logger::get().log(a2a::core::logging::LogLevel::INFO, msg)
    #define A2A_LOG_WARN(msg)  a2a::core::logging::Logger::get().log(a2a::core::logging::LogLevel::WARN, msg)
    #define A2A_LOG_ERROR(msg) a2a::core::logging::Logger::get().log(a2a::core::logging::LogLevel::ERROR, msg)

} // namespace a2a::core::logging

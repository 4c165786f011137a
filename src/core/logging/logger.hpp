#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace continuity::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger Setup
    // stdout carries protocol frames, so every diagnostic goes to stderr.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_session_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            session_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        void set_sink(std::ostream& sink) {
            std::lock_guard<std::mutex> lock(mutex_);
            sink_ = &sink;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            *sink_ << "[" << level_to_string(level) << "] "
                   << (session_id_.empty() ? "" : "[" + session_id_ + "] ")
                   << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string session_id_;
        LogLevel min_level_ = LogLevel::INFO;
        std::ostream* sink_ = &std::cerr;

        std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    // 3. Helper macros used everywhere else in the code
    #define LOG_DEBUG(msg) continuity::core::logging::Logger::get().log(continuity::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  continuity::core::logging::Logger::get().log(continuity::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  continuity::core::logging::Logger::get().log(continuity::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) continuity::core::logging::Logger::get().log(continuity::core::logging::LogLevel::ERROR, msg)

} // namespace continuity::core::logging

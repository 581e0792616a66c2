#pragma once
#include <iostream>
#include <mutex>
#include <string>

namespace hearth::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // One logger for the whole process. Lines go to stderr; stdout carries
    // the machine-readable event stream.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_request_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            request_id_ = id;
        }

        void set_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        LogLevel level() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return min_level_;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }
            std::cerr << "[" << level_to_string(level) << "] "
                      << (request_id_.empty() ? "" : "[" + request_id_ + "] ")
                      << message << std::endl;
        }

        static bool parse_level(const std::string& text, LogLevel& out) {
            if (text == "debug") { out = LogLevel::DEBUG; return true; }
            if (text == "info")  { out = LogLevel::INFO;  return true; }
            if (text == "warn")  { out = LogLevel::WARN;  return true; }
            if (text == "error") { out = LogLevel::ERROR; return true; }
            return false;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string request_id_;
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

    #define HEARTH_LOG_DEBUG(msg) hearth::core::logging::Logger::get().log(hearth::core::logging::LogLevel::DEBUG, msg)
    #define HEARTH_LOG_INFO(msg)  hearth::core::logging::Logger::get().log(hearth::core::logging::LogLevel::INFO, msg)
    #define HEARTH_LOG_WARN(msg)  hearth::core::logging::Logger::get().log(hearth::core::logging::LogLevel::WARN, msg)
    #define HEARTH_LOG_ERROR(msg) hearth::core::logging::Logger::get().log(hearth::core::logging::LogLevel::ERROR, msg)

} // namespace hearth::core::logging

#pragma once
#include <iostream>
#include <mutex>
#include <optional>
#include <string>

namespace toolpilot::core::logging {

    // 1. Log levels, ordered by severity
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::optional<LogLevel> parse_level(const std::string& text) {
        if (text == "debug" || text == "DEBUG") return LogLevel::DEBUG;
        if (text == "info" || text == "INFO")   return LogLevel::INFO;
        if (text == "warn" || text == "WARN")   return LogLevel::WARN;
        if (text == "error" || text == "ERROR") return LogLevel::ERROR;
        return std::nullopt;
    }

    // 2. Global logger. Writes to stderr; stdout belongs to the model's answer
    // and to mirrored child process output.
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

        LogLevel min_level() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return min_level_;
        }

        // Tests point this at a stringstream
        void set_sink(std::ostream* sink) {
            std::lock_guard<std::mutex> lock(mutex_);
            sink_ = sink != nullptr ? sink : &std::cerr;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }

            *sink_ << "[" << level_to_string(level) << "] "
                   << (session_id_.empty() ? "" : "[" + session_id_ + "] ")
                   << message << std::endl;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string session_id_;
        LogLevel min_level_ = LogLevel::INFO;
        std::ostream* sink_ = &std::cerr;

        static std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    // 3. Helper macros
    #define LOG_DEBUG(msg) toolpilot::core::logging::Logger::get().log(toolpilot::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  toolpilot::core::logging::Logger::get().log(toolpilot::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  toolpilot::core::logging::Logger::get().log(toolpilot::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) toolpilot::core::logging::Logger::get().log(toolpilot::core::logging::LogLevel::ERROR, msg)

} // namespace toolpilot::core::logging

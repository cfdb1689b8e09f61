#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace ael::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // Process-wide logger; every line carries the level and the current run id.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_run_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            run_id_ = id;
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

            // Diagnostics only; stdout carries the command's own output.
            std::cerr << "[" << level_to_string(level) << "] "
                << (run_id_.empty() ? "" : "[" + run_id_ + "] ")
                << message << std::endl;
        }

        static bool parse_level(const std::string& text, LogLevel& level) {
            if (text == "debug") { level = LogLevel::DEBUG; return true; }
            if (text == "info")  { level = LogLevel::INFO;  return true; }
            if (text == "warn")  { level = LogLevel::WARN;  return true; }
            if (text == "error") { level = LogLevel::ERROR; return true; }
            return false;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string run_id_;
        LogLevel min_level_ = LogLevel::INFO;

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

    #define AEL_LOG_DEBUG(msg) ael::core::logging::Logger::get().log(ael::core::logging::LogLevel::DEBUG, msg)
    #define AEL_LOG_INFO(msg)  ael::core::logging::Logger::get().log(ael::core::logging::LogLevel::INFO, msg)
    #define AEL_LOG_WARN(msg)  ael::core::logging::Logger::get().log(ael::core::logging::LogLevel::WARN, msg)
    #define AEL_LOG_ERROR(msg) ael::core::logging::Logger::get().log(ael::core::logging::LogLevel::ERROR, msg)

} // namespace ael::core::logging

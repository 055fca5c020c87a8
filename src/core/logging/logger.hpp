#pragma once
#include <atomic>
#include <iostream>
#include <string>
#include <mutex>

namespace runner::core::logging {

    // 1. Log levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global logger
    class Logger {
    public:
        // Singleton access so the whole server shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        // Binds a request id to the calling thread. Each HTTP worker thread
        // handles one request at a time, so lines stay attributable.
        void set_request_id(const std::string& id) {
            current_request_id() = id;
        }

        void clear_request_id() {
            current_request_id().clear();
        }

        void set_min_level(LogLevel level) {
            min_level_.store(level);
        }

        void log(LogLevel level, const std::string& message) {
            if (level < min_level_.load()) {
                return;
            }
            const std::string& request_id = current_request_id();

            std::lock_guard<std::mutex> lock(mutex_);
            std::cout << "[" << level_to_string(level) << "] "
                      << (request_id.empty() ? "" : "[" + request_id + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::atomic<LogLevel> min_level_{LogLevel::INFO};

        static std::string& current_request_id() {
            thread_local std::string request_id;
            return request_id;
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
    };

    // 3. Helper macros used everywhere else in the code
    #define LOG_DEBUG(msg) runner::core::logging::Logger::get().log(runner::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  runner::core::logging::Logger::get().log(runner::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  runner::core::logging::Logger::get().log(runner::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) runner::core::logging::Logger::get().log(runner::core::logging::LogLevel::ERROR, msg)

} // namespace runner::core::logging

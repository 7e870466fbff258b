#pragma once
#include <chrono>
#include <ctime>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>

namespace facetmcp::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::optional<LogLevel> parse_log_level(const std::string& text) {
        if (text == "DEBUG" || text == "debug") return LogLevel::DEBUG;
        if (text == "INFO" || text == "info") return LogLevel::INFO;
        if (text == "WARN" || text == "warn" || text == "WARNING" || text == "warning") return LogLevel::WARN;
        if (text == "ERROR" || text == "error") return LogLevel::ERROR;
        return std::nullopt;
    }

    // One logger for the whole process. Connection threads log concurrently,
    // so every write happens under the mutex.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_instance_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            instance_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }

            std::cerr << timestamp() << " [" << level_to_string(level) << "] "
                      << (instance_id_.empty() ? "" : "[" + instance_id_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string instance_id_;
        LogLevel min_level_ = LogLevel::INFO;

        static std::string timestamp() {
            const std::time_t now =
                std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm utc{};
            gmtime_r(&now, &utc);
            char buffer[32];
            const std::size_t n = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
            return std::string(buffer, n);
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

    #define LOG_DEBUG(msg) facetmcp::core::logging::Logger::get().log(facetmcp::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  facetmcp::core::logging::Logger::get().log(facetmcp::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  facetmcp::core::logging::Logger::get().log(facetmcp::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) facetmcp::core::logging::Logger::get().log(facetmcp::core::logging::LogLevel::ERROR, msg)

} // namespace facetmcp::core::logging

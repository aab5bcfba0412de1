#pragma once
#include <iostream>
#include <optional>
#include <string>
#include <mutex>

namespace cidispatch::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::optional<LogLevel> parse_log_level(const std::string& text) {
        if (text == "debug") return LogLevel::DEBUG;
        if (text == "info")  return LogLevel::INFO;
        if (text == "warn")  return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        return std::nullopt;
    }

    // Process-wide logger. Writes to stderr because stdout carries the
    // JSON-RPC stream.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        // Request tag for the calling thread; empty clears it.
        static void set_request_id(const std::string& id) {
            request_id() = id;
        }

        static const std::string& current_request_id() {
            return request_id();
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            const std::string& tag = request_id();
            std::cerr << "[" << level_to_string(level) << "] "
                      << (tag.empty() ? "" : "[" + tag + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        LogLevel min_level_ = LogLevel::INFO;

        static std::string& request_id() {
            thread_local std::string id;
            return id;
        }

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

    // Tags every log line written by this thread until it goes out of scope.
    class ScopedRequestTag {
    public:
        explicit ScopedRequestTag(const std::string& id)
            : previous_(Logger::current_request_id()) {
            Logger::set_request_id(id);
        }
        ~ScopedRequestTag() { Logger::set_request_id(previous_); }

        ScopedRequestTag(const ScopedRequestTag&) = delete;
        ScopedRequestTag& operator=(const ScopedRequestTag&) = delete;

    private:
        std::string previous_;
    };

    #define LOG_DEBUG(msg) cidispatch::core::logging::Logger::get().log(cidispatch::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  cidispatch::core::logging::Logger::get().log(cidispatch::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  cidispatch::core::logging::Logger::get().log(cidispatch::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) cidispatch::core::logging::Logger::get().log(cidispatch::core::logging::LogLevel::ERROR, msg)

} // namespace cidispatch::core::logging

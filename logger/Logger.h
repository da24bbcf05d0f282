// Logger.h
#ifndef RKC_LOGGER_H
#define RKC_LOGGER_H
#pragma once

#include <iostream>
#include <string>
#include <mutex>
#include <vector>
#include <chrono>
#include <iomanip>
#include <cstdio>
#include <ctime>
#include <cctype>
#include <utility>   // std::forward

namespace RKC {

enum class LogLevel { Debug, Info, Warning, Error, Critical, None };

/**
 * @brief Parses a level name ("debug", "info", "warn", "warning", "error", "critical", "none").
 * Matching is case-insensitive. Unknown names yield @p fallback.
 */
[[nodiscard]] inline LogLevel logLevelFromString(const std::string& name, LogLevel fallback = LogLevel::Info) {
    std::string lowered;
    lowered.reserve(name.size());
    for (char c : name) lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if (lowered == "debug")                        return LogLevel::Debug;
    if (lowered == "info")                         return LogLevel::Info;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warning;
    if (lowered == "error")                        return LogLevel::Error;
    if (lowered == "critical")                     return LogLevel::Critical;
    if (lowered == "none" || lowered == "off")     return LogLevel::None;
    return fallback;
}

class Logger {
public:
    static void setLogLevel(LogLevel level) {
        Logger& instance = get();
        std::lock_guard<std::mutex> lock(instance.log_mutex_);
        instance.current_level_ = level;
    }

    [[nodiscard]] static LogLevel getLogLevel() {
        Logger& instance = get();
        std::lock_guard<std::mutex> lock(instance.log_mutex_);
        return instance.current_level_;
    }

    /// Redirects all output. Passing nullptr restores std::cout.
    static void setOutputStream(std::ostream* stream) {
        Logger& instance = get();
        std::lock_guard<std::mutex> lock(instance.log_mutex_);
        instance.out_ = stream ? stream : &std::cout;
    }

    static void log(LogLevel level, const std::string& module, const std::string& message) {
        Logger& instance = get();
        std::lock_guard<std::mutex> lock(instance.log_mutex_);
        if (!instance.isEnabled(level)) return;

        auto now = std::chrono::system_clock::now();
        auto t   = std::chrono::system_clock::to_time_t(now);
        auto ms  = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&t, &tm_buf);

        std::ostream& out = *instance.out_;
        out << '[' << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count() << std::setfill(' ') << ']';

        switch (level) {
            case LogLevel::Debug:    out << "[DBG]"; break;
            case LogLevel::Info:     out << "[INF]"; break;
            case LogLevel::Warning:  out << "[WRN]"; break;
            case LogLevel::Error:    out << "[ERR]"; break;
            case LogLevel::Critical: out << "[CRT]"; break;
            case LogLevel::None:     break;
        }
        out << '[' << module << "] " << message << std::endl;
    }

    // printf-style logging; the message is only formatted when the level is enabled
    template <typename... Args>
    static void log_f(LogLevel level, const std::string& module, const char* fmt, Args&&... args) {
        if (!isLevelEnabled(level)) return;

        if constexpr (sizeof...(Args) == 0) {
            log(level, module, std::string{fmt ? fmt : ""});
        } else {
            int needed = std::snprintf(nullptr, 0, fmt, std::forward<Args>(args)...);
            if (needed < 0) {
                log(LogLevel::Error, "Logger", "formatting error in log_f");
                return;
            }
            std::vector<char> buf(static_cast<size_t>(needed) + 1);
            std::snprintf(buf.data(), buf.size(), fmt, std::forward<Args>(args)...);
            log(level, module, std::string(buf.data(), static_cast<size_t>(needed)));
        }
    }

    [[nodiscard]] static bool isLevelEnabled(LogLevel level) {
        Logger& instance = get();
        std::lock_guard<std::mutex> lock(instance.log_mutex_);
        return instance.isEnabled(level);
    }

private:
    Logger() = default; ~Logger() = default;
    Logger(const Logger&) = delete; Logger& operator=(const Logger&) = delete;

    static Logger& get() {
        static Logger instance; return instance;
    }

    // Caller holds log_mutex_.
    [[nodiscard]] bool isEnabled(LogLevel level) const {
        return level != LogLevel::None && current_level_ != LogLevel::None && level >= current_level_;
    }

    LogLevel      current_level_ = LogLevel::Info;
    std::ostream* out_ = &std::cout;
    std::mutex    log_mutex_;
};

// Convenience macros
#define LOG_DEBUG(module, message)     ::RKC::Logger::log(::RKC::LogLevel::Debug,    (module), (message))
#define LOG_INFO(module, message)      ::RKC::Logger::log(::RKC::LogLevel::Info,     (module), (message))
#define LOG_WARN(module, message)      ::RKC::Logger::log(::RKC::LogLevel::Warning,  (module), (message))
#define LOG_ERROR(module, message)     ::RKC::Logger::log(::RKC::LogLevel::Error,    (module), (message))
#define LOG_CRITICAL(module, message)  ::RKC::Logger::log(::RKC::LogLevel::Critical, (module), (message))

#define LOG_DEBUG_F(module, ...)       ::RKC::Logger::log_f(::RKC::LogLevel::Debug,    (module), __VA_ARGS__)
#define LOG_INFO_F(module, ...)        ::RKC::Logger::log_f(::RKC::LogLevel::Info,     (module), __VA_ARGS__)
#define LOG_WARN_F(module, ...)        ::RKC::Logger::log_f(::RKC::LogLevel::Warning,  (module), __VA_ARGS__)
#define LOG_ERROR_F(module, ...)       ::RKC::Logger::log_f(::RKC::LogLevel::Error,    (module), __VA_ARGS__)
#define LOG_CRITICAL_F(module, ...)    ::RKC::Logger::log_f(::RKC::LogLevel::Critical, (module), __VA_ARGS__)

} // namespace RKC
#endif // RKC_LOGGER_H

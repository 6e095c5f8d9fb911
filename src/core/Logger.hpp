#pragma once

/**
 * Logger.hpp
 *
 * Centralized logging system with multiple log levels and sinks.
 * Uses spdlog as the underlying logging library.
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <memory>
#include <string>
#include <vector>
#include <filesystem>

namespace botarr::core {

/**
 * Log level enumeration
 */
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/**
 * Logger class - Thread-safe singleton logger
 *
 * Provides formatted logging with multiple output sinks:
 * - Console output with colors
 * - Rotating file output (botarr.log)
 *
 * Until initialize() is called every log call is a no-op.
 */
class Logger {
public:
    /**
     * Get singleton instance
     * @return Reference to Logger instance
     */
    static Logger& instance() {
        static Logger instance;
        return instance;
    }

    /**
     * Initialize the logger
     * @param level Minimum log level
     * @param logDir Log file directory (optional)
     */
    void initialize(LogLevel level = LogLevel::Info,
                   const std::string& logDir = "") {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            consoleSink->set_level(toSpdlogLevel(level));
            consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
            sinks.push_back(consoleSink);

            std::filesystem::path logPath;
            if (logDir.empty()) {
                logPath = std::filesystem::current_path() / "logs" / "botarr.log";
            } else {
                logPath = std::filesystem::path(logDir) / "botarr.log";
            }

            std::filesystem::create_directories(logPath.parent_path());

            auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logPath.string(),
                1024 * 1024 * 10, // 10 MB
                5,                // 5 rotated files
                false
            );
            fileSink->set_level(spdlog::level::trace);
            fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(fileSink);

            m_logger = std::make_shared<spdlog::logger>("botarr", sinks.begin(), sinks.end());
            m_logger->set_level(toSpdlogLevel(level));
            m_logger->flush_on(spdlog::level::warn);

            spdlog::set_default_logger(m_logger);
            spdlog::flush_every(std::chrono::seconds(3));

        } catch (const spdlog::spdlog_ex& ex) {
            // Fallback to console only
            m_logger = spdlog::stderr_color_mt("botarr_fallback");
            m_logger->set_level(toSpdlogLevel(level));
            m_logger->error("Logger initialization failed: {}", ex.what());
        } catch (const std::filesystem::filesystem_error& ex) {
            m_logger = spdlog::stderr_color_mt("botarr_fallback");
            m_logger->set_level(toSpdlogLevel(level));
            m_logger->error("Cannot create log directory: {}", ex.what());
        }
    }

    /**
     * Set log level
     * @param level New log level
     */
    void setLevel(LogLevel level) {
        if (m_logger) {
            m_logger->set_level(toSpdlogLevel(level));
        }
    }

    void flush() {
        if (m_logger) {
            m_logger->flush();
        }
    }

    /**
     * Parse a level name ("trace", "debug", "info", "warn", "error",
     * "critical", "off"); unknown names map to Info.
     */
    static LogLevel parseLevel(const std::string& name) {
        if (name == "trace") return LogLevel::Trace;
        if (name == "debug") return LogLevel::Debug;
        if (name == "warn" || name == "warning") return LogLevel::Warn;
        if (name == "error") return LogLevel::Error;
        if (name == "critical") return LogLevel::Critical;
        if (name == "off") return LogLevel::Off;
        return LogLevel::Info;
    }

    template<typename... Args>
    void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->trace(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->error(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->critical(fmt, std::forward<Args>(args)...);
        }
    }

private:
    Logger() = default;
    ~Logger() {
        if (m_logger) {
            m_logger->flush();
        }
        spdlog::shutdown();
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:    return spdlog::level::trace;
            case LogLevel::Debug:    return spdlog::level::debug;
            case LogLevel::Info:     return spdlog::level::info;
            case LogLevel::Warn:     return spdlog::level::warn;
            case LogLevel::Error:    return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off:      return spdlog::level::off;
            default:                 return spdlog::level::info;
        }
    }

private:
    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace botarr::core

// Convenience macros
#define LOG_TRACE(...)    botarr::core::Logger::instance().trace(__VA_ARGS__)
#define LOG_DEBUG(...)    botarr::core::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...)     botarr::core::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...)     botarr::core::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...)    botarr::core::Logger::instance().error(__VA_ARGS__)
#define LOG_CRITICAL(...) botarr::core::Logger::instance().critical(__VA_ARGS__)

#pragma once

/**
 * Logger.hpp
 *
 * Centralized logging system with multiple log levels and sinks.
 * Uses spdlog as the underlying logging library.
 *
 * Nothing is ever written to stdout: when gas runs as a Git credential
 * helper, stdout carries the protocol and any stray line breaks Git's parser.
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <memory>
#include <string>
#include <vector>
#include <filesystem>
#include <system_error>

namespace gas::core {

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
 * Logger sink options
 */
struct LoggerOptions {
    LogLevel consoleLevel{LogLevel::Warn};
    std::string logDir;                 // empty disables the file sink
    size_t maxFileSize{5 * 1024 * 1024};
    size_t maxFiles{3};
};

/**
 * Logger class - Thread-safe singleton logger
 *
 * Provides formatted logging with two output sinks:
 * - Console output with colors on stderr
 * - Rotating file output
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
     * @param options Sink levels and file location
     */
    void initialize(const LoggerOptions& options) {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            consoleSink->set_level(toSpdlogLevel(options.consoleLevel));
            consoleSink->set_pattern("gas: [%^%l%$] %v");
            sinks.push_back(consoleSink);

            // A log directory that cannot be created leaves console logging only
            std::string fileSinkError;
            if (!options.logDir.empty()) {
                auto logPath = std::filesystem::path(options.logDir) / "gas.log";
                std::error_code ec;
                std::filesystem::create_directories(logPath.parent_path(), ec);

                if (ec) {
                    fileSinkError = ec.message();
                } else {
                    try {
                        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                            logPath.string(),
                            options.maxFileSize,
                            options.maxFiles
                        );
                        fileSink->set_level(spdlog::level::debug);
                        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [pid %P] %v");
                        sinks.push_back(fileSink);
                    } catch (const spdlog::spdlog_ex& ex) {
                        fileSinkError = ex.what();
                    }
                }
            }

            m_logger = std::make_shared<spdlog::logger>("gas", sinks.begin(), sinks.end());
            m_logger->set_level(spdlog::level::trace);
            m_logger->flush_on(spdlog::level::warn);

            spdlog::set_default_logger(m_logger);

            if (!fileSinkError.empty()) {
                m_logger->debug("File logging disabled for {}: {}", options.logDir, fileSinkError);
            }

        } catch (const spdlog::spdlog_ex& ex) {
            // Fallback to basic console logging
            m_logger = spdlog::stderr_color_mt("gas_fallback");
            m_logger->error("Logger initialization failed: {}", ex.what());
        }
    }

    /**
     * Check whether a file sink is attached
     */
    bool hasFileSink() const {
        return m_logger && m_logger->sinks().size() > 1;
    }

    /**
     * Flush all log sinks
     */
    void flush() {
        if (m_logger) {
            m_logger->flush();
        }
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

    /**
     * Parse a level name from configuration
     * @param name Level name ("trace" ... "off")
     * @param fallback Level returned for unknown names
     * @return Parsed level
     */
    static LogLevel parseLevel(const std::string& name, LogLevel fallback = LogLevel::Warn) {
        if (name == "trace") return LogLevel::Trace;
        if (name == "debug") return LogLevel::Debug;
        if (name == "info") return LogLevel::Info;
        if (name == "warn" || name == "warning") return LogLevel::Warn;
        if (name == "error") return LogLevel::Error;
        if (name == "critical") return LogLevel::Critical;
        if (name == "off") return LogLevel::Off;
        return fallback;
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

    /**
     * Convert LogLevel to spdlog::level
     */
    static spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:    return spdlog::level::trace;
            case LogLevel::Debug:    return spdlog::level::debug;
            case LogLevel::Info:     return spdlog::level::info;
            case LogLevel::Warn:     return spdlog::level::warn;
            case LogLevel::Error:    return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off:      return spdlog::level::off;
            default:                 return spdlog::level::warn;
        }
    }

private:
    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace gas::core

// Convenience macros
#define LOG_TRACE(...)    gas::core::Logger::instance().trace(__VA_ARGS__)
#define LOG_DEBUG(...)    gas::core::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...)     gas::core::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...)     gas::core::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...)    gas::core::Logger::instance().error(__VA_ARGS__)
#define LOG_CRITICAL(...) gas::core::Logger::instance().critical(__VA_ARGS__)

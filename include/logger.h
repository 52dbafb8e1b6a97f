/**
 * @file logger.h
 * @brief Stream-style logging with severity levels
 */

#pragma once

#include <iostream>
#include <sstream>
#include <string>
#include <mutex>
#include <atomic>

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,    ///< Verbose debugging information (per-tick summaries, skipped units)
    INFO,     ///< General informational messages
    WARNING,  ///< Non-critical issues
    ERROR     ///< Errors (bad configuration, failed loads)
};

/**
 * @brief Returns the upper-case name of a level ("DEBUG", "INFO", ...)
 */
const char* logLevelName(LogLevel level);

/**
 * @brief Parses a level name (case-insensitive, "warn" accepted for WARNING)
 *
 * @param name Level name as written in a config file
 * @param out Receives the parsed level on success
 * @return True if the name was recognized
 */
bool parseLogLevel(const std::string& name, LogLevel& out);

/**
 * @brief Thread-safe logger with severity levels
 *
 * Usage:
 * @code
 * Logger::info() << "Frame budget set to " << budget << " chunks";
 * Logger::debug() << "Skipped chunk (" << c.x << ", " << c.y << ", " << c.z << ")";
 * Logger::error() << "Failed to load meshing config: " << path;
 * @endcode
 *
 * Meshing workers log from their own threads, so every message is written
 * under a single mutex and flushed as one line.
 */
class Logger {
public:
    /**
     * @brief Log stream that outputs when destroyed
     */
    class LogStream {
    public:
        explicit LogStream(LogLevel level)
            : m_level(level), m_enabled(Logger::isEnabled(level)) {}

        LogStream(LogStream&& other) noexcept
            : m_level(other.m_level), m_enabled(other.m_enabled), m_stream(std::move(other.m_stream)) {
            other.m_enabled = false;
        }

        LogStream(const LogStream&) = delete;
        LogStream& operator=(const LogStream&) = delete;

        ~LogStream() {
            if (m_enabled) {
                Logger::write(m_level, m_stream.str());
            }
        }

        template<typename T>
        LogStream& operator<<(const T& value) {
            if (m_enabled) {
                m_stream << value;
            }
            return *this;
        }

    private:
        LogLevel m_level;
        bool m_enabled;
        std::ostringstream m_stream;
    };

    static LogStream debug() { return LogStream(LogLevel::DEBUG); }
    static LogStream info() { return LogStream(LogLevel::INFO); }
    static LogStream warning() { return LogStream(LogLevel::WARNING); }
    static LogStream error() { return LogStream(LogLevel::ERROR); }

    // ========== Configuration ==========

    /**
     * @brief Sets the minimum level; messages below it are dropped
     */
    static void setMinLevel(LogLevel level) { s_minLevel.store(level); }

    static LogLevel getMinLevel() { return s_minLevel.load(); }

    static bool isEnabled(LogLevel level) { return level >= s_minLevel.load(); }

    /**
     * @brief Enables or disables ANSI color prefixes
     */
    static void setUseColors(bool enable) { s_useColors.store(enable); }

private:
    static void write(LogLevel level, const std::string& message);

    static std::atomic<LogLevel> s_minLevel;
    static std::atomic<bool> s_useColors;
    static std::mutex s_mutex;
};

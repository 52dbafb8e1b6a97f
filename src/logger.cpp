/**
 * @file logger.cpp
 * @brief Implementation of the logging system
 */

#include "logger.h"

#include <algorithm>
#include <cctype>

std::atomic<LogLevel> Logger::s_minLevel{LogLevel::INFO};
std::atomic<bool> Logger::s_useColors{true};
std::mutex Logger::s_mutex;

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
        default:                return "UNKNOWN";
    }
}

bool parseLogLevel(const std::string& name, LogLevel& out) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") {
        out = LogLevel::DEBUG;
    } else if (lower == "info") {
        out = LogLevel::INFO;
    } else if (lower == "warning" || lower == "warn") {
        out = LogLevel::WARNING;
    } else if (lower == "error") {
        out = LogLevel::ERROR;
    } else {
        return false;
    }
    return true;
}

void Logger::write(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(s_mutex);

    std::ostream& out = (level >= LogLevel::ERROR) ? std::cerr : std::cout;

    if (s_useColors.load()) {
        switch (level) {
            case LogLevel::DEBUG:   out << "\033[36m[DEBUG]\033[0m ";   break;  // Cyan
            case LogLevel::INFO:    out << "\033[32m[INFO]\033[0m ";    break;  // Green
            case LogLevel::WARNING: out << "\033[33m[WARNING]\033[0m "; break;  // Yellow
            case LogLevel::ERROR:   out << "\033[31m[ERROR]\033[0m ";   break;  // Red
        }
    } else {
        out << "[" << logLevelName(level) << "] ";
    }

    out << message << std::endl;
}

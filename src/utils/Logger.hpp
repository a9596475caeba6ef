#pragma once
#include <string>

enum class LogLevel {
    ERROR = 0,
    WARN  = 1,
    INFO  = 2,
    DEBUG = 3,
};

/**
 * Minimal leveled logger writing to stderr.
 *
 *   [2025-01-01 12:00:00] [INFO] listening on 0.0.0.0:6379
 *
 * Safe to call from any thread; messages above the current
 * level are dropped before any formatting happens.
 */
class Logger {
public:
    static void setLevel(LogLevel level);
    static LogLevel level();

    // Returns false for an unknown level name, leaving `out` untouched.
    static bool parseLevel(const std::string& name, LogLevel& out);

    static void log(LogLevel level, const std::string& message);

    static void error(const std::string& message) { log(LogLevel::ERROR, message); }
    static void warn (const std::string& message) { log(LogLevel::WARN,  message); }
    static void info (const std::string& message) { log(LogLevel::INFO,  message); }
    static void debug(const std::string& message) { log(LogLevel::DEBUG, message); }
};

#include "Logger.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace {

std::mutex log_mutex;
std::atomic<int> current_level{static_cast<int>(LogLevel::INFO)};

const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
    }
    return "UNKNOWN";
}

}  // namespace

void Logger::setLevel(LogLevel level) {
    current_level.store(static_cast<int>(level));
}

LogLevel Logger::level() {
    return static_cast<LogLevel>(current_level.load());
}

bool Logger::parseLevel(const std::string& name, LogLevel& out) {
    if (name == "error")   { out = LogLevel::ERROR; return true; }
    if (name == "warn" ||
        name == "warning") { out = LogLevel::WARN;  return true; }
    if (name == "info" ||
        name == "notice")  { out = LogLevel::INFO;  return true; }
    if (name == "debug" ||
        name == "verbose") { out = LogLevel::DEBUG; return true; }
    return false;
}

void Logger::log(LogLevel level, const std::string& message) {
    if (static_cast<int>(level) > current_level.load())
        return;

    auto now = std::chrono::system_clock::now();
    std::time_t now_time = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
    localtime_r(&now_time, &tm_buf);

    std::ostringstream line;
    line << '[' << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "] ["
         << levelName(level) << "] " << message << '\n';

    std::lock_guard<std::mutex> lock(log_mutex);
    std::cerr << line.str();
}

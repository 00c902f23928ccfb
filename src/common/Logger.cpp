#include "webgate/common/Logger.h"

#include <iostream>
#include <chrono>
#include <iomanip>
#include <ctime>
#include <unistd.h>

namespace webgate {
namespace common {

namespace {

std::string FormatNow() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tmv{};
    ::localtime_r(&t, &tmv);
    std::stringstream ss;
    ss << std::put_time(&tmv, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

const char* LevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
    }
    return "UNKNOWN";
}

const char* LevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[36m";
        case LogLevel::INFO:  return "\033[32m";
        case LogLevel::WARN:  return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        case LogLevel::FATAL: return "\033[35m";
    }
    return "\033[0m";
}

// Strip the build directory so lines read [TcpConnection.cpp:42].
const char* BaseName(const char* file) {
    const char* base = file;
    for (const char* p = file; *p; ++p) {
        if (*p == '/') base = p + 1;
    }
    return base;
}

} // namespace

Logger::Logger() : colored_(::isatty(STDOUT_FILENO) == 1) {}

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::ParseLevel(const std::string& levelStr) {
    if (levelStr == "DEBUG") return LogLevel::DEBUG;
    if (levelStr == "INFO") return LogLevel::INFO;
    if (levelStr == "WARN") return LogLevel::WARN;
    if (levelStr == "ERROR") return LogLevel::ERROR;
    if (levelStr == "FATAL") return LogLevel::FATAL;
    return LogLevel::INFO;
}

void Logger::SetSink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Logger::ClearSink() {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = nullptr;
}

void Logger::Log(LogLevel level, const char* file, int line, const std::string& msg) {
    Sink sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Format: [Time] [Level] [File:Line] Message
        if (colored_) std::cout << LevelColor(level);
        std::cout << "[" << FormatNow() << "] "
                  << "[" << LevelName(level) << "] "
                  << "[" << BaseName(file) << ":" << line << "] "
                  << msg;
        if (colored_) std::cout << "\033[0m";
        std::cout << std::endl;
        sink = sink_;
    }
    if (sink) sink(level, msg);
}

} // namespace common
} // namespace webgate

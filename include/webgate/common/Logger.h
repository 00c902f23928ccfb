#pragma once

#include <string>
#include <mutex>
#include <sstream>
#include <functional>

namespace webgate {
namespace common {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

class Logger {
public:
    // Receives every emitted line after level filtering. Used by tests to observe warnings.
    using Sink = std::function<void(LogLevel, const std::string& msg)>;

    static Logger& Instance();

    void SetLevel(LogLevel level);
    LogLevel GetLevel() const { return level_; }
    LogLevel ParseLevel(const std::string& levelStr);
    void SetSink(Sink sink);
    void ClearSink();
    void Log(LogLevel level, const char* file, int line, const std::string& msg);

private:
    Logger();
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel level_ = LogLevel::INFO;
    bool colored_ = false;
    Sink sink_;
    std::mutex mutex_;
};

// Stream wrapper to allow usage like: LOG_INFO << "Message " << 123;
class LogStream {
public:
    LogStream(LogLevel level, const char* file, int line)
        : level_(level), file_(file), line_(line) {}

    ~LogStream() {
        Logger::Instance().Log(level_, file_, line_, ss_.str());
    }

    template <typename T>
    LogStream& operator<<(const T& val) {
        ss_ << val;
        return *this;
    }

private:
    LogLevel level_;
    const char* file_;
    int line_;
    std::stringstream ss_;
};

} // namespace common
} // namespace webgate

#define LOG_DEBUG \
    if (webgate::common::LogLevel::DEBUG >= webgate::common::Logger::Instance().GetLevel()) \
    webgate::common::LogStream(webgate::common::LogLevel::DEBUG, __FILE__, __LINE__)

#define LOG_INFO \
    if (webgate::common::LogLevel::INFO >= webgate::common::Logger::Instance().GetLevel()) \
    webgate::common::LogStream(webgate::common::LogLevel::INFO, __FILE__, __LINE__)

#define LOG_WARN \
    if (webgate::common::LogLevel::WARN >= webgate::common::Logger::Instance().GetLevel()) \
    webgate::common::LogStream(webgate::common::LogLevel::WARN, __FILE__, __LINE__)

#define LOG_ERROR \
    if (webgate::common::LogLevel::ERROR >= webgate::common::Logger::Instance().GetLevel()) \
    webgate::common::LogStream(webgate::common::LogLevel::ERROR, __FILE__, __LINE__)

#define LOG_FATAL \
    if (webgate::common::LogLevel::FATAL >= webgate::common::Logger::Instance().GetLevel()) \
    webgate::common::LogStream(webgate::common::LogLevel::FATAL, __FILE__, __LINE__)

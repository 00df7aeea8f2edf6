#pragma once

#include <functional>
#include <mutex>
#include <sstream>
#include <string>

namespace conduit {
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
    // Receives every emitted record instead of stdout (used by tests and embedders).
    using Sink = std::function<void(LogLevel, const std::string&)>;

    static Logger& Instance();

    void SetLevel(LogLevel level);
    LogLevel GetLevel() const { return level_; }
    LogLevel ParseLevel(const std::string& levelStr);

    // Passing an empty sink restores stdout output.
    void SetSink(Sink sink);

    void Log(LogLevel level, const char* file, int line, const std::string& msg);

private:
    Logger();
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel level_ = LogLevel::INFO;
    Sink sink_;
    const bool color_;  // stdout is a terminal
    std::mutex mutex_;
};

// Usage: LOG_INFO << "bytes=" << n;
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
} // namespace conduit

#define LOG_DEBUG \
    if (conduit::common::LogLevel::DEBUG >= conduit::common::Logger::Instance().GetLevel()) \
    conduit::common::LogStream(conduit::common::LogLevel::DEBUG, __FILE__, __LINE__)

#define LOG_INFO \
    if (conduit::common::LogLevel::INFO >= conduit::common::Logger::Instance().GetLevel()) \
    conduit::common::LogStream(conduit::common::LogLevel::INFO, __FILE__, __LINE__)

#define LOG_WARN \
    if (conduit::common::LogLevel::WARN >= conduit::common::Logger::Instance().GetLevel()) \
    conduit::common::LogStream(conduit::common::LogLevel::WARN, __FILE__, __LINE__)

#define LOG_ERROR \
    if (conduit::common::LogLevel::ERROR >= conduit::common::Logger::Instance().GetLevel()) \
    conduit::common::LogStream(conduit::common::LogLevel::ERROR, __FILE__, __LINE__)

#define LOG_FATAL \
    if (conduit::common::LogLevel::FATAL >= conduit::common::Logger::Instance().GetLevel()) \
    conduit::common::LogStream(conduit::common::LogLevel::FATAL, __FILE__, __LINE__)

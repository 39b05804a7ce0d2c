#pragma once

#include <string>
#include <mutex>
#include <sstream>

namespace sticky {
namespace common {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

// Process-wide logger. Lines go to stderr so that tools writing HTTP
// responses to stdout keep a clean stream.
class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel level);
    LogLevel GetLevel() const { return level_; }
    // Case-insensitive; unknown names map to INFO.
    LogLevel ParseLevel(const std::string& levelStr) const;
    void SetColored(bool on);
    void Log(LogLevel level, const char* file, int line, const std::string& msg);

private:
    Logger();
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel level_ = LogLevel::INFO;
    bool colored_ = false;
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
} // namespace sticky

#define LOG_DEBUG \
    if (sticky::common::LogLevel::DEBUG >= sticky::common::Logger::Instance().GetLevel()) \
    sticky::common::LogStream(sticky::common::LogLevel::DEBUG, __FILE__, __LINE__)

#define LOG_INFO \
    if (sticky::common::LogLevel::INFO >= sticky::common::Logger::Instance().GetLevel()) \
    sticky::common::LogStream(sticky::common::LogLevel::INFO, __FILE__, __LINE__)

#define LOG_WARN \
    if (sticky::common::LogLevel::WARN >= sticky::common::Logger::Instance().GetLevel()) \
    sticky::common::LogStream(sticky::common::LogLevel::WARN, __FILE__, __LINE__)

#define LOG_ERROR \
    if (sticky::common::LogLevel::ERROR >= sticky::common::Logger::Instance().GetLevel()) \
    sticky::common::LogStream(sticky::common::LogLevel::ERROR, __FILE__, __LINE__)

#define LOG_FATAL \
    if (sticky::common::LogLevel::FATAL >= sticky::common::Logger::Instance().GetLevel()) \
    sticky::common::LogStream(sticky::common::LogLevel::FATAL, __FILE__, __LINE__)

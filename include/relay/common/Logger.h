#pragma once

#include <string>
#include <mutex>
#include <sstream>
#include <ostream>

namespace relay {
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
    static Logger& Instance();

    void SetLevel(LogLevel level);
    LogLevel GetLevel() const { return level_; }

    // Case-insensitive. Sets *ok to false (and returns INFO) for unknown names.
    static LogLevel ParseLevel(const std::string& levelStr, bool* ok = nullptr);
    static const char* LevelName(LogLevel level);

    // Colour defaults to on when the sink is a terminal.
    void SetColor(bool on);
    // Redirects records, mainly for tests. The stream must outlive the logger use.
    void SetOutput(std::ostream* out);

    void Log(LogLevel level, const char* file, int line, const std::string& msg);

private:
    Logger();
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel level_ = LogLevel::INFO;
    bool color_;
    std::ostream* out_;
    std::mutex mutex_;
};

// Stream wrapper to allow usage like: LOG_INFO << "Message " << 123;
// A FATAL record terminates the process once written.
class LogStream {
public:
    LogStream(LogLevel level, const char* file, int line)
        : level_(level), file_(file), line_(line) {}

    ~LogStream();

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
} // namespace relay

#define RELAY_LOG_AT(lvl) \
    if (relay::common::LogLevel::lvl >= relay::common::Logger::Instance().GetLevel()) \
    relay::common::LogStream(relay::common::LogLevel::lvl, __FILE__, __LINE__)

#define LOG_DEBUG RELAY_LOG_AT(DEBUG)
#define LOG_INFO RELAY_LOG_AT(INFO)
#define LOG_WARN RELAY_LOG_AT(WARN)
#define LOG_ERROR RELAY_LOG_AT(ERROR)
#define LOG_FATAL RELAY_LOG_AT(FATAL)

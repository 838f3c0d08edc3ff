#include "relay/common/Logger.h"

#include <iostream>
#include <chrono>
#include <iomanip>
#include <ctime>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <thread>
#include <unistd.h>

namespace relay {
namespace common {

namespace {

std::string GetCurrentTime() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tmBuf;
    ::localtime_r(&in_time_t, &tmBuf);
    std::stringstream ss;
    ss << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

// Fixed width so columns line up.
const char* LevelTag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

// ANSI Color codes
const char* LevelToColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[36m"; // Cyan
        case LogLevel::INFO:  return "\033[32m"; // Green
        case LogLevel::WARN:  return "\033[33m"; // Yellow
        case LogLevel::ERROR: return "\033[31m"; // Red
        case LogLevel::FATAL: return "\033[35m"; // Magenta
        default: return "\033[0m";
    }
}

const char* Basename(const char* file) {
    const char* slash = std::strrchr(file, '/');
    return slash ? slash + 1 : file;
}

} // namespace

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : color_(::isatty(STDOUT_FILENO) == 1),
      out_(&std::cout) {
}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

void Logger::SetColor(bool on) {
    std::lock_guard<std::mutex> lock(mutex_);
    color_ = on;
}

void Logger::SetOutput(std::ostream* out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ = out ? out : &std::cout;
}

LogLevel Logger::ParseLevel(const std::string& levelStr, bool* ok) {
    std::string up;
    up.reserve(levelStr.size());
    for (unsigned char c : levelStr) up.push_back(static_cast<char>(std::toupper(c)));

    if (ok) *ok = true;
    if (up == "DEBUG") return LogLevel::DEBUG;
    if (up == "INFO") return LogLevel::INFO;
    if (up == "WARN" || up == "WARNING") return LogLevel::WARN;
    if (up == "ERROR") return LogLevel::ERROR;
    if (up == "FATAL") return LogLevel::FATAL;
    if (ok) *ok = false;
    return LogLevel::INFO;
}

const char* Logger::LevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

void Logger::Log(LogLevel level, const char* file, int line, const std::string& msg) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Format: [Time] [Level] [tid] [File:Line] Message
    std::ostream& os = *out_;
    if (color_) os << LevelToColor(level);
    os << "[" << GetCurrentTime() << "] "
       << "[" << LevelTag(level) << "] "
       << "[" << std::this_thread::get_id() << "] "
       << "[" << Basename(file) << ":" << line << "] "
       << msg;
    if (color_) os << "\033[0m";
    os << std::endl;
}

LogStream::~LogStream() {
    Logger::Instance().Log(level_, file_, line_, ss_.str());
    if (level_ == LogLevel::FATAL) {
        std::abort();
    }
}

} // namespace common
} // namespace relay

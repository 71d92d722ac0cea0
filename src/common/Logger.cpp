#include "wrapmgr/common/Logger.h"

#include <unistd.h>

#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace wrapmgr {
namespace common {

namespace {

std::string FormatNow() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    struct tm tmBuf;
    ::localtime_r(&t, &tmBuf);
    std::stringstream ss;
    ss << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

const char* LevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

const char* LevelToColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[36m";
        case LogLevel::INFO:  return "\033[32m";
        case LogLevel::WARN:  return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        case LogLevel::FATAL: return "\033[35m";
        default: return "\033[0m";
    }
}

// __FILE__ carries the full build path; keep the part after src/ or tests/.
const char* ShortFile(const char* file) {
    const char* p = std::strstr(file, "src/");
    if (!p) p = std::strstr(file, "tests/");
    return p ? p : file;
}

} // namespace

Logger::Logger()
    : colored_(::isatty(STDOUT_FILENO) == 1) {
}

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

bool Logger::SetLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) file_.close();
    if (path.empty()) return true;
    file_.open(path, std::ios::app);
    return file_.is_open();
}

void Logger::Log(LogLevel level, const char* file, int line, const std::string& msg) {
    const std::string ts = FormatNow();
    const char* src = ShortFile(file);

    std::lock_guard<std::mutex> lock(mutex_);
    if (colored_) std::cout << LevelToColor(level);
    std::cout << "[" << ts << "] "
              << "[" << LevelToString(level) << "] "
              << "[" << src << ":" << line << "] "
              << msg;
    if (colored_) std::cout << "\033[0m";
    std::cout << std::endl;

    if (file_.is_open()) {
        file_ << "[" << ts << "] [" << LevelToString(level) << "] [" << src << ":" << line << "] " << msg << '\n';
        file_.flush();
    }
}

} // namespace common
} // namespace wrapmgr

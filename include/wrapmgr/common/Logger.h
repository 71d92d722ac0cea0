#pragma once

#include <fstream>
#include <mutex>
#include <sstream>
#include <string>

namespace wrapmgr {
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
    LogLevel ParseLevel(const std::string& levelStr);

    // Appends every line to the given file as well as stdout. Empty path closes it.
    bool SetLogFile(const std::string& path);

    void Log(LogLevel level, const char* file, int line, const std::string& msg);

private:
    Logger();
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel level_ = LogLevel::INFO;
    bool colored_;
    std::ofstream file_;
    std::mutex mutex_;
};

// LOG_INFO << "instance " << id << " active";
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
} // namespace wrapmgr

#define WRAPMGR_LOG(lvl) \
    if (wrapmgr::common::LogLevel::lvl >= wrapmgr::common::Logger::Instance().GetLevel()) \
    wrapmgr::common::LogStream(wrapmgr::common::LogLevel::lvl, __FILE__, __LINE__)

#define LOG_DEBUG WRAPMGR_LOG(DEBUG)
#define LOG_INFO WRAPMGR_LOG(INFO)
#define LOG_WARN WRAPMGR_LOG(WARN)
#define LOG_ERROR WRAPMGR_LOG(ERROR)
#define LOG_FATAL WRAPMGR_LOG(FATAL)

#pragma once
#include <string>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR_LEVEL
};

inline std::string toString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR_LEVEL: return "ERROR";
        default: return "UNKNOWN";
    }
}

// 解析日志级别 "debug", "info", "warn"/"warning", "error"，无法识别时返回false
bool parseLogLevel(const std::string& text, LogLevel& level);

class ILogger {
public:
    virtual ~ILogger() = default;
    virtual void info(const std::string& message) = 0;

    virtual void error(const std::string& message) = 0;

    virtual void warn(const std::string& message) = 0;

    virtual void debug(const std::string& message) = 0;

    virtual void setLogLevel(LogLevel level) = 0;

    virtual LogLevel getLogLevel() const = 0;

    virtual void log(LogLevel level, const std::string& message) = 0;
};

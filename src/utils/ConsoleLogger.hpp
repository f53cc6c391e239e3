#pragma once
#include "ILogger.hpp"
#include <iosfwd>
#include <string>

// 带时间戳输出到stdout，错误输出到stderr
class ConsoleLogger : public ILogger {
public:
    explicit ConsoleLogger(LogLevel level = LogLevel::INFO);

    // 指定输出流，主要用于测试
    ConsoleLogger(std::ostream& out, std::ostream& err, LogLevel level = LogLevel::INFO);

    void info(const std::string& message) override;

    void error(const std::string& message) override;

    void warn(const std::string& message) override;

    void debug(const std::string& message) override;

    void setLogLevel(LogLevel level) override;

    LogLevel getLogLevel() const override;

    void log(LogLevel level, const std::string& message) override;

private:
    std::ostream& out;
    std::ostream& err;
    LogLevel minLevel;
};

// src/utils/ConsoleLogger.cpp
#include "ConsoleLogger.hpp"
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

static std::string getCurrentTime() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::ostringstream oss;
    oss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

bool parseLogLevel(const std::string& text, LogLevel& level) {
    if (text == "debug") {
        level = LogLevel::DEBUG;
    } else if (text == "info") {
        level = LogLevel::INFO;
    } else if (text == "warn" || text == "warning") {
        level = LogLevel::WARNING;
    } else if (text == "error") {
        level = LogLevel::ERROR_LEVEL;
    } else {
        return false;
    }
    return true;
}

ConsoleLogger::ConsoleLogger(LogLevel level) : out(std::cout), err(std::cerr), minLevel(level) {}

ConsoleLogger::ConsoleLogger(std::ostream& out, std::ostream& err, LogLevel level)
    : out(out), err(err), minLevel(level) {}

void ConsoleLogger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void ConsoleLogger::error(const std::string& message) {
    log(LogLevel::ERROR_LEVEL, message);
}

void ConsoleLogger::warn(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void ConsoleLogger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void ConsoleLogger::setLogLevel(LogLevel level) {
    minLevel = level;
}

LogLevel ConsoleLogger::getLogLevel() const {
    return minLevel;
}

void ConsoleLogger::log(LogLevel level, const std::string& message) {
    if (level < minLevel) {
        return;
    }
    std::ostream& stream = (level == LogLevel::ERROR_LEVEL) ? err : out;
    stream << "[" << getCurrentTime() << "] [" << toString(level) << "] " << message << std::endl;
}

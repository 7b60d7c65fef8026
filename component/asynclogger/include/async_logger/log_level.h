#pragma once

#include <string>

namespace asynclog {

/**
 * @brief 日志级别
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4,
    FATAL = 5,
    OFF   = 6
};

inline const char* LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF";
    }
    return "UNKNOWN";
}

/**
 * @brief 字符串转日志级别，大小写不敏感；无法识别时返回 fallback
 */
inline LogLevel StringToLogLevel(const std::string& str, LogLevel fallback = LogLevel::INFO) {
    std::string s;
    s.reserve(str.size());
    for (char c : str) s += (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
    if (s == "TRACE") return LogLevel::TRACE;
    if (s == "DEBUG") return LogLevel::DEBUG;
    if (s == "INFO")  return LogLevel::INFO;
    if (s == "WARN" || s == "WARNING") return LogLevel::WARN;
    if (s == "ERROR") return LogLevel::ERROR;
    if (s == "FATAL") return LogLevel::FATAL;
    if (s == "OFF")   return LogLevel::OFF;
    return fallback;
}

}  // namespace asynclog

#pragma once

#include "log_level.h"
#include "log_config.h"

#include <cstdint>
#include <cstring>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace asynclog {

class AsyncLoggerImpl;

// ============================================================================
// Tag：结构化键值标签
// ============================================================================

/**
 * @example LogInfo(TAG("user", "alice").Add("op", "generate"), "done");
 * 输出为 [user=alice, op=generate]
 */
class Tag {
public:
    Tag() = default;
    Tag(std::string key, std::string value) { Add(std::move(key), std::move(value)); }

    Tag& Add(std::string key, std::string value) {
        kv_.emplace_back(std::move(key), std::move(value));
        return *this;
    }

    bool Empty() const { return kv_.empty(); }

    std::string ToString() const {
        std::string out;
        for (size_t i = 0; i < kv_.size(); ++i) {
            if (i) out += ", ";
            out += kv_[i].first;
            out += '=';
            out += kv_[i].second;
        }
        return out;
    }

private:
    std::vector<std::pair<std::string, std::string>> kv_;
};

// ============================================================================
// AsyncLogger：进程级单例，业务线程只负责入队，后台线程格式化并写 Sink
// ============================================================================

class AsyncLogger {
public:
    static AsyncLogger& Instance();

    bool Init(const LogConfig& config = LogConfig{});
    void Shutdown();
    bool IsInitialized() const;

    void Log(LogLevel level, const char* file, int line, const Tag& tag, std::string message);

    void SetLevel(LogLevel level);
    LogLevel GetLevel() const;
    bool ShouldLog(LogLevel level) const;

    /// 阻塞直到当前已入队的日志全部写出
    void Flush();

    /// 因队列满被丢弃的日志条数
    uint64_t Dropped() const;

private:
    AsyncLogger();
    ~AsyncLogger();
    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    std::unique_ptr<AsyncLoggerImpl> impl_;
};

inline bool Init(const LogConfig& config = LogConfig{}) { return AsyncLogger::Instance().Init(config); }
inline void Shutdown() { AsyncLogger::Instance().Shutdown(); }
inline void SetLevel(LogLevel level) { AsyncLogger::Instance().SetLevel(level); }
inline LogLevel GetLevel() { return AsyncLogger::Instance().GetLevel(); }
inline void Flush() { AsyncLogger::Instance().Flush(); }

}  // namespace asynclog

// ============================================================================
// 日志宏
//
// 用法一（无 Tag）：LogInfo("listening on " << port);
// 用法二（带 Tag）：LogInfo(TAG("user", name), "credential generated");
// ============================================================================

#define ASYNCLOG_FILENAME \
    (strrchr(__FILE__, '/') ? strrchr(__FILE__, '/') + 1 : __FILE__)

#define ASYNCLOG_EMIT(level, tag, ...) \
    do { \
        auto& asynclog_logger_ = asynclog::AsyncLogger::Instance(); \
        if (asynclog_logger_.ShouldLog(level)) { \
            std::ostringstream asynclog_oss_; \
            asynclog_oss_ << __VA_ARGS__; \
            asynclog_logger_.Log(level, ASYNCLOG_FILENAME, __LINE__, tag, asynclog_oss_.str()); \
        } \
    } while (0)

#define ASYNCLOG_LOG_1(level, msg) ASYNCLOG_EMIT(level, asynclog::Tag(), msg)
#define ASYNCLOG_LOG_N(level, tag, ...) ASYNCLOG_EMIT(level, tag, __VA_ARGS__)

// 按参数个数选择：1 个参数为纯消息，2 个及以上第一个是 Tag
#define ASYNCLOG_PICK(_1, _2, _3, _4, _5, _6, _7, _8, NAME, ...) NAME
#define ASYNCLOG_LOG(level, ...) \
    ASYNCLOG_PICK(__VA_ARGS__, \
        ASYNCLOG_LOG_N, ASYNCLOG_LOG_N, ASYNCLOG_LOG_N, ASYNCLOG_LOG_N, \
        ASYNCLOG_LOG_N, ASYNCLOG_LOG_N, ASYNCLOG_LOG_N, ASYNCLOG_LOG_1 \
    )(level, __VA_ARGS__)

#define LogTrace(...)   ASYNCLOG_LOG(asynclog::LogLevel::TRACE, __VA_ARGS__)
#define LogDebug(...)   ASYNCLOG_LOG(asynclog::LogLevel::DEBUG, __VA_ARGS__)
#define LogInfo(...)    ASYNCLOG_LOG(asynclog::LogLevel::INFO, __VA_ARGS__)
#define LogWarning(...) ASYNCLOG_LOG(asynclog::LogLevel::WARN, __VA_ARGS__)
#define LogError(...)   ASYNCLOG_LOG(asynclog::LogLevel::ERROR, __VA_ARGS__)
#define LogFatal(...)   ASYNCLOG_LOG(asynclog::LogLevel::FATAL, __VA_ARGS__)

#define TAG(key, value) asynclog::Tag(key, value)

#pragma once

/**
 * @file log_helper.h
 * @brief keyward 日志封装层
 *
 * 业务代码只引用此文件；底层为 component/asynclogger。
 *
 * 用法：
 *   keyward::log::InitForService("ctlsvr", config.log_dir, config.log_level);
 *   LogInfo(TAG("service", "ctlsvr"), "listening on " << port);
 *   keyward::log::Shutdown();
 */

#include <async_logger/async_logger.h>  // 底层实现，仅此处引用

#include <cstdlib>
#include <string>

namespace keyward {
namespace log {

// ============================================================================
// 日志级别（与底层解耦）
// ============================================================================
enum class Level {
    TRACE = 0,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

// ============================================================================
// 日志配置
// ============================================================================
struct Config {
    std::string log_dir = "./logs";
    std::string file_prefix = "app";
    Level min_level = Level::INFO;
    bool enable_console = true;
    bool enable_file = true;
    bool show_file_line = true;
    bool console_color = true;
    size_t max_file_size = 100 * 1024 * 1024;  // 100MB
    int max_file_count = 10;
};

inline asynclog::LogLevel ToImplLevel(Level level) {
    switch (level) {
        case Level::TRACE: return asynclog::LogLevel::TRACE;
        case Level::DEBUG: return asynclog::LogLevel::DEBUG;
        case Level::INFO:  return asynclog::LogLevel::INFO;
        case Level::WARN:  return asynclog::LogLevel::WARN;
        case Level::ERROR: return asynclog::LogLevel::ERROR;
        case Level::FATAL: return asynclog::LogLevel::FATAL;
    }
    return asynclog::LogLevel::INFO;
}

/**
 * @brief "DEBUG"/"warn"/... 转 Level，无法识别时返回 fallback
 */
inline Level ParseLevel(const std::string& text, Level fallback = Level::INFO) {
    switch (asynclog::StringToLogLevel(text, asynclog::LogLevel::OFF)) {
        case asynclog::LogLevel::TRACE: return Level::TRACE;
        case asynclog::LogLevel::DEBUG: return Level::DEBUG;
        case asynclog::LogLevel::INFO:  return Level::INFO;
        case asynclog::LogLevel::WARN:  return Level::WARN;
        case asynclog::LogLevel::ERROR: return Level::ERROR;
        case asynclog::LogLevel::FATAL: return Level::FATAL;
        default:                        return fallback;
    }
}

// ============================================================================
// 日志初始化与关闭
// ============================================================================

/**
 * @brief 初始化日志系统
 * @return 是否成功
 */
inline bool Init(const Config& config) {
    asynclog::LogConfig impl_config;
    impl_config.log_dir = config.log_dir;
    impl_config.file_prefix = config.file_prefix;
    impl_config.enable_console = config.enable_console;
    impl_config.enable_file = config.enable_file;
    impl_config.show_file_line = config.show_file_line;
    impl_config.console_color = config.console_color;
    impl_config.max_file_size = config.max_file_size;
    impl_config.max_file_count = config.max_file_count;
    impl_config.min_level = ToImplLevel(config.min_level);
    return asynclog::Init(impl_config);
}

/**
 * @brief 以服务配置初始化，环境变量优先（适合容器部署）
 *
 * 环境变量：
 *   LOG_DIR     - 覆盖 log_dir
 *   LOG_LEVEL   - 覆盖 log_level
 *   LOG_CONSOLE - "false" 关闭控制台输出
 */
inline bool InitForService(const std::string& service_name,
                           const std::string& log_dir,
                           const std::string& log_level) {
    Config config;
    config.file_prefix = service_name;
    config.log_dir = log_dir;
    config.min_level = ParseLevel(log_level);

    if (const char* env_dir = std::getenv("LOG_DIR"))
        config.log_dir = env_dir;
    if (const char* env_level = std::getenv("LOG_LEVEL"))
        config.min_level = ParseLevel(env_level, config.min_level);
    if (const char* env_console = std::getenv("LOG_CONSOLE"))
        config.enable_console = (std::string(env_console) != "false");

    return Init(config);
}

/**
 * @brief 仅控制台输出，单元测试用
 */
inline bool InitConsoleOnly(Level level = Level::WARN) {
    Config config;
    config.enable_file = false;
    config.console_color = false;
    config.min_level = level;
    return Init(config);
}

/**
 * @brief 关闭日志系统，确保所有日志写入完成
 */
inline void Shutdown() {
    asynclog::Shutdown();
}

inline void SetLevel(Level level) {
    asynclog::SetLevel(ToImplLevel(level));
}

}  // namespace log
}  // namespace keyward

// ============================================================================
// 带项目前缀的日志宏
//
// 用法：
//   KeywardLogInfo("Server started on port " << port);
//   KeywardLogError(TAG("code", "800"), "Storage error");
// LogInfo / LogError 等无前缀宏由 async_logger.h 提供，可直接使用。
// ============================================================================

#define KeywardLogTrace(...)   LogTrace(__VA_ARGS__)
#define KeywardLogDebug(...)   LogDebug(__VA_ARGS__)
#define KeywardLogInfo(...)    LogInfo(__VA_ARGS__)
#define KeywardLogWarning(...) LogWarning(__VA_ARGS__)
#define KeywardLogError(...)   LogError(__VA_ARGS__)
#define KeywardLogFatal(...)   LogFatal(__VA_ARGS__)

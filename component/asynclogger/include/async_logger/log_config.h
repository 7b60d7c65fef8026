#pragma once

#include "log_level.h"
#include <cstddef>
#include <string>

namespace asynclog {

/**
 * @brief 日志配置
 */
struct LogConfig {
    LogLevel min_level = LogLevel::INFO;

    // 前台队列上限（条数），超过后丢弃新日志并计数
    size_t max_pending = 65536;
    size_t flush_interval_ms = 100;

    // 文件输出
    bool enable_file = true;
    std::string log_dir = "./logs";
    std::string file_prefix = "app";
    size_t max_file_size = 100 * 1024 * 1024;   // 单文件上限
    int max_file_count = 10;                     // 保留文件数量

    // 控制台输出
    bool enable_console = true;
    bool console_color = true;

    // 格式
    bool show_file_line = true;
    bool show_thread_id = false;
};

}  // namespace asynclog

#pragma once

#include "async_logger/log_level.h"

#include <cstdint>
#include <string>
#include <thread>

namespace asynclog {

/**
 * @brief 一条待写出的日志（业务线程构造，后台线程消费）
 */
struct LogRecord {
    int64_t timestamp_us = 0;
    LogLevel level = LogLevel::INFO;
    const char* file = "";       // 指向 __FILE__ 字面量，生命周期为整个进程
    int line = 0;
    std::thread::id thread_id;
    std::string tags;
    std::string message;
};

/**
 * @brief 格式化：[时间] [级别] [tid] [tags] [file:line] message\n
 */
std::string FormatRecord(const LogRecord& rec, bool show_file_line, bool show_thread_id);

int64_t NowMicros();

}  // namespace asynclog

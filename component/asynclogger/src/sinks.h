#pragma once

#include "async_logger/log_level.h"

#include <cstddef>
#include <fstream>
#include <memory>
#include <string>

namespace asynclog {

/**
 * @brief 日志输出目标。只由后台线程调用，实现无需加锁。
 */
class Sink {
public:
    virtual ~Sink() = default;
    virtual void Write(LogLevel level, const std::string& line) = 0;
    virtual void Flush() = 0;
};

using SinkPtr = std::unique_ptr<Sink>;

/**
 * @brief 标准输出，可按级别着色；ERROR 及以上写 stderr
 */
class ConsoleSink : public Sink {
public:
    explicit ConsoleSink(bool color) : color_(color) {}
    void Write(LogLevel level, const std::string& line) override;
    void Flush() override;

private:
    bool color_;
};

/**
 * @brief 文件输出：<dir>/<prefix>_YYYYmmdd_HHMMSS_mmm.log，
 *        超过 max_size 后滚动，只保留最近 max_count 个文件
 */
class FileSink : public Sink {
public:
    FileSink(std::string dir, std::string prefix, size_t max_size, int max_count);
    ~FileSink() override;

    void Write(LogLevel level, const std::string& line) override;
    void Flush() override;

    bool IsOpen() const { return out_.is_open(); }

private:
    bool Open();
    void Rotate();
    void RemoveOldFiles();

    std::string dir_;
    std::string prefix_;
    size_t max_size_;
    int max_count_;

    std::ofstream out_;
    size_t written_ = 0;
};

}  // namespace asynclog

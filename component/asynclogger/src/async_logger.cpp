/**
 * @file async_logger.cpp
 * @brief 双缓冲异步日志
 *
 * 业务线程把 LogRecord 追加到前台 vector（持锁时间只有一次 push_back），
 * 后台线程定期与之交换后在锁外格式化并写各 Sink。
 */

#include "async_logger/async_logger.h"
#include "log_record.h"
#include "sinks.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

namespace asynclog {

class AsyncLoggerImpl {
public:
    ~AsyncLoggerImpl() { Shutdown(); }

    bool Init(const LogConfig& config) {
        std::lock_guard<std::mutex> init_lock(init_mutex_);
        if (running_.load())
            return true;

        config_ = config;
        level_.store(static_cast<int>(config.min_level));
        sinks_.clear();
        if (config.enable_console)
            sinks_.push_back(std::make_unique<ConsoleSink>(config.console_color));
        if (config.enable_file) {
            auto file = std::make_unique<FileSink>(config.log_dir, config.file_prefix,
                                                   config.max_file_size, config.max_file_count);
            if (!file->IsOpen() && !config.enable_console)
                return false;
            if (file->IsOpen())
                sinks_.push_back(std::move(file));
        }

        stop_ = false;
        running_.store(true);
        worker_ = std::thread(&AsyncLoggerImpl::Run, this);
        return true;
    }

    void Shutdown() {
        std::lock_guard<std::mutex> init_lock(init_mutex_);
        if (!running_.exchange(false))
            return;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        if (worker_.joinable())
            worker_.join();
        sinks_.clear();
    }

    bool IsInitialized() const { return running_.load(); }

    void Push(LogRecord&& rec) {
        const bool urgent = static_cast<int>(rec.level) >= static_cast<int>(LogLevel::ERROR);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (front_.size() >= config_.max_pending) {
                dropped_.fetch_add(1);
                return;
            }
            front_.push_back(std::move(rec));
            ++enqueued_;
        }
        if (urgent)
            cv_.notify_one();
    }

    void Flush() {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!running_.load())
            return;
        uint64_t target = enqueued_;
        flush_requested_ = true;
        cv_.notify_one();
        done_cv_.wait(lock, [&] { return written_ >= target || stop_; });
    }

    void SetLevel(LogLevel level) { level_.store(static_cast<int>(level)); }
    LogLevel GetLevel() const { return static_cast<LogLevel>(level_.load()); }
    uint64_t Dropped() const { return dropped_.load(); }

private:
    void Run() {
        std::vector<LogRecord> back;
        back.reserve(1024);
        for (;;) {
            bool stopping = false;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait_for(lock, std::chrono::milliseconds(config_.flush_interval_ms),
                             [this] { return stop_ || flush_requested_; });
                back.swap(front_);
                flush_requested_ = false;
                stopping = stop_;
            }

            for (const auto& rec : back) {
                std::string line = FormatRecord(rec, config_.show_file_line, config_.show_thread_id);
                for (auto& sink : sinks_)
                    sink->Write(rec.level, line);
            }
            for (auto& sink : sinks_)
                sink->Flush();

            {
                std::lock_guard<std::mutex> lock(mutex_);
                written_ += back.size();
            }
            done_cv_.notify_all();
            back.clear();

            if (stopping) {
                std::lock_guard<std::mutex> lock(mutex_);
                if (front_.empty())
                    return;
            }
        }
    }

    LogConfig config_;
    std::vector<SinkPtr> sinks_;

    std::mutex init_mutex_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable done_cv_;
    std::vector<LogRecord> front_;
    bool stop_ = false;
    bool flush_requested_ = false;
    uint64_t enqueued_ = 0;
    uint64_t written_ = 0;

    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<int> level_{static_cast<int>(LogLevel::INFO)};
    std::atomic<uint64_t> dropped_{0};
};

// ============================================================================
// AsyncLogger
// ============================================================================

AsyncLogger& AsyncLogger::Instance() {
    static AsyncLogger instance;
    return instance;
}

AsyncLogger::AsyncLogger() : impl_(std::make_unique<AsyncLoggerImpl>()) {}

AsyncLogger::~AsyncLogger() { impl_->Shutdown(); }

bool AsyncLogger::Init(const LogConfig& config) { return impl_->Init(config); }

void AsyncLogger::Shutdown() { impl_->Shutdown(); }

bool AsyncLogger::IsInitialized() const { return impl_->IsInitialized(); }

bool AsyncLogger::ShouldLog(LogLevel level) const {
    return impl_->IsInitialized() &&
           static_cast<int>(level) >= static_cast<int>(impl_->GetLevel());
}

void AsyncLogger::Log(LogLevel level, const char* file, int line, const Tag& tag, std::string message) {
    if (!ShouldLog(level))
        return;
    LogRecord rec;
    rec.timestamp_us = NowMicros();
    rec.level = level;
    rec.file = file ? file : "";
    rec.line = line;
    rec.thread_id = std::this_thread::get_id();
    rec.tags = tag.ToString();
    rec.message = std::move(message);
    impl_->Push(std::move(rec));
}

void AsyncLogger::SetLevel(LogLevel level) { impl_->SetLevel(level); }

LogLevel AsyncLogger::GetLevel() const { return impl_->GetLevel(); }

void AsyncLogger::Flush() { impl_->Flush(); }

uint64_t AsyncLogger::Dropped() const { return impl_->Dropped(); }

}  // namespace asynclog

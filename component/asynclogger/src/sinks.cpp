#include "sinks.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace asynclog {

// ============================================================================
// ConsoleSink
// ============================================================================

namespace {

const char* ColorOf(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "\033[37m";
        case LogLevel::DEBUG: return "\033[36m";
        case LogLevel::INFO:  return "\033[32m";
        case LogLevel::WARN:  return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        case LogLevel::FATAL: return "\033[35;1m";
        default:              return "\033[0m";
    }
}

}  // namespace

void ConsoleSink::Write(LogLevel level, const std::string& line) {
    std::ostream& os = level >= LogLevel::ERROR ? std::cerr : std::cout;
    if (color_)
        os << ColorOf(level) << line << "\033[0m";
    else
        os << line;
}

void ConsoleSink::Flush() {
    std::cout.flush();
    std::cerr.flush();
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(std::string dir, std::string prefix, size_t max_size, int max_count)
    : dir_(std::move(dir)), prefix_(std::move(prefix)),
      max_size_(max_size), max_count_(max_count < 1 ? 1 : max_count) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    Open();
}

FileSink::~FileSink() {
    if (out_.is_open()) {
        out_.flush();
        out_.close();
    }
}

void FileSink::Write(LogLevel, const std::string& line) {
    if (!out_.is_open() && !Open())
        return;
    out_ << line;
    written_ += line.size();
    if (written_ >= max_size_)
        Rotate();
}

void FileSink::Flush() {
    if (out_.is_open())
        out_.flush();
}

bool FileSink::Open() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    std::tm tm_buf;
    localtime_r(&t, &tm_buf);

    std::ostringstream name;
    name << dir_ << '/' << prefix_ << '_'
         << std::put_time(&tm_buf, "%Y%m%d_%H%M%S")
         << '_' << std::setfill('0') << std::setw(3) << ms << ".log";

    out_.open(name.str(), std::ios::app);
    written_ = 0;
    return out_.is_open();
}

void FileSink::Rotate() {
    out_.flush();
    out_.close();
    RemoveOldFiles();
    Open();
}

void FileSink::RemoveOldFiles() {
    std::vector<fs::path> files;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir_, ec)) {
        const std::string name = entry.path().filename().string();
        if (name.rfind(prefix_ + "_", 0) == 0 && entry.path().extension() == ".log")
            files.push_back(entry.path());
    }
    // 文件名带时间戳，字典序即时间序；为即将打开的新文件留一个名额
    std::sort(files.begin(), files.end());
    while (static_cast<int>(files.size()) > max_count_ - 1) {
        fs::remove(files.front(), ec);
        files.erase(files.begin());
    }
}

}  // namespace asynclog

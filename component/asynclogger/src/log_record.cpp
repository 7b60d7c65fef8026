#include "log_record.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace asynclog {

int64_t NowMicros() {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string FormatRecord(const LogRecord& rec, bool show_file_line, bool show_thread_id) {
    std::time_t secs = static_cast<std::time_t>(rec.timestamp_us / 1000000);
    int millis = static_cast<int>((rec.timestamp_us % 1000000) / 1000);
    std::tm tm_buf;
    localtime_r(&secs, &tm_buf);

    std::ostringstream oss;
    oss << '[' << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis << "] "
        << '[' << LogLevelToString(rec.level) << "] ";
    if (show_thread_id)
        oss << "[tid:" << rec.thread_id << "] ";
    if (!rec.tags.empty())
        oss << '[' << rec.tags << "] ";
    if (show_file_line && rec.file && *rec.file)
        oss << '[' << rec.file << ':' << rec.line << "] ";
    oss << rec.message << '\n';
    return oss.str();
}

}  // namespace asynclog

#pragma once

#include <cstdint>
#include <string>

namespace keyward::ctl {

/**
 * 进程与主机内存快照
 *   进程字段来自 /proc/self/status，主机字段来自 sysinfo(2) 与 /proc/meminfo
 */
struct MemStats {
  uint64_t rss_bytes = 0;
  uint64_t vm_size_bytes = 0;
  uint64_t vm_peak_bytes = 0;
  uint64_t data_bytes = 0;
  int threads = 0;

  uint64_t host_total_bytes = 0;
  uint64_t host_free_bytes = 0;
  uint64_t host_available_bytes = 0;
  uint64_t host_swap_total_bytes = 0;
  uint64_t host_swap_free_bytes = 0;
};

/**
 * 主机信息快照
 */
struct SysInfo {
  std::string hostname;
  std::string arch;     // uname machine，如 x86_64
  std::string os;       // uname sysname，如 Linux
  std::string kernel;   // uname release
  int ncpus = 0;
  int threads = 0;      // 本进程线程数
  int64_t uptime_sec = 0;
  std::string version;  // 服务版本
};

/**
 * 节点统计（无状态，每次调用实时读取）
 */
class NodeStats {
public:
  explicit NodeStats(std::string version) : version_(std::move(version)) {}

  MemStats CollectMemStats() const;
  SysInfo CollectSysInfo() const;

  /**
   * 从 /proc/<pid>/status 或 /proc/meminfo 风格文本中取 "<key>: <n> kB"，返回字节数；
   * 找不到返回 0。key 不含冒号。
   */
  static uint64_t ParseKbField(const std::string &text, const std::string &key);

  // 取 "Threads: N" 这类无单位字段
  static int64_t ParseIntField(const std::string &text, const std::string &key);

private:
  std::string version_;
};

} // namespace keyward::ctl

#include "node_stats.h"
#include "keyward/utils.h"

#include <fstream>
#include <sstream>
#include <thread>

#include <sys/sysinfo.h>
#include <sys/utsname.h>
#include <unistd.h>

namespace keyward::ctl {

namespace {

std::string ReadWholeFile(const char *path) {
  std::ifstream f(path);
  if (!f.is_open())
    return "";
  std::ostringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

/// 找到 "key:" 所在行并返回冒号后的内容
std::string FieldValue(const std::string &text, const std::string &key) {
  std::istringstream in(text);
  std::string line;
  const std::string want = key + ":";
  while (std::getline(in, line)) {
    if (utils::StartsWith(line, want))
      return utils::Trim(line.substr(want.size()));
  }
  return "";
}

} // namespace

uint64_t NodeStats::ParseKbField(const std::string &text, const std::string &key) {
  std::string v = FieldValue(text, key);
  if (v.empty())
    return 0;
  // "123456 kB"
  auto parts = utils::Split(v, ' ');
  int64_t n = utils::ToInt64(parts.empty() ? "" : parts[0], 0);
  if (n < 0)
    return 0;
  bool kb = parts.size() > 1 && utils::ToLower(parts.back()) == "kb";
  return static_cast<uint64_t>(n) * (kb ? 1024u : 1u);
}

int64_t NodeStats::ParseIntField(const std::string &text, const std::string &key) {
  return utils::ToInt64(FieldValue(text, key), 0);
}

MemStats NodeStats::CollectMemStats() const {
  MemStats m;

  std::string status = ReadWholeFile("/proc/self/status");
  m.rss_bytes = ParseKbField(status, "VmRSS");
  m.vm_size_bytes = ParseKbField(status, "VmSize");
  m.vm_peak_bytes = ParseKbField(status, "VmPeak");
  m.data_bytes = ParseKbField(status, "VmData");
  m.threads = static_cast<int>(ParseIntField(status, "Threads"));

  struct sysinfo si;
  if (::sysinfo(&si) == 0) {
    const uint64_t unit = si.mem_unit ? si.mem_unit : 1;
    m.host_total_bytes = static_cast<uint64_t>(si.totalram) * unit;
    m.host_free_bytes = static_cast<uint64_t>(si.freeram) * unit;
    m.host_swap_total_bytes = static_cast<uint64_t>(si.totalswap) * unit;
    m.host_swap_free_bytes = static_cast<uint64_t>(si.freeswap) * unit;
  }
  m.host_available_bytes = ParseKbField(ReadWholeFile("/proc/meminfo"), "MemAvailable");
  if (m.host_available_bytes == 0)
    m.host_available_bytes = m.host_free_bytes;
  return m;
}

SysInfo NodeStats::CollectSysInfo() const {
  SysInfo s;
  s.version = version_;

  char host[256] = {0};
  if (::gethostname(host, sizeof(host) - 1) == 0)
    s.hostname = host;

  struct utsname uts;
  if (::uname(&uts) == 0) {
    s.arch = uts.machine;
    s.os = uts.sysname;
    s.kernel = uts.release;
    if (s.hostname.empty())
      s.hostname = uts.nodename;
  }

  s.ncpus = static_cast<int>(std::thread::hardware_concurrency());
  if (s.ncpus <= 0) {
    long n = ::sysconf(_SC_NPROCESSORS_ONLN);
    s.ncpus = n > 0 ? static_cast<int>(n) : 1;
  }

  s.threads = static_cast<int>(
      ParseIntField(ReadWholeFile("/proc/self/status"), "Threads"));

  struct sysinfo si;
  if (::sysinfo(&si) == 0)
    s.uptime_sec = static_cast<int64_t>(si.uptime);
  return s;
}

} // namespace keyward::ctl

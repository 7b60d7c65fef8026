#pragma once

#include <string>
#include <variant>

#include "../service/node_stats.h"

namespace keyward::ctl {

// ============================================================================
// 参数与返回（JSON 字段名见 rpc_codec.cpp）
// ============================================================================

// Auth.* 参数：{"User": "..."}
struct AuthArgs {
  std::string user;
};

// Auth.* 返回：{"Name", "AccessKeyID", "SecretAccessKey"}
struct AuthReply {
  std::string name;
  std::string access_key_id;
  std::string secret_access_key;
};

// Server.MemStats 返回：{"memstats": {...}}
struct MemStatsReply {
  MemStats memstats;
};

// Server.SysInfo 返回：{"hostname", "sys.arch", ...}
struct SysInfoReply {
  SysInfo info;
};

// ============================================================================
// 操作集合（封闭），方法名只在解码时解析一次
// ============================================================================

struct GenerateOp { AuthArgs args; };
struct FetchOp    { AuthArgs args; };
struct ResetOp    { AuthArgs args; };
struct MemStatsOp {};
struct SysInfoOp  {};

using Operation = std::variant<GenerateOp, FetchOp, ResetOp, MemStatsOp, SysInfoOp>;

// 方法名
constexpr const char *kMethodAuthGenerate = "Auth.Generate";
constexpr const char *kMethodAuthFetch = "Auth.Fetch";
constexpr const char *kMethodAuthReset = "Auth.Reset";
constexpr const char *kMethodServerMemStats = "Server.MemStats";
constexpr const char *kMethodServerSysInfo = "Server.SysInfo";

} // namespace keyward::ctl

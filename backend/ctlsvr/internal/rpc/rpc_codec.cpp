#include "rpc_codec.h"

#include <type_traits>

using json = nlohmann::json;

namespace keyward::ctl {

// ============================================================================
// 结构体 <-> JSON
// ============================================================================

void to_json(json &j, const AuthArgs &args) {
  j = json{{"User", args.user}};
}

void to_json(json &j, const AuthReply &reply) {
  j = json{{"Name", reply.name},
           {"AccessKeyID", reply.access_key_id},
           {"SecretAccessKey", reply.secret_access_key}};
}

void from_json(const json &j, AuthReply &reply) {
  reply.name = j.value("Name", "");
  reply.access_key_id = j.value("AccessKeyID", "");
  reply.secret_access_key = j.value("SecretAccessKey", "");
}

void to_json(json &j, const MemStatsReply &reply) {
  const MemStats &m = reply.memstats;
  j = json{{"memstats",
            {{"rss_bytes", m.rss_bytes},
             {"vm_size_bytes", m.vm_size_bytes},
             {"vm_peak_bytes", m.vm_peak_bytes},
             {"data_bytes", m.data_bytes},
             {"threads", m.threads},
             {"host_total_bytes", m.host_total_bytes},
             {"host_free_bytes", m.host_free_bytes},
             {"host_available_bytes", m.host_available_bytes},
             {"host_swap_total_bytes", m.host_swap_total_bytes},
             {"host_swap_free_bytes", m.host_swap_free_bytes}}}};
}

void from_json(const json &j, MemStatsReply &reply) {
  const json m = j.value("memstats", json::object());
  MemStats &out = reply.memstats;
  out.rss_bytes = m.value("rss_bytes", uint64_t{0});
  out.vm_size_bytes = m.value("vm_size_bytes", uint64_t{0});
  out.vm_peak_bytes = m.value("vm_peak_bytes", uint64_t{0});
  out.data_bytes = m.value("data_bytes", uint64_t{0});
  out.threads = m.value("threads", 0);
  out.host_total_bytes = m.value("host_total_bytes", uint64_t{0});
  out.host_free_bytes = m.value("host_free_bytes", uint64_t{0});
  out.host_available_bytes = m.value("host_available_bytes", uint64_t{0});
  out.host_swap_total_bytes = m.value("host_swap_total_bytes", uint64_t{0});
  out.host_swap_free_bytes = m.value("host_swap_free_bytes", uint64_t{0});
}

void to_json(json &j, const SysInfoReply &reply) {
  const SysInfo &s = reply.info;
  j = json{{"hostname", s.hostname},   {"sys.arch", s.arch},
           {"sys.os", s.os},           {"sys.ncpus", s.ncpus},
           {"sys.kernel", s.kernel},   {"threads", s.threads},
           {"uptime_sec", s.uptime_sec}, {"version", s.version}};
}

void from_json(const json &j, SysInfoReply &reply) {
  SysInfo &s = reply.info;
  s.hostname = j.value("hostname", "");
  s.arch = j.value("sys.arch", "");
  s.os = j.value("sys.os", "");
  s.ncpus = j.value("sys.ncpus", 0);
  s.kernel = j.value("sys.kernel", "");
  s.threads = j.value("threads", 0);
  s.uptime_sec = j.value("uptime_sec", int64_t{0});
  s.version = j.value("version", "");
}

// ============================================================================
// 解码
// ============================================================================

namespace {

Error BadRequest(const std::string &msg) {
  return Error(ErrorCode::RPC_INVALID_REQUEST, msg);
}

/// params 取第一个参数对象；缺省视为空对象
Result<json> FirstArg(const json &params) {
  if (params.is_null())
    return json::object();
  if (params.is_array()) {
    if (params.empty())
      return json::object();
    if (params.size() > 1)
      return BadRequest("params must contain exactly one argument");
    return params.front();
  }
  return params;
}

Result<AuthArgs> ParseAuthArgs(const json &params) {
  auto arg = FirstArg(params);
  if (!arg.ok())
    return arg.error();
  if (!arg->is_object())
    return BadRequest("argument must be an object");

  AuthArgs args;
  auto it = arg->find("User");
  if (it == arg->end() || it->is_null())
    return args; // 视为空用户名，由注册表报 INVALID_PARAM
  if (!it->is_string())
    return BadRequest("User must be a string");
  args.user = it->get<std::string>();
  return args;
}

template <typename Op>
Result<Operation> AuthOp(const json &params) {
  auto args = ParseAuthArgs(params);
  if (!args.ok())
    return args.error();
  return Operation(Op{args.value()});
}

} // namespace

Result<Operation> ParseOperation(const std::string &method, const json &params) {
  if (method == kMethodAuthGenerate)
    return AuthOp<GenerateOp>(params);
  if (method == kMethodAuthFetch)
    return AuthOp<FetchOp>(params);
  if (method == kMethodAuthReset)
    return AuthOp<ResetOp>(params);
  if (method == kMethodServerMemStats)
    return Operation(MemStatsOp{});
  if (method == kMethodServerSysInfo)
    return Operation(SysInfoOp{});
  return Error(ErrorCode::RPC_METHOD_NOT_FOUND, "rpc: can't find method " + method);
}

Result<RpcRequest> DecodeRequest(const std::string &body, json *id_out) {
  json doc = json::parse(body, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded())
    return BadRequest("request body is not valid JSON");
  if (!doc.is_object())
    return BadRequest("request must be a JSON object");

  json id = doc.contains("id") ? doc["id"] : json(nullptr);
  if (id_out)
    *id_out = id;

  auto method = doc.find("method");
  if (method == doc.end() || !method->is_string())
    return BadRequest("method must be a string");

  auto params = doc.find("params");
  auto op = ParseOperation(method->get<std::string>(),
                           params == doc.end() ? json(nullptr) : *params);
  if (!op.ok())
    return op.error();

  RpcRequest req{std::move(op.value()), std::move(id)};
  return req;
}

const char *MethodName(const Operation &op) {
  return std::visit(
      [](const auto &o) -> const char * {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, GenerateOp>)
          return kMethodAuthGenerate;
        else if constexpr (std::is_same_v<T, FetchOp>)
          return kMethodAuthFetch;
        else if constexpr (std::is_same_v<T, ResetOp>)
          return kMethodAuthReset;
        else if constexpr (std::is_same_v<T, MemStatsOp>)
          return kMethodServerMemStats;
        else {
          static_assert(std::is_same_v<T, SysInfoOp>, "unhandled operation");
          return kMethodServerSysInfo;
        }
      },
      op);
}

Result<json> DecodeReply(const std::string &body, const json &expected_id) {
  json doc = json::parse(body, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded() || !doc.is_object())
    return Error(ErrorCode::RPC_TRANSPORT_ERROR, "unparsable reply");

  auto err = doc.find("error");
  if (err != doc.end() && !err->is_null()) {
    if (!err->is_object())
      return Error(ErrorCode::RPC_TRANSPORT_ERROR, "reply error is not an object");
    auto code_it = err->find("code");
    auto msg_it = err->find("message");
    if (code_it == err->end() || !code_it->is_number_integer())
      return Error(ErrorCode::RPC_TRANSPORT_ERROR, "reply error has no integer code");
    auto code = static_cast<ErrorCode>(code_it->get<int>());
    std::string message = (msg_it != err->end() && msg_it->is_string())
                              ? msg_it->get<std::string>()
                              : std::string(ErrorCodeToString(code));
    return Error(code, message);
  }

  auto id = doc.find("id");
  if (id == doc.end() || *id != expected_id)
    return Error(ErrorCode::RPC_TRANSPORT_ERROR, "reply id mismatch");
  auto result = doc.find("result");
  if (result == doc.end())
    return json();
  return *result;
}

// ============================================================================
// 编码
// ============================================================================

std::string EncodeRequest(const std::string &method, const json &arg, const json &id) {
  json j;
  j["method"] = method;
  j["params"] = json::array({arg});
  j["id"] = id;
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string EncodeResult(const json &result, const json &id) {
  json j;
  j["result"] = result;
  j["error"] = nullptr;
  j["id"] = id;
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string EncodeError(const Error &error, const json &id) {
  json j;
  j["result"] = nullptr;
  j["error"] = {{"code", error.Code()},
                {"kind", ErrorCodeToKind(error.code)},
                {"message", error.message}};
  j["id"] = id;
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace keyward::ctl

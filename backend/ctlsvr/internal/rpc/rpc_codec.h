#pragma once

/**
 * @file rpc_codec.h
 * @brief JSON-RPC 编解码
 *
 * 请求：{"method": "Auth.Generate", "params": [{"User": "alice"}], "id": 1}
 *       params 也可直接是对象；id 原样回显，缺省为 null
 * 成功：{"result": {...}, "error": null, "id": 1}
 * 失败：{"result": null, "error": {"code": 5, "kind": "AlreadyExists", "message": "..."}, "id": 1}
 */

#include <string>

#include <nlohmann/json.hpp>

#include "keyward/error_code.h"
#include "rpc_types.h"

namespace keyward::ctl {

struct RpcRequest {
  Operation op;
  nlohmann::json id;
};

/**
 * 解码请求体。失败时返回 RPC_INVALID_REQUEST / RPC_METHOD_NOT_FOUND；
 * 只要 JSON 可解析，id 就会写入 *id_out，便于错误响应回显。
 */
Result<RpcRequest> DecodeRequest(const std::string &body, nlohmann::json *id_out);

/**
 * 方法名 + 参数 -> Operation
 */
Result<Operation> ParseOperation(const std::string &method, const nlohmann::json &params);

// Operation -> 方法名
const char *MethodName(const Operation &op);

// 编码请求（客户端使用）
std::string EncodeRequest(const std::string &method, const nlohmann::json &arg, const nlohmann::json &id);

/**
 * 解码响应体（客户端使用）：返回 result；error 非空时按其 code/message 还原 Error。
 * 响应不是预期结构或 id 不匹配时返回 RPC_TRANSPORT_ERROR。
 */
Result<nlohmann::json> DecodeReply(const std::string &body, const nlohmann::json &expected_id);

std::string EncodeResult(const nlohmann::json &result, const nlohmann::json &id);
std::string EncodeError(const Error &error, const nlohmann::json &id);

// 结构体 <-> JSON（nlohmann ADL 约定）
void to_json(nlohmann::json &j, const AuthArgs &args);
void to_json(nlohmann::json &j, const AuthReply &reply);
void from_json(const nlohmann::json &j, AuthReply &reply);
void to_json(nlohmann::json &j, const MemStatsReply &reply);
void from_json(const nlohmann::json &j, MemStatsReply &reply);
void to_json(nlohmann::json &j, const SysInfoReply &reply);
void from_json(const nlohmann::json &j, SysInfoReply &reply);

} // namespace keyward::ctl

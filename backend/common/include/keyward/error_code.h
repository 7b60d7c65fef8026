#pragma once

/**
 * @file error_code.h
 * @brief keyward 错误码与结果类型定义
 *
 * 编码规则：
 *   0        - 成功
 *   1-99     - 通用错误
 *   100-199  - 凭证错误 (CtlSvr)
 *   800-899  - 存储错误
 *   900-999  - 网络/RPC错误
 */

#include <string>
#include <variant>
#include <unordered_map>

namespace keyward {

// ============================================================================
// 错误码枚举
// ============================================================================

enum class ErrorCode {
    // ========== 成功 ==========
    OK = 0,

    // ========== 通用错误 1-99 ==========
    UNKNOWN = 1,
    INVALID_PARAM = 2,             // 参数非法（用户名为空或格式错误）
    INTERNAL_ERROR = 3,
    NOT_FOUND = 4,                 // 凭证不存在
    ALREADY_EXISTS = 5,            // 凭证已存在（需改用 Reset）

    // ========== 凭证错误 100-199 ==========
    ENTROPY_UNAVAILABLE = 100,     // 随机源不可用

    // ========== 存储错误 800-899 ==========
    STORAGE_ERROR = 800,           // 存储读写失败
    DATA_CORRUPTED = 801,          // 存储数据损坏

    // ========== 网络/RPC错误 900-999 ==========
    RPC_INVALID_REQUEST = 900,     // 请求体无法解析
    RPC_METHOD_NOT_FOUND = 901,    // 未知方法名
    RPC_UNSUPPORTED_MEDIA_TYPE = 902,
    RPC_METHOD_NOT_ALLOWED = 903,  // 非 POST
    RPC_PATH_NOT_FOUND = 904,
    RPC_TRANSPORT_ERROR = 905,     // 客户端：连接/读写失败或响应无法解析
};

// ============================================================================
// 错误码转字符串
// ============================================================================

/**
 * 获取错误码描述
 */
inline const char* ErrorCodeToString(ErrorCode code) {
    static const std::unordered_map<ErrorCode, const char*> messages = {
        {ErrorCode::OK, "success"},

        {ErrorCode::UNKNOWN, "unknown error"},
        {ErrorCode::INVALID_PARAM, "invalid parameter"},
        {ErrorCode::INTERNAL_ERROR, "internal error"},
        {ErrorCode::NOT_FOUND, "not found"},
        {ErrorCode::ALREADY_EXISTS, "already exists"},

        {ErrorCode::ENTROPY_UNAVAILABLE, "entropy source unavailable"},

        {ErrorCode::STORAGE_ERROR, "storage error"},
        {ErrorCode::DATA_CORRUPTED, "data corrupted"},

        {ErrorCode::RPC_INVALID_REQUEST, "invalid rpc request"},
        {ErrorCode::RPC_METHOD_NOT_FOUND, "rpc method not found"},
        {ErrorCode::RPC_UNSUPPORTED_MEDIA_TYPE, "unsupported content type"},
        {ErrorCode::RPC_METHOD_NOT_ALLOWED, "method not allowed"},
        {ErrorCode::RPC_PATH_NOT_FOUND, "path not found"},
        {ErrorCode::RPC_TRANSPORT_ERROR, "rpc transport error"},
    };

    auto it = messages.find(code);
    return it != messages.end() ? it->second : "unknown error";
}

/**
 * 错误分类名，写入 RPC 错误体的 kind 字段，供调用方区分同为 400 的错误
 */
inline const char* ErrorCodeToKind(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:                         return "OK";
        case ErrorCode::INVALID_PARAM:              return "InvalidArgument";
        case ErrorCode::NOT_FOUND:                  return "NotFound";
        case ErrorCode::ALREADY_EXISTS:             return "AlreadyExists";
        case ErrorCode::STORAGE_ERROR:
        case ErrorCode::DATA_CORRUPTED:             return "Storage";
        case ErrorCode::RPC_INVALID_REQUEST:        return "InvalidRequest";
        case ErrorCode::RPC_METHOD_NOT_FOUND:       return "MethodNotFound";
        case ErrorCode::RPC_UNSUPPORTED_MEDIA_TYPE: return "UnsupportedMediaType";
        case ErrorCode::RPC_METHOD_NOT_ALLOWED:     return "MethodNotAllowed";
        case ErrorCode::RPC_PATH_NOT_FOUND:         return "PathNotFound";
        case ErrorCode::RPC_TRANSPORT_ERROR:        return "Transport";
        default:                                    return "Internal";
    }
}

inline int ErrorCodeToInt(ErrorCode code) {
    return static_cast<int>(code);
}

// ============================================================================
// Error 类
// ============================================================================

/**
 * 错误信息
 */
struct Error {
    ErrorCode code;
    std::string message;

    Error(ErrorCode c = ErrorCode::OK)
        : code(c), message(ErrorCodeToString(c)) {}

    Error(ErrorCode c, const std::string& msg)
        : code(c), message(msg) {}

    bool ok() const { return code == ErrorCode::OK; }

    int Code() const { return ErrorCodeToInt(code); }

    // 便于日志输出
    std::string ToString() const {
        return "[" + std::to_string(Code()) + "] " + message;
    }
};

// ============================================================================
// Result<T> 模板类
// ============================================================================

/**
 * 结果类型（携带返回值或错误）
 *
 * @example
 *   Result<Credential> Fetch(const std::string& name) {
 *       if (name.empty()) return ErrorCode::INVALID_PARAM;
 *       // ...
 *       return cred;
 *   }
 *
 *   auto result = registry.Fetch("alice");
 *   if (result) {
 *       LogInfo("AccessKeyID: " << result->access_key_id);
 *   } else {
 *       LogError(result.error().ToString());
 *   }
 */
template<typename T>
class Result {
public:
    // 成功构造
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}

    // 失败构造
    Result(const Error& error) : data_(error) {}
    Result(Error&& error) : data_(std::move(error)) {}
    Result(ErrorCode code) : data_(Error(code)) {}
    Result(ErrorCode code, const std::string& msg) : data_(Error(code, msg)) {}

    // 状态判断
    bool ok() const { return std::holds_alternative<T>(data_); }
    operator bool() const { return ok(); }

    // 获取值（成功时）
    const T& value() const { return std::get<T>(data_); }
    T& value() { return std::get<T>(data_); }

    const T* operator->() const { return &std::get<T>(data_); }
    T* operator->() { return &std::get<T>(data_); }

    const T& operator*() const { return value(); }
    T& operator*() { return value(); }

    // 获取错误（失败时）
    const Error& error() const { return std::get<Error>(data_); }

private:
    std::variant<T, Error> data_;
};

// ============================================================================
// Status 类（无返回值）
// ============================================================================

/**
 * 状态类型（仅表示成功/失败，无返回值）
 *
 * @example
 *   Status Put(const Credential& cred) {
 *       if (!db) return ErrorCode::STORAGE_ERROR;
 *       // ...
 *       return Status::OK();
 *   }
 */
class Status {
public:
    Status() : error_(ErrorCode::OK) {}
    Status(ErrorCode code) : error_(code) {}
    Status(ErrorCode code, const std::string& msg) : error_(code, msg) {}
    Status(const Error& error) : error_(error) {}

    bool ok() const { return error_.ok(); }
    operator bool() const { return ok(); }

    const Error& error() const { return error_; }
    ErrorCode code() const { return error_.code; }
    const std::string& message() const { return error_.message; }

    static Status OK() { return Status(); }

private:
    Error error_;
};

}  // namespace keyward

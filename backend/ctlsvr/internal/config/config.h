#pragma once

#include <string>

namespace keyward::ctl {

/**
 * CtlSvr 配置
 *
 * 加载顺序：默认值 -> 配置文件（若存在）-> 环境变量（覆盖）
 *
 * 环境变量（可选覆盖）：
 *   CTLSVR_CONFIG               配置文件路径（main 未传参时使用）
 *   CTLSVR_HOST                 监听地址，默认 0.0.0.0
 *   CTLSVR_PORT                 监听端口，默认 9001
 *   CTLSVR_WORKER_THREADS       io_context 线程数，默认 4
 *   CTLSVR_REQUEST_TIMEOUT_SEC  单个请求读超时，默认 30
 *   CTLSVR_STORE_TYPE           存储类型：rocksdb / memory
 *   CTLSVR_ROCKSDB_PATH         RocksDB 数据目录
 *   CTLSVR_LOG_DIR              日志目录
 *   CTLSVR_LOG_LEVEL            日志级别：TRACE/DEBUG/INFO/WARN/ERROR
 */
struct CtlConfig {
  // 服务配置
  std::string host = "0.0.0.0";
  int port = 9001;
  int worker_threads = 4;
  int request_timeout_sec = 30;

  // 存储配置
  std::string store_type = "rocksdb"; // rocksdb / memory
  std::string rocksdb_path = "/data/ctl";

  // 日志配置
  std::string log_dir = "/data/logs";
  std::string log_level = "INFO";
};

/**
 * 加载配置
 * @param config_file key=value 格式（# 注释）；不存在时只用默认值 + 环境变量
 */
CtlConfig LoadConfig(const std::string &config_file);

/**
 * 校验配置，返回空串表示合法，否则为错误描述
 */
std::string ValidateConfig(const CtlConfig &config);

} // namespace keyward::ctl

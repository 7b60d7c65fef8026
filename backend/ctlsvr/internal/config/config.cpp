#include "config.h"
#include "keyward/config_loader.h"

namespace keyward::ctl {

CtlConfig LoadConfig(const std::string& config_file) {
    keyward::KeyValueConfig kv = keyward::LoadKeyValueConfig(config_file, "CTLSVR_");

    CtlConfig config;
    config.host = kv.Get("host", config.host);
    config.port = kv.GetInt("port", config.port);
    config.worker_threads = kv.GetInt("worker_threads", config.worker_threads);
    config.request_timeout_sec = kv.GetInt("request_timeout_sec", config.request_timeout_sec);

    config.store_type = kv.Get("store_type", config.store_type);
    config.rocksdb_path = kv.Get("rocksdb_path", config.rocksdb_path);

    config.log_dir = kv.Get("log_dir", config.log_dir);
    config.log_level = kv.Get("log_level", config.log_level);

    return config;
}

std::string ValidateConfig(const CtlConfig& config) {
    if (config.port < 0 || config.port > 65535)
        return "port out of range: " + std::to_string(config.port);
    if (config.worker_threads < 1)
        return "worker_threads must be >= 1";
    if (config.request_timeout_sec < 1)
        return "request_timeout_sec must be >= 1";
    if (config.store_type != "rocksdb" && config.store_type != "memory")
        return "unsupported store_type: " + config.store_type;
    if (config.store_type == "rocksdb" && config.rocksdb_path.empty())
        return "rocksdb_path is required for store_type=rocksdb";
    return "";
}

}  // namespace keyward::ctl

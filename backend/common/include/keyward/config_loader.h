#pragma once

/**
 * @file config_loader.h
 * @brief key=value 配置加载：文件解析 + 环境变量覆盖。
 *
 * 文件格式：
 *   # 注释
 *   port = 9001
 *   rocksdb_path = "/data/ctl"   # 行尾注释，值可加引号
 *
 * 用法：
 *   auto cfg = keyward::LoadKeyValueConfig("ctlsvr.conf", "CTLSVR_");
 *   int port = cfg.GetInt("port", 9001);
 */

#include <cstdint>
#include <string>
#include <unordered_map>

namespace keyward {

/**
 * 键值对配置。键不区分大小写（内部统一小写），环境变量优先于文件。
 */
class KeyValueConfig {
public:
    KeyValueConfig() = default;

    /**
     * 读取配置文件；文件不存在返回 false，此时保持已有内容不变。
     */
    bool LoadFile(const std::string& path);

    /**
     * 解析一段配置文本（与文件格式相同），便于测试与内嵌默认配置。
     */
    void LoadString(const std::string& text);

    /**
     * 用 <prefix>XXX 形式的环境变量覆盖，去掉前缀后作为 key。
     * 例如 prefix="CTLSVR_" 时，CTLSVR_PORT=9002 -> port=9002
     */
    void ApplyEnvOverrides(const std::string& env_prefix);

    void Set(const std::string& key, const std::string& value);
    bool Has(const std::string& key) const;

    std::string Get(const std::string& key, const std::string& default_val) const;
    int GetInt(const std::string& key, int default_val) const;
    int64_t GetInt64(const std::string& key, int64_t default_val) const;
    bool GetBool(const std::string& key, bool default_val) const;

    size_t Size() const { return map_.size(); }

private:
    void ParseLine(const std::string& raw);

    std::unordered_map<std::string, std::string> map_;
};

/**
 * 读文件并应用环境变量覆盖。
 */
KeyValueConfig LoadKeyValueConfig(const std::string& path,
                                  const std::string& env_prefix);

}  // namespace keyward

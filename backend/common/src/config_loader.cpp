#include "keyward/config_loader.h"
#include "keyward/utils.h"

#include <cstdlib>
#include <fstream>
#include <sstream>

#include <unistd.h>  // environ

namespace keyward {

namespace {

/// 去掉成对的首尾引号
std::string Unquote(const std::string& v) {
    if (v.size() >= 2) {
        char q = v.front();
        if ((q == '"' || q == '\'') && v.back() == q)
            return v.substr(1, v.size() - 2);
    }
    return v;
}

/// 截掉引号之外的 # 行尾注释
std::string StripComment(const std::string& line) {
    char quote = 0;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quote) {
            if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return line.substr(0, i);
        }
    }
    return line;
}

}  // namespace

void KeyValueConfig::ParseLine(const std::string& raw) {
    std::string line = utils::Trim(StripComment(raw));
    if (line.empty())
        return;
    size_t eq = line.find('=');
    if (eq == std::string::npos)
        return;
    std::string key = utils::Trim(line.substr(0, eq));
    if (key.empty())
        return;
    map_[utils::ToLower(key)] = Unquote(utils::Trim(line.substr(eq + 1)));
}

bool KeyValueConfig::LoadFile(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open())
        return false;
    std::string line;
    while (std::getline(f, line))
        ParseLine(line);
    return true;
}

void KeyValueConfig::LoadString(const std::string& text) {
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line))
        ParseLine(line);
}

void KeyValueConfig::ApplyEnvOverrides(const std::string& env_prefix) {
    const std::string prefix = utils::ToUpper(env_prefix);
    for (char** p = environ; *p != nullptr; ++p) {
        std::string env(*p);
        size_t eq = env.find('=');
        if (eq == std::string::npos || eq <= prefix.size())
            continue;
        std::string name = utils::ToUpper(env.substr(0, eq));
        if (!utils::StartsWith(name, prefix))
            continue;
        map_[utils::ToLower(name.substr(prefix.size()))] = env.substr(eq + 1);
    }
}

void KeyValueConfig::Set(const std::string& key, const std::string& value) {
    map_[utils::ToLower(key)] = value;
}

bool KeyValueConfig::Has(const std::string& key) const {
    return map_.count(utils::ToLower(key)) > 0;
}

std::string KeyValueConfig::Get(const std::string& key, const std::string& default_val) const {
    auto it = map_.find(utils::ToLower(key));
    return it == map_.end() ? default_val : it->second;
}

int KeyValueConfig::GetInt(const std::string& key, int default_val) const {
    return utils::ToInt32(Get(key, ""), default_val);
}

int64_t KeyValueConfig::GetInt64(const std::string& key, int64_t default_val) const {
    return utils::ToInt64(Get(key, ""), default_val);
}

bool KeyValueConfig::GetBool(const std::string& key, bool default_val) const {
    std::string v = utils::ToLower(Get(key, ""));
    if (v == "1" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "no" || v == "off")
        return false;
    return default_val;
}

KeyValueConfig LoadKeyValueConfig(const std::string& path, const std::string& env_prefix) {
    KeyValueConfig cfg;
    cfg.LoadFile(path);
    cfg.ApplyEnvOverrides(env_prefix);
    return cfg;
}

}  // namespace keyward

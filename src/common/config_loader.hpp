#pragma once

#include "common/config.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace guard {
namespace common {

class ConfigLoader {
public:
    static AppConfig Load(const std::string& path);
    static AppConfig LoadFromEnvOrDefault();
    // 校验密钥等必填项, 不合法时抛出 std::runtime_error
    static void Validate(const AppConfig& config);
private:
    static AppConfig FromJson(const nlohmann::json& j);
    static void ApplyEnvOverrides(AppConfig& config);
    static nlohmann::json ReadFile(const std::string& path);
};

// 获取全局配置单例
const AppConfig& GlobalConfig();

}
}

#pragma once

#include "cache/kv_store.hpp"
#include "common/config.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"

// Redis++库头文件
#include <sw/redis++/redis++.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace guard {
namespace cache {

class RedisClient : public KvStore {
public:
    explicit RedisClient(const guard::common::RedisConfig& config);
    ~RedisClient() override;

    // 连接到Redis服务器
    guard::common::Status Connect();

    // 设置键值对并设置过期时间
    guard::common::Status Set(const std::string& key, const std::string& value,
                              std::chrono::seconds ttl) override;

    // 获取键对应的值
    guard::common::StatusOr<std::string> Get(const std::string& key) override;

    // 删除键
    guard::common::Status Del(const std::string& key) override;

    // 按模式列出键 (SCAN, 不阻塞服务器)
    guard::common::StatusOr<std::vector<std::string>> Keys(const std::string& pattern) override;

    // 检查键是否存在
    guard::common::StatusOr<bool> Exists(const std::string& key) override;

private:
    guard::common::RedisConfig config_; // Redis配置
    std::mutex connect_mutex_;
    std::shared_ptr<sw::redis::Redis> redis_; // Redis连接对象
};

} // namespace cache
} // namespace guard

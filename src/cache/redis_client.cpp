#include "cache/redis_client.hpp"

#include <algorithm>
#include <chrono>
#include <iterator>

namespace guard {
namespace cache {

namespace {
// 每次 SCAN 的建议批量
constexpr long long kScanBatch = 100;
} // namespace

// 构造函数
RedisClient::RedisClient(const guard::common::RedisConfig& config)
    : config_(config) {}

// 析构函数
RedisClient::~RedisClient() = default;

// 连接到Redis服务器
guard::common::Status RedisClient::Connect() {
    if (!config_.enabled) {
        return guard::common::Status::Unavailable("Redis is disabled in the configuration.");
    }
    std::lock_guard<std::mutex> lock(connect_mutex_);
    if (redis_) {
        return guard::common::Status::OK(); // 已经连接
    }

    try {
        sw::redis::ConnectionOptions opts; // Redis连接选项
        opts.host = config_.host;
        opts.port = config_.port;
        if (!config_.password.empty()) {
            opts.password = config_.password;
        }
        opts.db = config_.db;
        opts.connect_timeout = std::chrono::milliseconds(config_.connection_timeout_ms);
        opts.socket_timeout = std::chrono::milliseconds(config_.socket_timeout_ms);

        // 创建连接池选项
        sw::redis::ConnectionPoolOptions pool_opts;
        pool_opts.size = static_cast<size_t>(config_.pool_size);
        pool_opts.wait_timeout = std::chrono::milliseconds(config_.connection_timeout_ms);

        redis_ = std::make_shared<sw::redis::Redis>(opts, pool_opts);
        return guard::common::Status::OK();
    } catch (const sw::redis::Error& err) {
        return guard::common::Status::Unavailable("Failed to connect to Redis: " + std::string(err.what()));
    }
}

// 设置键值对 (ttl 为 0 时不过期)
guard::common::Status RedisClient::Set(const std::string& key, const std::string& value,
                                       std::chrono::seconds ttl) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }

    try {
        if (ttl.count() > 0) {
            redis_->set(key, value, ttl);
        } else {
            redis_->set(key, value);
        }
        return guard::common::Status::OK();
    } catch (const sw::redis::Error& err) {
        return guard::common::Status::Unavailable("Failed to set key in Redis: " + std::string(err.what()));
    }
}

// 获取键对应的值
guard::common::StatusOr<std::string> RedisClient::Get(const std::string& key) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }

    try {
        auto val = redis_->get(key);
        if (!val) {
            return guard::common::Status::NotFound("Key not found in Redis: " + key);
        }
        return guard::common::StatusOr<std::string>(*val);
    } catch (const sw::redis::Error& err) {
        return guard::common::Status::Unavailable("Failed to get key from Redis: " + std::string(err.what()));
    }
}

// 删除键
guard::common::Status RedisClient::Del(const std::string& key) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }

    try {
        redis_->del(key);
        return guard::common::Status::OK();
    } catch (const sw::redis::Error& err) {
        return guard::common::Status::Unavailable("Failed to delete key from Redis: " + std::string(err.what()));
    }
}

// 按模式列出键
guard::common::StatusOr<std::vector<std::string>> RedisClient::Keys(const std::string& pattern) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }

    try {
        std::vector<std::string> keys;
        long long cursor = 0;
        do {
            cursor = redis_->scan(cursor, pattern, kScanBatch, std::back_inserter(keys));
        } while (cursor != 0);
        // SCAN 可能返回重复的键
        std::sort(keys.begin(), keys.end());
        keys.erase(std::unique(keys.begin(), keys.end()), keys.end());
        return guard::common::StatusOr<std::vector<std::string>>(std::move(keys));
    } catch (const sw::redis::Error& err) {
        return guard::common::Status::Unavailable("Failed to scan keys in Redis: " + std::string(err.what()));
    }
}

// 检查键是否存在
guard::common::StatusOr<bool> RedisClient::Exists(const std::string& key) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }

    try {
        auto count = redis_->exists(key);
        return guard::common::StatusOr<bool>(count > 0);
    } catch (const sw::redis::Error& err) {
        return guard::common::Status::Unavailable("Failed to check key existence in Redis: " + std::string(err.what()));
    }
}

} // namespace cache
} // namespace guard

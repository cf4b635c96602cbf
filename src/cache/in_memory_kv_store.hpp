#pragma once

#include "cache/kv_store.hpp"
#include "common/clock.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace guard {
namespace cache {

// 基于内存的键值存储 (单进程部署与测试使用)
// 过期的键在读取时惰性清除
class InMemoryKvStore : public KvStore {
public:
    explicit InMemoryKvStore(std::shared_ptr<const guard::common::Clock> clock = nullptr);

    guard::common::Status Set(const std::string& key, const std::string& value,
                              std::chrono::seconds ttl) override;
    guard::common::StatusOr<std::string> Get(const std::string& key) override;
    guard::common::Status Del(const std::string& key) override;
    guard::common::StatusOr<std::vector<std::string>> Keys(const std::string& pattern) override;
    guard::common::StatusOr<bool> Exists(const std::string& key) override;

    // 剩余存活时间; 不存在返回 -2s, 不过期返回 -1s (与 Redis TTL 语义一致)
    std::chrono::seconds Ttl(const std::string& key) const;

private:
    struct Entry {
        std::string value;
        std::int64_t expires_at_ms = 0; // 0 表示不过期
    };

    bool Expired(const Entry& entry, std::int64_t now_ms) const {
        return entry.expires_at_ms != 0 && entry.expires_at_ms <= now_ms;
    }

    std::shared_ptr<const guard::common::Clock> clock_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

// glob 匹配, 支持 '*' '?' 与反斜杠转义
bool GlobMatch(const std::string& pattern, const std::string& text);

} // namespace cache
} // namespace guard

#pragma once

#include "cache/kv_store.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"

#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace guard {
namespace core {

// 用户目录中与令牌相关的字段
struct UserProfile {
    std::string user_id;
    std::string email;
    std::string role;
    bool is_active = true;
};

// 外部用户目录接口 (只读)
class UserDirectory {
public:
    virtual ~UserDirectory() = default;
    // 用户不存在返回 kNotFound, 目录不可用返回 kUnavailable
    virtual guard::common::StatusOr<UserProfile> GetUserById(const std::string& user_id) const = 0;
};

// 基于内存的用户目录
class InMemoryUserDirectory : public UserDirectory {
public:
    guard::common::StatusOr<UserProfile> GetUserById(const std::string& user_id) const override;
    void Upsert(const UserProfile& profile);
    void Remove(const std::string& user_id);

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, UserProfile> users_;
};

// 回调形式的用户目录, 由宿主进程提供查询函数
class CallbackUserDirectory : public UserDirectory {
public:
    using Lookup = std::function<guard::common::StatusOr<UserProfile>(const std::string&)>;

    explicit CallbackUserDirectory(Lookup lookup);
    guard::common::StatusOr<UserProfile> GetUserById(const std::string& user_id) const override;

private:
    Lookup lookup_;
};

// 保存在键值存储中的用户目录: user:<user_id> -> JSON, 不过期
// 多个实例共享同一存储, 重启后仍可查询
class StoredUserDirectory : public UserDirectory {
public:
    StoredUserDirectory(std::shared_ptr<guard::cache::KvStore> store, std::string key_prefix = "guard:");

    guard::common::StatusOr<UserProfile> GetUserById(const std::string& user_id) const override;
    guard::common::Status Upsert(const UserProfile& profile);
    // 用户不存在返回 kNotFound
    guard::common::Status SetActive(const std::string& user_id, bool active);

private:
    std::string KeyFor(const std::string& user_id) const;

    std::shared_ptr<guard::cache::KvStore> store_;
    std::string key_prefix_;
};

} // namespace core
} // namespace guard

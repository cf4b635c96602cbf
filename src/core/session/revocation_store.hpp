#pragma once

#include "cache/kv_store.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace guard {
namespace core {

// 吊销存储:
//   blacklist:<jti>                      -> "true"      (TTL = 令牌剩余寿命)
//   refresh:<user_id>:<session_id>       -> sha256(hex) (每次轮换覆盖)
//   token_version:<user_id>              -> 整数        (不过期)
class RevocationStore {
public:
    RevocationStore(std::shared_ptr<guard::cache::KvStore> store, std::string key_prefix);

    // 幂等; ttl 小于 1 秒按 1 秒处理
    guard::common::Status Blacklist(const std::string& token_id, std::chrono::seconds ttl);
    guard::common::StatusOr<bool> IsBlacklisted(const std::string& token_id);

    guard::common::Status PutRefreshHash(const std::string& user_id
                                         , const std::string& session_id
                                         , const std::string& hash
                                         , std::chrono::seconds ttl);
    // 不存在返回 kNotFound
    guard::common::StatusOr<std::string> GetRefreshHash(const std::string& user_id, const std::string& session_id);
    guard::common::Status DeleteRefreshHash(const std::string& user_id, const std::string& session_id);

    // 未设置时为 1
    guard::common::StatusOr<std::int64_t> GetTokenVersion(const std::string& user_id);
    // 返回递增后的版本号
    guard::common::StatusOr<std::int64_t> BumpTokenVersion(const std::string& user_id);

private:
    std::string BlacklistKey(const std::string& token_id) const;
    std::string RefreshKey(const std::string& user_id, const std::string& session_id) const;
    std::string VersionKey(const std::string& user_id) const;

    std::shared_ptr<guard::cache::KvStore> store_;
    std::string key_prefix_;
};

} // namespace core
} // namespace guard

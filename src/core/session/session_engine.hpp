#pragma once

#include "cache/kv_store.hpp"
#include "common/clock.hpp"
#include "common/config.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/session/errors.hpp"
#include "core/session/revocation_store.hpp"
#include "core/session/session_store.hpp"
#include "core/token/fingerprint.hpp"
#include "core/token/token_codec.hpp"
#include "core/user/user_directory.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace guard {
namespace core {

// 返回给调用方的令牌对 (不持久化)
struct TokenPair {
    std::string access_token;
    std::string refresh_token;
    std::string session_id;
    std::int64_t expires_in = 0;         // 秒
    std::int64_t refresh_expires_in = 0; // 秒
};

// 会话列表项, 指纹已脱敏
struct SessionSummary {
    std::string session_id;
    std::string masked_fingerprint;
    std::string ip_address;
    std::string user_agent;
    std::int64_t created_at_ms = 0;
    std::int64_t last_activity_ms = 0;
    bool is_current = false;
};

// 会话安全引擎
//
// 负责令牌对的签发、校验、轮换与吊销, 以及每用户并发会话上限。
// 引擎本身无状态, 所有可变状态都在 KvStore 中, 多进程共享同一存储即可。
//
// 失败约定:
//   - 令牌/会话校验失败统一返回 kUnauthenticated, 具体原因只写审计日志
//   - 存储故障返回 kUnavailable (调用方应映射为 503)
//   - 刷新时账号已停用返回 kPermissionDenied
class SessionSecurityEngine {
public:
    using Status = guard::common::Status;
    using StatusOrPair = guard::common::StatusOr<TokenPair>;
    using StatusOrClaims = guard::common::StatusOr<AccessClaims>;

    // store 与 users 不能为空, 否则抛出 std::invalid_argument
    SessionSecurityEngine(const guard::common::AuthConfig& config
                          , std::shared_ptr<guard::cache::KvStore> store
                          , std::shared_ptr<const UserDirectory> users
                          , std::shared_ptr<const guard::common::Clock> clock = nullptr
                          , std::string key_prefix = "guard:");

    // 登录成功后签发令牌对, 必要时淘汰最久未活动的会话
    StatusOrPair CreateTokenPair(const std::string& user_id
                                 , const std::string& email
                                 , const std::string& role
                                 , const std::string& ip
                                 , const std::string& user_agent);

    // 校验访问令牌; 指纹不一致时强制失效该会话
    StatusOrClaims ValidateAccessToken(const std::string& token
                                       , const std::string& ip
                                       , const std::string& user_agent);

    // 轮换令牌对, 旧刷新令牌只能使用一次; 会话ID保持不变
    StatusOrPair RefreshTokens(const std::string& refresh_token
                               , const std::string& ip
                               , const std::string& user_agent);

    Status BlacklistToken(const std::string& token_id);
    Status InvalidateSession(const std::string& session_id);
    // 失效用户全部会话并递增令牌版本
    Status InvalidateAllUserSessions(const std::string& user_id);

    // 登出: 拉黑当前访问令牌并失效其会话
    Status EndSession(const std::string& access_token
                      , const std::string& ip
                      , const std::string& user_agent);
    // 活跃会话, 按最近活动时间倒序
    guard::common::StatusOr<std::vector<SessionSummary>> ListUserSessions(
        const std::string& user_id, const std::string& current_session_id = "");
    // 吊销用户的其他会话; 不能吊销当前会话
    Status RevokeUserSession(const std::string& user_id
                             , const std::string& target_session_id
                             , const std::string& current_session_id);

private:
    // 签发访问/刷新令牌并写入刷新令牌哈希
    StatusOrPair IssuePair(const std::string& user_id
                           , const std::string& email
                           , const std::string& role
                           , const std::string& session_id
                           , const std::string& fingerprint
                           , std::int64_t token_version);
    Status EnforceSessionLimit(const std::string& user_id);
    Status InvalidateSessionOf(const std::string& user_id
                               , const std::string& session_id
                               , std::string_view reason);
    // 剩余寿命, 用作黑名单 TTL
    std::chrono::seconds RemainingLifetime(std::int64_t expires_at) const;

    // 记录审计日志并返回折叠后的错误
    Status Reject(std::string_view operation, AuthErrorCode reason, nlohmann::json fields);
    // 存储故障, 原样向上传递
    Status StoreFailure(std::string_view operation, const Status& status);

private:
    guard::common::AuthConfig config_;
    std::shared_ptr<const guard::common::Clock> clock_;
    FingerprintGenerator fingerprints_;
    TokenCodec codec_;
    SessionStore sessions_;
    RevocationStore revocations_;
    std::shared_ptr<const UserDirectory> users_;
};

} // namespace core
} // namespace guard

#include "core/session/session_engine.hpp"

#include "common/audit_log.hpp"
#include "common/crypto.hpp"
#include "common/logger.hpp"

#include <algorithm>
#include <stdexcept>

namespace guard {
namespace core {

namespace {

// 32 字节 -> 64 位十六进制
constexpr std::size_t kSessionIdBytes = 32;

AuthErrorCode FromTokenError(TokenError error) {
    return error == TokenError::kExpired ? AuthErrorCode::kExpiredToken : AuthErrorCode::kInvalidToken;
}

} // namespace

SessionSecurityEngine::SessionSecurityEngine(const guard::common::AuthConfig& config
                                             , std::shared_ptr<guard::cache::KvStore> store
                                             , std::shared_ptr<const UserDirectory> users
                                             , std::shared_ptr<const guard::common::Clock> clock
                                             , std::string key_prefix)
    : config_(config)
    , clock_(clock ? std::move(clock) : std::make_shared<guard::common::SystemClock>())
    , fingerprints_(config.fingerprint_salt)
    , codec_(config, clock_)
    , sessions_(store, key_prefix, std::chrono::seconds(config.session_retention_seconds), clock_)
    , revocations_(store, key_prefix)
    , users_(std::move(users)) {
    if (!store) {
        throw std::invalid_argument("SessionSecurityEngine requires a key-value store");
    }
    if (!users_) {
        throw std::invalid_argument("SessionSecurityEngine requires a user directory");
    }
}

SessionSecurityEngine::StatusOrPair SessionSecurityEngine::CreateTokenPair(const std::string& user_id
                                                                           , const std::string& email
                                                                           , const std::string& role
                                                                           , const std::string& ip
                                                                           , const std::string& user_agent) {
    if (user_id.empty()) {
        return Status::InvalidArgument("user id is empty");
    }

    auto status = EnforceSessionLimit(user_id);
    if (!status.IsOk()) {
        return status;
    }

    auto session_id = guard::common::RandomHex(kSessionIdBytes);
    if (!session_id.IsOk()) {
        return session_id.GetStatus();
    }
    const std::string fingerprint = fingerprints_.Fingerprint(user_agent, ip);

    auto version = revocations_.GetTokenVersion(user_id);
    if (!version.IsOk()) {
        return StoreFailure("create", version.GetStatus());
    }

    const std::int64_t now_ms = clock_->NowMillis();
    SessionRecord record;
    record.session_id = session_id.Value();
    record.user_id = user_id;
    record.device_fingerprint = fingerprint;
    record.ip_address = ip;
    record.user_agent = user_agent;
    record.created_at_ms = now_ms;
    record.last_activity_ms = now_ms;
    record.is_active = true;

    status = sessions_.Put(record);
    if (!status.IsOk()) {
        return StoreFailure("create", status);
    }

    auto pair = IssuePair(user_id, email, role, record.session_id, fingerprint, version.Value());
    if (!pair.IsOk()) {
        // 没有可用令牌的会话不能占用名额
        auto rollback = sessions_.MarkInactive(user_id, record.session_id);
        if (!rollback.IsOk()) {
            GUARD_LOG_ERROR("[SessionEngine] Failed to roll back session {}: {}",
                            record.session_id, rollback.Message());
        }
        return pair.GetStatus();
    }

    guard::common::Audit("session.created", {
        {"user_id", user_id},
        {"session_id", record.session_id},
        {"ip", ip},
    }, clock_.get());
    GUARD_LOG_INFO("[SessionEngine] Session created for user {}", user_id);
    return pair;
}

SessionSecurityEngine::StatusOrClaims SessionSecurityEngine::ValidateAccessToken(const std::string& token
                                                                                 , const std::string& ip
                                                                                 , const std::string& user_agent) {
    constexpr std::string_view kOp = "validate";
    if (token.empty()) {
        return Reject(kOp, AuthErrorCode::kInvalidToken, {{"ip", ip}});
    }

    // 黑名单先于签名校验
    const std::string token_id = TokenCodec::PeekTokenId(token);
    if (token_id.empty()) {
        return Reject(kOp, AuthErrorCode::kInvalidToken, {{"ip", ip}});
    }
    auto blacklisted = revocations_.IsBlacklisted(token_id);
    if (!blacklisted.IsOk()) {
        return StoreFailure(kOp, blacklisted.GetStatus());
    }
    if (blacklisted.Value()) {
        return Reject(kOp, AuthErrorCode::kBlacklisted, {{"jti", token_id}, {"ip", ip}});
    }

    auto verified = codec_.VerifyAccess(token);
    if (!verified.IsOk()) {
        return Reject(kOp, FromTokenError(verified.error), {
            {"ip", ip},
            {"detail", verified.detail},
        });
    }
    const AccessClaims& claims = verified.claims;

    auto session = sessions_.Get(claims.user_id, claims.session_id);
    if (!session.IsOk()) {
        if (session.GetStatus().Code() != guard::common::StatusCode::kNotFound) {
            return StoreFailure(kOp, session.GetStatus());
        }
        return Reject(kOp, AuthErrorCode::kSessionInactive, {
            {"user_id", claims.user_id},
            {"session_id", claims.session_id},
        });
    }
    if (!session.Value().is_active) {
        return Reject(kOp, AuthErrorCode::kSessionInactive, {
            {"user_id", claims.user_id},
            {"session_id", claims.session_id},
        });
    }

    // 与签发时写入令牌的指纹比较
    if (!fingerprints_.Matches(claims.device_fingerprint, user_agent, ip)) {
        auto status = InvalidateSessionOf(claims.user_id, claims.session_id, "fingerprint_mismatch");
        if (!status.IsOk()) {
            GUARD_LOG_ERROR("[SessionEngine] Failed to invalidate session {}: {}",
                            claims.session_id, status.Message());
        }
        return Reject(kOp, AuthErrorCode::kFingerprintMismatch, {
            {"user_id", claims.user_id},
            {"session_id", claims.session_id},
            {"ip", ip},
        });
    }

    // 活动时间更新失败不影响校验结果
    auto touched = sessions_.Touch(claims.user_id, claims.session_id);
    if (!touched.IsOk()) {
        GUARD_LOG_WARN("[SessionEngine] Failed to update activity for session {}: {}",
                       claims.session_id, touched.Message());
    }
    return StatusOrClaims(std::move(verified.claims));
}

SessionSecurityEngine::StatusOrPair SessionSecurityEngine::RefreshTokens(const std::string& refresh_token
                                                                         , const std::string& ip
                                                                         , const std::string& user_agent) {
    constexpr std::string_view kOp = "refresh";
    auto verified = codec_.VerifyRefresh(refresh_token);
    if (!verified.IsOk()) {
        return Reject(kOp, FromTokenError(verified.error), {
            {"ip", ip},
            {"detail", verified.detail},
        });
    }
    const RefreshClaims& claims = verified.claims;

    // 已轮换或被显式拉黑的刷新令牌
    auto blacklisted = revocations_.IsBlacklisted(claims.token_id);
    if (!blacklisted.IsOk()) {
        return StoreFailure(kOp, blacklisted.GetStatus());
    }
    if (blacklisted.Value()) {
        return Reject(kOp, AuthErrorCode::kBlacklisted, {
            {"user_id", claims.user_id},
            {"jti", claims.token_id},
        });
    }

    // 只有最近一次签发的刷新令牌可用
    auto stored = revocations_.GetRefreshHash(claims.user_id, claims.session_id);
    if (!stored.IsOk()) {
        if (stored.GetStatus().Code() != guard::common::StatusCode::kNotFound) {
            return StoreFailure(kOp, stored.GetStatus());
        }
        return Reject(kOp, AuthErrorCode::kInvalidToken, {
            {"user_id", claims.user_id},
            {"session_id", claims.session_id},
            {"detail", "refresh token not registered"},
        });
    }
    const std::string presented = guard::common::Sha256Hex(refresh_token);
    if (presented.empty() || !guard::common::ConstantTimeEquals(presented, stored.Value())) {
        return Reject(kOp, AuthErrorCode::kInvalidToken, {
            {"user_id", claims.user_id},
            {"session_id", claims.session_id},
            {"detail", "refresh token superseded"},
        });
    }

    auto version = revocations_.GetTokenVersion(claims.user_id);
    if (!version.IsOk()) {
        return StoreFailure(kOp, version.GetStatus());
    }
    if (version.Value() != claims.token_version) {
        return Reject(kOp, AuthErrorCode::kVersionMismatch, {
            {"user_id", claims.user_id},
            {"token_version", claims.token_version},
            {"current_version", version.Value()},
        });
    }

    auto session = sessions_.Get(claims.user_id, claims.session_id);
    if (!session.IsOk()) {
        if (session.GetStatus().Code() != guard::common::StatusCode::kNotFound) {
            return StoreFailure(kOp, session.GetStatus());
        }
        return Reject(kOp, AuthErrorCode::kSessionInactive, {
            {"user_id", claims.user_id},
            {"session_id", claims.session_id},
        });
    }
    const SessionRecord& record = session.Value();
    if (!record.is_active) {
        return Reject(kOp, AuthErrorCode::kSessionInactive, {
            {"user_id", claims.user_id},
            {"session_id", claims.session_id},
        });
    }

    if (!fingerprints_.Matches(record.device_fingerprint, user_agent, ip)) {
        auto status = InvalidateSessionOf(claims.user_id, claims.session_id, "fingerprint_mismatch");
        if (!status.IsOk()) {
            GUARD_LOG_ERROR("[SessionEngine] Failed to invalidate session {}: {}",
                            claims.session_id, status.Message());
        }
        return Reject(kOp, AuthErrorCode::kFingerprintMismatch, {
            {"user_id", claims.user_id},
            {"session_id", claims.session_id},
            {"ip", ip},
        });
    }

    auto user = users_->GetUserById(claims.user_id);
    if (!user.IsOk()) {
        if (user.GetStatus().Code() != guard::common::StatusCode::kNotFound) {
            return StoreFailure(kOp, user.GetStatus());
        }
        return Reject(kOp, AuthErrorCode::kInvalidToken, {
            {"user_id", claims.user_id},
            {"detail", "user not found"},
        });
    }
    if (!user.Value().is_active) {
        return Reject(kOp, AuthErrorCode::kUserInactive, {{"user_id", claims.user_id}});
    }

    // 旧刷新令牌作废, 黑名单保留到它自然过期
    auto status = revocations_.Blacklist(claims.token_id, RemainingLifetime(claims.expires_at));
    if (!status.IsOk()) {
        return StoreFailure(kOp, status);
    }

    auto pair = IssuePair(claims.user_id
                          , user.Value().email
                          , user.Value().role
                          , claims.session_id
                          , record.device_fingerprint
                          , version.Value());
    if (!pair.IsOk()) {
        return pair.GetStatus();
    }

    // 轮换期间会话可能已被登出或吊销, 此时撤回刚写入的刷新令牌
    auto current = sessions_.Get(claims.user_id, claims.session_id);
    if (!current.IsOk() || !current.Value().is_active) {
        auto dropped = revocations_.DeleteRefreshHash(claims.user_id, claims.session_id);
        if (!dropped.IsOk()) {
            GUARD_LOG_ERROR("[SessionEngine] Failed to drop refresh token of session {}: {}",
                            claims.session_id, dropped.Message());
        }
        if (!current.IsOk() && current.GetStatus().Code() != guard::common::StatusCode::kNotFound) {
            return StoreFailure(kOp, current.GetStatus());
        }
        return Reject(kOp, AuthErrorCode::kSessionInactive, {
            {"user_id", claims.user_id},
            {"session_id", claims.session_id},
            {"detail", "session ended during refresh"},
        });
    }

    status = sessions_.Touch(claims.user_id, claims.session_id);
    if (!status.IsOk()) {
        GUARD_LOG_WARN("[SessionEngine] Failed to update activity for session {}: {}",
                       claims.session_id, status.Message());
    }

    guard::common::Audit("session.refreshed", {
        {"user_id", claims.user_id},
        {"session_id", claims.session_id},
        {"ip", ip},
    }, clock_.get());
    return pair;
}

SessionSecurityEngine::Status SessionSecurityEngine::BlacklistToken(const std::string& token_id) {
    if (token_id.empty()) {
        return Status::InvalidArgument("token id is empty");
    }
    auto status = revocations_.Blacklist(token_id, std::chrono::seconds(config_.blacklist_ttl_seconds));
    if (!status.IsOk()) {
        return StoreFailure("blacklist", status);
    }
    guard::common::Audit("token.blacklisted", {{"jti", token_id}}, clock_.get());
    return Status::OK();
}

SessionSecurityEngine::Status SessionSecurityEngine::InvalidateSession(const std::string& session_id) {
    if (session_id.empty()) {
        return Status::InvalidArgument("session id is empty");
    }
    auto owner = sessions_.FindOwner(session_id);
    if (!owner.IsOk()) {
        // 不存在或已过期, 视为已失效
        if (owner.GetStatus().Code() == guard::common::StatusCode::kNotFound) {
            return Status::OK();
        }
        return StoreFailure("invalidate", owner.GetStatus());
    }
    return InvalidateSessionOf(owner.Value(), session_id, "invalidated");
}

SessionSecurityEngine::Status SessionSecurityEngine::InvalidateAllUserSessions(const std::string& user_id) {
    if (user_id.empty()) {
        return Status::InvalidArgument("user id is empty");
    }
    auto sessions = sessions_.ListForUser(user_id);
    if (!sessions.IsOk()) {
        return StoreFailure("invalidate_all", sessions.GetStatus());
    }

    Status first_error = Status::OK();
    for (const auto& session : sessions.Value()) {
        if (!session.is_active) {
            continue;
        }
        auto status = InvalidateSessionOf(user_id, session.session_id, "invalidate_all");
        if (!status.IsOk() && first_error.IsOk()) {
            first_error = status;
        }
    }

    // 版本号递增使所有已签发的刷新令牌失效
    auto version = revocations_.BumpTokenVersion(user_id);
    if (!version.IsOk()) {
        return StoreFailure("invalidate_all", version.GetStatus());
    }
    if (!first_error.IsOk()) {
        return first_error;
    }

    guard::common::Audit("user.sessions_invalidated", {
        {"user_id", user_id},
        {"token_version", version.Value()},
    }, clock_.get());
    GUARD_LOG_INFO("[SessionEngine] All sessions invalidated for user {}", user_id);
    return Status::OK();
}

SessionSecurityEngine::Status SessionSecurityEngine::EndSession(const std::string& access_token
                                                               , const std::string& ip
                                                               , const std::string& user_agent) {
    auto claims = ValidateAccessToken(access_token, ip, user_agent);
    if (!claims.IsOk()) {
        return claims.GetStatus();
    }
    const AccessClaims& current = claims.Value();

    auto status = revocations_.Blacklist(current.token_id, RemainingLifetime(current.expires_at));
    if (!status.IsOk()) {
        return StoreFailure("logout", status);
    }
    return InvalidateSessionOf(current.user_id, current.session_id, "logout");
}

guard::common::StatusOr<std::vector<SessionSummary>> SessionSecurityEngine::ListUserSessions(
    const std::string& user_id, const std::string& current_session_id) {
    auto sessions = sessions_.ListForUser(user_id);
    if (!sessions.IsOk()) {
        return StoreFailure("list", sessions.GetStatus());
    }

    std::vector<SessionRecord> active;
    for (auto& session : sessions.Value()) {
        if (session.is_active) {
            active.push_back(std::move(session));
        }
    }
    std::sort(active.begin(), active.end(), [](const SessionRecord& a, const SessionRecord& b) {
        return a.last_activity_ms > b.last_activity_ms;
    });

    std::vector<SessionSummary> result;
    result.reserve(active.size());
    for (const auto& session : active) {
        SessionSummary summary;
        summary.session_id = session.session_id;
        summary.masked_fingerprint = FingerprintGenerator::Mask(session.device_fingerprint);
        summary.ip_address = session.ip_address;
        summary.user_agent = session.user_agent;
        summary.created_at_ms = session.created_at_ms;
        summary.last_activity_ms = session.last_activity_ms;
        summary.is_current = !current_session_id.empty() && session.session_id == current_session_id;
        result.push_back(std::move(summary));
    }
    return guard::common::StatusOr<std::vector<SessionSummary>>(std::move(result));
}

SessionSecurityEngine::Status SessionSecurityEngine::RevokeUserSession(const std::string& user_id
                                                                      , const std::string& target_session_id
                                                                      , const std::string& current_session_id) {
    if (target_session_id.empty()) {
        return Status::InvalidArgument("session id is empty");
    }
    if (target_session_id == current_session_id) {
        return Status::InvalidArgument("Cannot revoke current session, use logout instead");
    }

    // 只按 user_id 定位, 别人的会话与不存在的会话无法区分
    auto session = sessions_.Get(user_id, target_session_id);
    if (!session.IsOk()) {
        if (session.GetStatus().Code() == guard::common::StatusCode::kNotFound) {
            return Status::NotFound("Session not found");
        }
        return StoreFailure("revoke", session.GetStatus());
    }
    if (!session.Value().is_active) {
        return Status::NotFound("Session not found");
    }
    return InvalidateSessionOf(user_id, target_session_id, "revoked");
}

SessionSecurityEngine::StatusOrPair SessionSecurityEngine::IssuePair(const std::string& user_id
                                                                     , const std::string& email
                                                                     , const std::string& role
                                                                     , const std::string& session_id
                                                                     , const std::string& fingerprint
                                                                     , std::int64_t token_version) {
    AccessClaims access;
    access.user_id = user_id;
    access.email = email;
    access.role = role;
    access.session_id = session_id;
    access.device_fingerprint = fingerprint;
    auto access_token = codec_.SignAccess(access);
    if (!access_token.IsOk()) {
        return access_token.GetStatus();
    }

    RefreshClaims refresh;
    refresh.user_id = user_id;
    refresh.session_id = session_id;
    refresh.token_version = token_version;
    auto refresh_token = codec_.SignRefresh(refresh);
    if (!refresh_token.IsOk()) {
        return refresh_token.GetStatus();
    }

    const std::string hash = guard::common::Sha256Hex(refresh_token.Value());
    if (hash.empty()) {
        return Status::Internal("failed to hash refresh token");
    }
    auto status = revocations_.PutRefreshHash(user_id, session_id, hash, codec_.RefreshTtl());
    if (!status.IsOk()) {
        return StoreFailure("issue", status);
    }

    TokenPair pair;
    pair.access_token = std::move(access_token.Value());
    pair.refresh_token = std::move(refresh_token.Value());
    pair.session_id = session_id;
    pair.expires_in = codec_.AccessTtl().count();
    pair.refresh_expires_in = codec_.RefreshTtl().count();
    return StatusOrPair(std::move(pair));
}

// 活跃会话数达到上限时, 按最近活动时间淘汰最旧的会话
SessionSecurityEngine::Status SessionSecurityEngine::EnforceSessionLimit(const std::string& user_id) {
    if (config_.max_sessions <= 0) {
        return Status::OK();
    }
    auto sessions = sessions_.ListForUser(user_id);
    if (!sessions.IsOk()) {
        return StoreFailure("create", sessions.GetStatus());
    }

    std::vector<SessionRecord> active;
    for (auto& session : sessions.Value()) {
        if (session.is_active) {
            active.push_back(std::move(session));
        }
    }
    const auto limit = static_cast<std::size_t>(config_.max_sessions);
    if (active.size() < limit) {
        return Status::OK();
    }

    std::sort(active.begin(), active.end(), [](const SessionRecord& a, const SessionRecord& b) {
        return a.last_activity_ms < b.last_activity_ms;
    });
    // 为新会话腾出一个位置
    const std::size_t evict = active.size() - limit + 1;
    for (std::size_t i = 0; i < evict; ++i) {
        auto status = InvalidateSessionOf(user_id, active[i].session_id, "evicted");
        if (!status.IsOk()) {
            return status;
        }
    }
    return Status::OK();
}

SessionSecurityEngine::Status SessionSecurityEngine::InvalidateSessionOf(const std::string& user_id
                                                                        , const std::string& session_id
                                                                        , std::string_view reason) {
    auto status = sessions_.MarkInactive(user_id, session_id);
    if (!status.IsOk()) {
        return StoreFailure("invalidate", status);
    }
    status = revocations_.DeleteRefreshHash(user_id, session_id);
    if (!status.IsOk()) {
        return StoreFailure("invalidate", status);
    }
    guard::common::Audit("session.invalidated", {
        {"user_id", user_id},
        {"session_id", session_id},
        {"reason", std::string(reason)},
    }, clock_.get());
    return Status::OK();
}

std::chrono::seconds SessionSecurityEngine::RemainingLifetime(std::int64_t expires_at) const {
    const std::int64_t now = std::chrono::duration_cast<std::chrono::seconds>(
        clock_->Now().time_since_epoch()).count();
    return std::chrono::seconds(std::max<std::int64_t>(expires_at - now, 1));
}

SessionSecurityEngine::Status SessionSecurityEngine::Reject(std::string_view operation
                                                           , AuthErrorCode reason
                                                           , nlohmann::json fields) {
    fields["operation"] = std::string(operation);
    fields["reason"] = AuthErrorToString(reason);
    guard::common::Audit("auth.rejected", std::move(fields), clock_.get());
    return FromAuthError(reason);
}

SessionSecurityEngine::Status SessionSecurityEngine::StoreFailure(std::string_view operation
                                                                 , const Status& status) {
    GUARD_LOG_ERROR("[SessionEngine] {} failed: {}", operation, status.Message());
    if (!status.IsUnavailable()) {
        return status;
    }
    guard::common::Audit("store.unavailable", {
        {"operation", std::string(operation)},
        {"reason", AuthErrorToString(AuthErrorCode::kStoreUnavailable)},
        {"error", status.Message()},
    }, clock_.get());
    return FromAuthError(AuthErrorCode::kStoreUnavailable, status.Message());
}

} // namespace core
} // namespace guard

#pragma once

#include "common/clock.hpp"
#include "common/config.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace guard {
namespace core {

// 访问令牌声明
struct AccessClaims {
    std::string user_id;            // sub
    std::string email;
    std::string role;
    std::string session_id;         // sid
    std::string device_fingerprint; // fpr
    std::string token_id;           // jti
    std::int64_t issued_at = 0;     // 秒
    std::int64_t expires_at = 0;    // 秒
};

// 刷新令牌声明
struct RefreshClaims {
    std::string user_id;
    std::string session_id;
    std::int64_t token_version = 1;
    std::string token_id;
    std::int64_t issued_at = 0;
    std::int64_t expires_at = 0;
};

enum class TokenError {
    kOk = 0,
    kMalformed,        // 结构错误或缺少必需声明
    kInvalidSignature, // 签名/算法不匹配
    kInvalidClaims,    // issuer / audience / token_type 不匹配
    kExpired,
};

const char* TokenErrorToString(TokenError error);

// 校验结果: 预期内的失败不抛异常
template <typename Claims>
struct Verified {
    TokenError error = TokenError::kOk;
    std::string detail;
    Claims claims;

    bool IsOk() const {
        return error == TokenError::kOk;
    }
};

// HS256 JWT 编解码; 访问令牌与刷新令牌使用不同的密钥和 audience
class TokenCodec {
public:
    TokenCodec(const guard::common::AuthConfig& config, std::shared_ptr<const guard::common::Clock> clock);

    // 生成新的 jti 并填充 issued_at / expires_at
    guard::common::StatusOr<std::string> SignAccess(AccessClaims& claims) const;
    guard::common::StatusOr<std::string> SignRefresh(RefreshClaims& claims) const;

    Verified<AccessClaims> VerifyAccess(const std::string& token) const;
    Verified<RefreshClaims> VerifyRefresh(const std::string& token) const;

    // 不校验签名, 只读取 jti; 失败返回空串
    static std::string PeekTokenId(const std::string& token);

    std::chrono::seconds AccessTtl() const { return access_ttl_; }
    std::chrono::seconds RefreshTtl() const { return refresh_ttl_; }

private:
    std::string access_secret_;
    std::string refresh_secret_;
    std::string issuer_;
    std::string access_audience_;
    std::string refresh_audience_;
    std::chrono::seconds access_ttl_;
    std::chrono::seconds refresh_ttl_;
    std::shared_ptr<const guard::common::Clock> clock_;
};

}
}

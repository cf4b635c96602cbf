#include "core/token/token_codec.hpp"

#include "common/crypto.hpp"

#include <jwt-cpp/jwt.h>
#include <jwt-cpp/traits/nlohmann-json/traits.h>

#include <exception>
#include <system_error>

namespace guard {
namespace core {

namespace {

using Traits = jwt::traits::nlohmann_json;
using Claim = jwt::basic_claim<Traits>;

constexpr const char* kAccessType = "access";
constexpr const char* kRefreshType = "refresh";
// 16 字节 -> 32 位十六进制
constexpr std::size_t kTokenIdBytes = 16;

// jwt-cpp 的时钟适配
struct JwtClock {
    const guard::common::Clock* clock;
    jwt::date now() const {
        return clock->Now();
    }
};

std::int64_t ToEpoch(const jwt::date& tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

TokenError FromVerifyError(const std::error_code& ec) {
    if (ec == jwt::error::token_verification_error::token_expired) {
        return TokenError::kExpired;
    }
    if (ec.category() == jwt::error::signature_verification_error_category()) {
        return TokenError::kInvalidSignature;
    }
    return TokenError::kInvalidClaims;
}

// 解码并校验签名与通用声明, 成功后由 extract 读取业务声明
template <typename Claims, typename Extract>
Verified<Claims> DecodeAndVerify(const std::string& token
                                 , const std::string& secret
                                 , const std::string& issuer
                                 , const std::string& audience
                                 , const char* token_type
                                 , const guard::common::Clock* clock
                                 , Extract extract) {
    Verified<Claims> result;
    try {
        auto decoded = jwt::decode<Traits>(token);
        auto verifier = jwt::verify<JwtClock, Traits>(JwtClock{clock})
                            .allow_algorithm(jwt::algorithm::hs256{secret})
                            .with_issuer(issuer)
                            .with_audience(audience)
                            .with_claim("token_type", Claim(std::string(token_type)));
        std::error_code ec;
        verifier.verify(decoded, ec);
        if (ec) {
            result.error = FromVerifyError(ec);
            result.detail = ec.message();
            return result;
        }
        if (!decoded.has_subject() || !decoded.has_id() || !decoded.has_issued_at() || !decoded.has_expires_at()) {
            result.error = TokenError::kMalformed;
            result.detail = "missing registered claims";
            return result;
        }
        result.claims.user_id = decoded.get_subject();
        result.claims.token_id = decoded.get_id();
        result.claims.issued_at = ToEpoch(decoded.get_issued_at());
        result.claims.expires_at = ToEpoch(decoded.get_expires_at());
        if (!extract(decoded, result.claims)) {
            result.error = TokenError::kMalformed;
            result.detail = "missing private claims";
        }
    } catch (const std::exception& ex) {
        // 非法 base64 / JSON / 声明类型错误
        result.error = TokenError::kMalformed;
        result.detail = ex.what();
    }
    return result;
}

} // namespace

const char* TokenErrorToString(TokenError error) {
    switch (error) {
        case TokenError::kOk:
            return "ok";
        case TokenError::kMalformed:
            return "malformed";
        case TokenError::kInvalidSignature:
            return "invalid_signature";
        case TokenError::kInvalidClaims:
            return "invalid_claims";
        case TokenError::kExpired:
            return "expired";
    }
    return "unknown";
}

TokenCodec::TokenCodec(const guard::common::AuthConfig& config
                       , std::shared_ptr<const guard::common::Clock> clock)
    : access_secret_(config.access_secret)
    , refresh_secret_(config.refresh_secret)
    , issuer_(config.issuer)
    , access_audience_(config.access_audience)
    , refresh_audience_(config.refresh_audience)
    , access_ttl_(config.access_ttl_seconds)
    , refresh_ttl_(config.refresh_ttl_seconds)
    , clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = std::make_shared<guard::common::SystemClock>();
    }
}

guard::common::StatusOr<std::string> TokenCodec::SignAccess(AccessClaims& claims) const {
    auto jti = guard::common::RandomHex(kTokenIdBytes);
    if (!jti.IsOk()) {
        return jti.GetStatus();
    }
    const auto now = std::chrono::time_point_cast<std::chrono::seconds>(clock_->Now());
    const auto exp = now + access_ttl_;
    try {
        auto token = jwt::create<Traits>()
                         .set_type("JWT")
                         .set_issuer(issuer_)
                         .set_audience(access_audience_)
                         .set_subject(claims.user_id)
                         .set_id(jti.Value())
                         .set_issued_at(now)
                         .set_expires_at(exp)
                         .set_payload_claim("token_type", Claim(std::string(kAccessType)))
                         .set_payload_claim("email", Claim(claims.email))
                         .set_payload_claim("role", Claim(claims.role))
                         .set_payload_claim("sid", Claim(claims.session_id))
                         .set_payload_claim("fpr", Claim(claims.device_fingerprint))
                         .sign(jwt::algorithm::hs256{access_secret_});
        claims.token_id = jti.Value();
        claims.issued_at = ToEpoch(now);
        claims.expires_at = ToEpoch(exp);
        return guard::common::StatusOr<std::string>(std::move(token));
    } catch (const std::exception& ex) {
        return guard::common::Status::Internal(std::string("failed to sign access token: ") + ex.what());
    }
}

guard::common::StatusOr<std::string> TokenCodec::SignRefresh(RefreshClaims& claims) const {
    auto jti = guard::common::RandomHex(kTokenIdBytes);
    if (!jti.IsOk()) {
        return jti.GetStatus();
    }
    const auto now = std::chrono::time_point_cast<std::chrono::seconds>(clock_->Now());
    const auto exp = now + refresh_ttl_;
    try {
        auto token = jwt::create<Traits>()
                         .set_type("JWT")
                         .set_issuer(issuer_)
                         .set_audience(refresh_audience_)
                         .set_subject(claims.user_id)
                         .set_id(jti.Value())
                         .set_issued_at(now)
                         .set_expires_at(exp)
                         .set_payload_claim("token_type", Claim(std::string(kRefreshType)))
                         .set_payload_claim("sid", Claim(claims.session_id))
                         .set_payload_claim("ver", Claim(nlohmann::json(claims.token_version)))
                         .sign(jwt::algorithm::hs256{refresh_secret_});
        claims.token_id = jti.Value();
        claims.issued_at = ToEpoch(now);
        claims.expires_at = ToEpoch(exp);
        return guard::common::StatusOr<std::string>(std::move(token));
    } catch (const std::exception& ex) {
        return guard::common::Status::Internal(std::string("failed to sign refresh token: ") + ex.what());
    }
}

Verified<AccessClaims> TokenCodec::VerifyAccess(const std::string& token) const {
    return DecodeAndVerify<AccessClaims>(
        token, access_secret_, issuer_, access_audience_, kAccessType, clock_.get(),
        [](const jwt::decoded_jwt<Traits>& decoded, AccessClaims& claims) {
            for (const char* name : {"email", "role", "sid", "fpr"}) {
                if (!decoded.has_payload_claim(name)) {
                    return false;
                }
            }
            claims.email = decoded.get_payload_claim("email").as_string();
            claims.role = decoded.get_payload_claim("role").as_string();
            claims.session_id = decoded.get_payload_claim("sid").as_string();
            claims.device_fingerprint = decoded.get_payload_claim("fpr").as_string();
            return !claims.session_id.empty();
        });
}

Verified<RefreshClaims> TokenCodec::VerifyRefresh(const std::string& token) const {
    return DecodeAndVerify<RefreshClaims>(
        token, refresh_secret_, issuer_, refresh_audience_, kRefreshType, clock_.get(),
        [](const jwt::decoded_jwt<Traits>& decoded, RefreshClaims& claims) {
            if (!decoded.has_payload_claim("sid") || !decoded.has_payload_claim("ver")) {
                return false;
            }
            claims.session_id = decoded.get_payload_claim("sid").as_string();
            claims.token_version = decoded.get_payload_claim("ver").as_integer();
            return !claims.session_id.empty();
        });
}

std::string TokenCodec::PeekTokenId(const std::string& token) {
    try {
        auto decoded = jwt::decode<Traits>(token);
        if (!decoded.has_id()) {
            return std::string();
        }
        return decoded.get_id();
    } catch (const std::exception&) {
        // 无法解码等同于没有 jti, 由调用方拒绝
        return std::string();
    }
}

}
}

#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"

#include <string>

namespace guard {
namespace core {

// 令牌/会话校验失败的具体原因, 只写入审计日志
enum class AuthErrorCode {
    kOk = 0,
    kInvalidToken = 1,
    kExpiredToken = 2,
    kBlacklisted = 3,
    kSessionInactive = 4,
    kFingerprintMismatch = 5,
    kVersionMismatch = 6,
    kStoreUnavailable = 7,
    kUserInactive = 8,
};

inline const char* AuthErrorToString(AuthErrorCode error) {
    switch (error) {
        case AuthErrorCode::kOk:
            return "ok";
        case AuthErrorCode::kInvalidToken:
            return "invalid_token";
        case AuthErrorCode::kExpiredToken:
            return "expired_token";
        case AuthErrorCode::kBlacklisted:
            return "blacklisted";
        case AuthErrorCode::kSessionInactive:
            return "session_inactive";
        case AuthErrorCode::kFingerprintMismatch:
            return "fingerprint_mismatch";
        case AuthErrorCode::kVersionMismatch:
            return "version_mismatch";
        case AuthErrorCode::kStoreUnavailable:
            return "store_unavailable";
        case AuthErrorCode::kUserInactive:
            return "user_inactive";
    }
    return "unknown";
}

// 将 AuthErrorCode 转换为对外的 Status
// 所有令牌类错误折叠为同一个 Unauthenticated, 调用方无法区分原因
inline ::guard::common::Status FromAuthError(AuthErrorCode error, std::string message = "") {
    using ::guard::common::Status;
    switch (error) {
        case AuthErrorCode::kOk:
            return Status::OK();
        case AuthErrorCode::kInvalidToken:
        case AuthErrorCode::kExpiredToken:
        case AuthErrorCode::kBlacklisted:
        case AuthErrorCode::kSessionInactive:
        case AuthErrorCode::kFingerprintMismatch:
        case AuthErrorCode::kVersionMismatch:
            return Status::Unauthenticated("Invalid or expired token");
        case AuthErrorCode::kStoreUnavailable:
            return Status::Unavailable(message.empty() ? "Session store unavailable" : message);
        case AuthErrorCode::kUserInactive:
            return Status::PermissionDenied("Account is deactivated");
    }
    return Status::Internal("Unknown auth error");
}

}
}

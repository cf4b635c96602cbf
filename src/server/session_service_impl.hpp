#pragma once

// 项目头文件
#include "common/logger.hpp"
#include "common/status.hpp"
#include "core/ratelimit/rate_limiter.hpp"
#include "core/session/session_engine.hpp"
#include "core/user/user_directory.hpp"

// gRPC 生成的头文件
#include "session_guard.grpc.pb.h"

// 第三方库
#include <grpcpp/grpcpp.h>

// C++ 标准库
#include <memory>
#include <string>

namespace guard {
namespace server {

class SessionGuardServiceImpl final : public proto::guard::SessionGuardService::Service {
public:
    // 签发令牌时把调用方提供的资料写入用户目录; 已停用的用户不能登录
    // 限流器为空表示不限流
    SessionGuardServiceImpl(std::shared_ptr<guard::core::SessionSecurityEngine> engine
                            , std::shared_ptr<guard::core::StoredUserDirectory> users
                            , std::shared_ptr<guard::core::RateLimiter> login_limiter
                            , std::shared_ptr<guard::core::RateLimiter> refresh_limiter);

    grpc::Status CreateTokenPair(grpc::ServerContext* context
                                 , const proto::guard::CreateTokenPairRequest* request
                                 , proto::guard::CreateTokenPairResponse* response) override;

    grpc::Status ValidateAccessToken(grpc::ServerContext* context
                                     , const proto::guard::ValidateAccessTokenRequest* request
                                     , proto::guard::ValidateAccessTokenResponse* response) override;

    grpc::Status RefreshTokens(grpc::ServerContext* context
                               , const proto::guard::RefreshTokensRequest* request
                               , proto::guard::RefreshTokensResponse* response) override;

    grpc::Status Logout(grpc::ServerContext* context
                        , const proto::guard::LogoutRequest* request
                        , proto::guard::LogoutResponse* response) override;

    grpc::Status LogoutAll(grpc::ServerContext* context
                           , const proto::guard::LogoutAllRequest* request
                           , proto::guard::LogoutAllResponse* response) override;

    grpc::Status ListSessions(grpc::ServerContext* context
                              , const proto::guard::ListSessionsRequest* request
                              , proto::guard::ListSessionsResponse* response) override;

    grpc::Status RevokeSession(grpc::ServerContext* context
                               , const proto::guard::RevokeSessionRequest* request
                               , proto::guard::RevokeSessionResponse* response) override;

    grpc::Status BlacklistToken(grpc::ServerContext* context
                                , const proto::guard::BlacklistTokenRequest* request
                                , proto::guard::BlacklistTokenResponse* response) override;

    grpc::Status SetUserStatus(grpc::ServerContext* context
                               , const proto::guard::SetUserStatusRequest* request
                               , proto::guard::SetUserStatusResponse* response) override;

    // 辅助函数: 转换状态码
    static grpc::Status ToGrpcStatus(const guard::common::Status& status);

private:
    // 限流: 超限返回 RESOURCE_EXHAUSTED
    static guard::common::Status CheckRateLimit(guard::core::RateLimiter* limiter
                                                , grpc::ServerContext* context
                                                , const proto::guard::ClientInfo& client);
    // 辅助函数: 填充令牌对
    static void FillTokenPair(const guard::core::TokenPair& pair, proto::guard::TokenPair* out);

private:
    std::shared_ptr<guard::core::SessionSecurityEngine> engine_;
    std::shared_ptr<guard::core::StoredUserDirectory> users_;
    std::shared_ptr<guard::core::RateLimiter> login_limiter_;
    std::shared_ptr<guard::core::RateLimiter> refresh_limiter_;
};

} // namespace server
} // namespace guard

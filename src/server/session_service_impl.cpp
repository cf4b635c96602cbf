#include "server/session_service_impl.hpp"

#include <stdexcept>
#include <utility>

namespace guard {
namespace server {

namespace {

// 限流键: 优先使用请求中的客户端 IP, 否则使用连接对端地址
std::string RateLimitId(grpc::ServerContext* context, const proto::guard::ClientInfo& client) {
    if (!client.ip().empty()) {
        return client.ip();
    }
    if (context != nullptr) {
        return context->peer();
    }
    return "unknown";
}

} // namespace

SessionGuardServiceImpl::SessionGuardServiceImpl(std::shared_ptr<guard::core::SessionSecurityEngine> engine
                                                 , std::shared_ptr<guard::core::StoredUserDirectory> users
                                                 , std::shared_ptr<guard::core::RateLimiter> login_limiter
                                                 , std::shared_ptr<guard::core::RateLimiter> refresh_limiter)
    : engine_(std::move(engine))
    , users_(std::move(users))
    , login_limiter_(std::move(login_limiter))
    , refresh_limiter_(std::move(refresh_limiter)) {
    if (!engine_ || !users_) {
        throw std::invalid_argument("SessionGuardServiceImpl requires an engine and a user directory");
    }
}

grpc::Status SessionGuardServiceImpl::CreateTokenPair(grpc::ServerContext* context
                                                      , const proto::guard::CreateTokenPairRequest* request
                                                      , proto::guard::CreateTokenPairResponse* response) {
    auto limited = CheckRateLimit(login_limiter_.get(), context, request->client());
    if (!limited.IsOk()) {
        return ToGrpcStatus(limited);
    }

    GUARD_LOG_INFO("[SessionService] CreateTokenPair user={}", request->user_id());
    if (request->user_id().empty()) {
        return {grpc::StatusCode::INVALID_ARGUMENT, "user id is empty"};
    }
    auto existing = users_->GetUserById(request->user_id());
    if (existing.IsOk()) {
        if (!existing.Value().is_active) {
            return {grpc::StatusCode::PERMISSION_DENIED, "Account is deactivated"};
        }
    } else if (existing.GetStatus().Code() != guard::common::StatusCode::kNotFound) {
        return ToGrpcStatus(existing.GetStatus());
    }

    // 更新邮箱/角色, 刷新时重新写入令牌
    guard::core::UserProfile profile;
    profile.user_id = request->user_id();
    profile.email = request->email();
    profile.role = request->role();
    profile.is_active = true;
    auto stored = users_->Upsert(profile);
    if (!stored.IsOk()) {
        return ToGrpcStatus(stored);
    }

    auto pair = engine_->CreateTokenPair(request->user_id()
                                         , request->email()
                                         , request->role()
                                         , request->client().ip()
                                         , request->client().user_agent());
    if (!pair.IsOk()) {
        return ToGrpcStatus(pair.GetStatus());
    }
    FillTokenPair(pair.Value(), response->mutable_tokens());
    return grpc::Status::OK;
}

grpc::Status SessionGuardServiceImpl::ValidateAccessToken(grpc::ServerContext*
                                                          , const proto::guard::ValidateAccessTokenRequest* request
                                                          , proto::guard::ValidateAccessTokenResponse* response) {
    auto claims = engine_->ValidateAccessToken(request->access_token()
                                               , request->client().ip()
                                               , request->client().user_agent());
    if (!claims.IsOk()) {
        return ToGrpcStatus(claims.GetStatus());
    }
    const auto& value = claims.Value();
    auto* out = response->mutable_claims();
    out->set_user_id(value.user_id);
    out->set_email(value.email);
    out->set_role(value.role);
    out->set_session_id(value.session_id);
    out->set_token_id(value.token_id);
    out->set_issued_at(value.issued_at);
    out->set_expires_at(value.expires_at);
    return grpc::Status::OK;
}

grpc::Status SessionGuardServiceImpl::RefreshTokens(grpc::ServerContext* context
                                                    , const proto::guard::RefreshTokensRequest* request
                                                    , proto::guard::RefreshTokensResponse* response) {
    auto limited = CheckRateLimit(refresh_limiter_.get(), context, request->client());
    if (!limited.IsOk()) {
        return ToGrpcStatus(limited);
    }

    auto pair = engine_->RefreshTokens(request->refresh_token()
                                       , request->client().ip()
                                       , request->client().user_agent());
    if (!pair.IsOk()) {
        return ToGrpcStatus(pair.GetStatus());
    }
    FillTokenPair(pair.Value(), response->mutable_tokens());
    return grpc::Status::OK;
}

grpc::Status SessionGuardServiceImpl::Logout(grpc::ServerContext*
                                             , const proto::guard::LogoutRequest* request
                                             , proto::guard::LogoutResponse*) {
    auto status = engine_->EndSession(request->access_token()
                                      , request->client().ip()
                                      , request->client().user_agent());
    return ToGrpcStatus(status);
}

grpc::Status SessionGuardServiceImpl::LogoutAll(grpc::ServerContext*
                                                , const proto::guard::LogoutAllRequest* request
                                                , proto::guard::LogoutAllResponse*) {
    auto claims = engine_->ValidateAccessToken(request->access_token()
                                               , request->client().ip()
                                               , request->client().user_agent());
    if (!claims.IsOk()) {
        return ToGrpcStatus(claims.GetStatus());
    }
    GUARD_LOG_INFO("[SessionService] LogoutAll user={}", claims.Value().user_id);
    return ToGrpcStatus(engine_->InvalidateAllUserSessions(claims.Value().user_id));
}

grpc::Status SessionGuardServiceImpl::ListSessions(grpc::ServerContext*
                                                   , const proto::guard::ListSessionsRequest* request
                                                   , proto::guard::ListSessionsResponse* response) {
    auto claims = engine_->ValidateAccessToken(request->access_token()
                                               , request->client().ip()
                                               , request->client().user_agent());
    if (!claims.IsOk()) {
        return ToGrpcStatus(claims.GetStatus());
    }
    auto sessions = engine_->ListUserSessions(claims.Value().user_id, claims.Value().session_id);
    if (!sessions.IsOk()) {
        return ToGrpcStatus(sessions.GetStatus());
    }
    for (const auto& session : sessions.Value()) {
        auto* info = response->add_sessions();
        info->set_session_id(session.session_id);
        info->set_device_fingerprint(session.masked_fingerprint);
        info->set_ip_address(session.ip_address);
        info->set_user_agent(session.user_agent);
        info->set_created_at_ms(session.created_at_ms);
        info->set_last_activity_ms(session.last_activity_ms);
        info->set_is_current(session.is_current);
    }
    return grpc::Status::OK;
}

grpc::Status SessionGuardServiceImpl::RevokeSession(grpc::ServerContext*
                                                    , const proto::guard::RevokeSessionRequest* request
                                                    , proto::guard::RevokeSessionResponse*) {
    auto claims = engine_->ValidateAccessToken(request->access_token()
                                               , request->client().ip()
                                               , request->client().user_agent());
    if (!claims.IsOk()) {
        return ToGrpcStatus(claims.GetStatus());
    }
    auto status = engine_->RevokeUserSession(claims.Value().user_id
                                             , request->session_id()
                                             , claims.Value().session_id);
    return ToGrpcStatus(status);
}

grpc::Status SessionGuardServiceImpl::BlacklistToken(grpc::ServerContext*
                                                     , const proto::guard::BlacklistTokenRequest* request
                                                     , proto::guard::BlacklistTokenResponse*) {
    return ToGrpcStatus(engine_->BlacklistToken(request->token_id()));
}

grpc::Status SessionGuardServiceImpl::SetUserStatus(grpc::ServerContext*
                                                    , const proto::guard::SetUserStatusRequest* request
                                                    , proto::guard::SetUserStatusResponse*) {
    if (request->user_id().empty()) {
        return {grpc::StatusCode::INVALID_ARGUMENT, "user id is empty"};
    }
    GUARD_LOG_INFO("[SessionService] SetUserStatus user={} active={}", request->user_id(), request->active());
    return ToGrpcStatus(users_->SetActive(request->user_id(), request->active()));
}

grpc::Status SessionGuardServiceImpl::ToGrpcStatus(const guard::common::Status& status) {
    using guard::common::StatusCode;
    switch (status.Code()) {
        case StatusCode::kOk:
        return grpc::Status::OK;
        case StatusCode::kInvalidArgument:
        return {grpc::StatusCode::INVALID_ARGUMENT, status.Message()};
        case StatusCode::kNotFound:
        return {grpc::StatusCode::NOT_FOUND, status.Message()};
        case StatusCode::kAlreadyExists:
        return {grpc::StatusCode::ALREADY_EXISTS, status.Message()};
        case StatusCode::kPermissionDenied:
        return {grpc::StatusCode::PERMISSION_DENIED, status.Message()};
        case StatusCode::kResourceExhausted:
        return {grpc::StatusCode::RESOURCE_EXHAUSTED, status.Message()};
        case StatusCode::kUnauthenticated:
        return {grpc::StatusCode::UNAUTHENTICATED, status.Message()};
        case StatusCode::kInternal:
        return {grpc::StatusCode::INTERNAL, status.Message()};
        case StatusCode::kUnavailable:
        return {grpc::StatusCode::UNAVAILABLE, status.Message()};
    }
    return {grpc::StatusCode::UNKNOWN, status.Message()};
}

guard::common::Status SessionGuardServiceImpl::CheckRateLimit(guard::core::RateLimiter* limiter
                                                             , grpc::ServerContext* context
                                                             , const proto::guard::ClientInfo& client) {
    if (limiter == nullptr) {
        return guard::common::Status::OK();
    }
    auto allowed = limiter->Allow(RateLimitId(context, client));
    if (!allowed.IsOk()) {
        return allowed.GetStatus();
    }
    if (!allowed.Value()) {
        return guard::common::Status::ResourceExhausted("Too many attempts, please try again later");
    }
    return guard::common::Status::OK();
}

void SessionGuardServiceImpl::FillTokenPair(const guard::core::TokenPair& pair, proto::guard::TokenPair* out) {
    if (out == nullptr) {
        return;
    }
    out->set_access_token(pair.access_token);
    out->set_refresh_token(pair.refresh_token);
    out->set_session_id(pair.session_id);
    out->set_expires_in(pair.expires_in);
    out->set_refresh_expires_in(pair.refresh_expires_in);
}

} // namespace server
} // namespace guard

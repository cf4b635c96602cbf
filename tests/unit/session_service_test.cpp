#include "server/session_service_impl.hpp"
#include "session_guard.grpc.pb.h"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <grpcpp/grpcpp.h>
#include <memory>

using namespace guard::server;

class SessionServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<testutils::ManualClock>();
        store_ = std::make_shared<guard::cache::InMemoryKvStore>(clock_);
        service_ = MakeService(nullptr);
    }

    // 新的服务实例共享同一存储, 相当于重启或另一个实例
    std::unique_ptr<SessionGuardServiceImpl> MakeService(std::shared_ptr<guard::core::RateLimiter> login_limiter) {
        users_ = std::make_shared<guard::core::StoredUserDirectory>(store_, "guard:");
        auto engine = std::make_shared<guard::core::SessionSecurityEngine>(
            testutils::TestAuthConfig(), store_, users_, clock_, "guard:");
        if (!login_limiter) {
            login_limiter = std::make_shared<guard::core::RateLimiter>(
                store_, "guard:", "login", guard::common::RateLimitRule{3, 900}, clock_);
        }
        return std::make_unique<SessionGuardServiceImpl>(engine, users_, login_limiter, nullptr);
    }

    grpc::Status Refresh(SessionGuardServiceImpl& service, const std::string& refresh_token
                         , proto::guard::RefreshTokensResponse* response) {
        proto::guard::RefreshTokensRequest request;
        request.set_refresh_token(refresh_token);
        SetClient(request.mutable_client());
        return service.RefreshTokens(&context_, &request, response);
    }

    grpc::Status SetActive(const std::string& user_id, bool active) {
        proto::guard::SetUserStatusRequest request;
        request.set_user_id(user_id);
        request.set_active(active);
        proto::guard::SetUserStatusResponse response;
        return service_->SetUserStatus(&context_, &request, &response);
    }

    void TearDown() override {
        service_.reset();
    }

    proto::guard::TokenPair Login(const std::string& user_id, const std::string& ip = "10.0.0.1") {
        proto::guard::CreateTokenPairRequest request;
        request.set_user_id(user_id);
        request.set_email(user_id + "@example.com");
        request.set_role("member");
        request.mutable_client()->set_ip(ip);
        request.mutable_client()->set_user_agent("test-agent");

        proto::guard::CreateTokenPairResponse response;
        auto status = service_->CreateTokenPair(&context_, &request, &response);
        EXPECT_TRUE(status.ok()) << "CreateTokenPair 调用失败: " << status.error_message();
        return response.tokens();
    }

    static void SetClient(proto::guard::ClientInfo* client, const std::string& ip = "10.0.0.1") {
        client->set_ip(ip);
        client->set_user_agent("test-agent");
    }

    std::shared_ptr<testutils::ManualClock> clock_;
    std::shared_ptr<guard::cache::InMemoryKvStore> store_;
    std::shared_ptr<guard::core::StoredUserDirectory> users_;
    std::unique_ptr<SessionGuardServiceImpl> service_;
    grpc::ServerContext context_;
};

// 签发后可以校验
TEST_F(SessionServiceTest, CreateAndValidate) {
    auto tokens = Login("alice");
    EXPECT_FALSE(tokens.access_token().empty());
    EXPECT_FALSE(tokens.refresh_token().empty());
    EXPECT_EQ(tokens.expires_in(), 900);

    proto::guard::ValidateAccessTokenRequest request;
    request.set_access_token(tokens.access_token());
    SetClient(request.mutable_client());
    proto::guard::ValidateAccessTokenResponse response;

    auto status = service_->ValidateAccessToken(&context_, &request, &response);
    ASSERT_TRUE(status.ok()) << status.error_message();
    EXPECT_EQ(response.claims().user_id(), "alice");
    EXPECT_EQ(response.claims().email(), "alice@example.com");
    EXPECT_EQ(response.claims().session_id(), tokens.session_id());
}

// 非法令牌返回 UNAUTHENTICATED
TEST_F(SessionServiceTest, InvalidTokenIsUnauthenticated) {
    proto::guard::ValidateAccessTokenRequest request;
    request.set_access_token("bogus");
    SetClient(request.mutable_client());
    proto::guard::ValidateAccessTokenResponse response;

    auto status = service_->ValidateAccessToken(&context_, &request, &response);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::UNAUTHENTICATED);
}

// 同一 IP 超过登录限额
TEST_F(SessionServiceTest, LoginIsRateLimited) {
    Login("alice");
    Login("alice");
    Login("alice");

    proto::guard::CreateTokenPairRequest request;
    request.set_user_id("alice");
    SetClient(request.mutable_client());
    proto::guard::CreateTokenPairResponse response;
    auto status = service_->CreateTokenPair(&context_, &request, &response);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::RESOURCE_EXHAUSTED);

    // 其他 IP 不受影响
    Login("alice", "10.0.0.2");
}

// 刷新令牌轮换
TEST_F(SessionServiceTest, RefreshRotates) {
    auto tokens = Login("alice");

    proto::guard::RefreshTokensRequest request;
    request.set_refresh_token(tokens.refresh_token());
    SetClient(request.mutable_client());
    proto::guard::RefreshTokensResponse response;
    ASSERT_TRUE(service_->RefreshTokens(&context_, &request, &response).ok());
    EXPECT_EQ(response.tokens().session_id(), tokens.session_id());

    proto::guard::RefreshTokensResponse replay;
    auto status = service_->RefreshTokens(&context_, &request, &replay);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::UNAUTHENTICATED);
}

// 用户资料保存在共享存储中, 重启后仍能刷新
TEST_F(SessionServiceTest, RefreshSurvivesRestart) {
    auto tokens = Login("alice");

    auto restarted = MakeService(nullptr);
    proto::guard::RefreshTokensResponse response;
    auto status = Refresh(*restarted, tokens.refresh_token(), &response);
    ASSERT_TRUE(status.ok()) << status.error_message();
    EXPECT_EQ(response.tokens().session_id(), tokens.session_id());
}

// 停用的用户不能刷新也不能重新登录
TEST_F(SessionServiceTest, DeactivatedUserIsDenied) {
    auto tokens = Login("alice");
    ASSERT_TRUE(SetActive("alice", false).ok());

    proto::guard::RefreshTokensResponse refreshed;
    EXPECT_EQ(Refresh(*service_, tokens.refresh_token(), &refreshed).error_code(),
              grpc::StatusCode::PERMISSION_DENIED);

    proto::guard::CreateTokenPairRequest login;
    login.set_user_id("alice");
    login.set_email("alice@example.com");
    SetClient(login.mutable_client());
    proto::guard::CreateTokenPairResponse login_response;
    EXPECT_EQ(service_->CreateTokenPair(&context_, &login, &login_response).error_code(),
              grpc::StatusCode::PERMISSION_DENIED);

    ASSERT_TRUE(SetActive("alice", true).ok());
    EXPECT_TRUE(Refresh(*service_, tokens.refresh_token(), &refreshed).ok());
    EXPECT_EQ(SetActive("nobody", false).error_code(), grpc::StatusCode::NOT_FOUND);
}

// 登出后令牌失效
TEST_F(SessionServiceTest, LogoutInvalidatesToken) {
    auto tokens = Login("alice");

    proto::guard::LogoutRequest logout;
    logout.set_access_token(tokens.access_token());
    SetClient(logout.mutable_client());
    proto::guard::LogoutResponse logout_response;
    ASSERT_TRUE(service_->Logout(&context_, &logout, &logout_response).ok());

    proto::guard::ValidateAccessTokenRequest request;
    request.set_access_token(tokens.access_token());
    SetClient(request.mutable_client());
    proto::guard::ValidateAccessTokenResponse response;
    auto status = service_->ValidateAccessToken(&context_, &request, &response);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::UNAUTHENTICATED);
}

// 会话列表与吊销
TEST_F(SessionServiceTest, ListAndRevokeSessions) {
    auto current = Login("alice");
    clock_->Advance(std::chrono::seconds(1));
    auto other = Login("alice");
    clock_->Advance(std::chrono::seconds(1));

    proto::guard::ListSessionsRequest list;
    list.set_access_token(current.access_token());
    SetClient(list.mutable_client());
    proto::guard::ListSessionsResponse list_response;
    ASSERT_TRUE(service_->ListSessions(&context_, &list, &list_response).ok());
    ASSERT_EQ(list_response.sessions_size(), 2);
    // 校验请求本身刷新了当前会话的活动时间
    EXPECT_EQ(list_response.sessions(0).session_id(), current.session_id());
    EXPECT_TRUE(list_response.sessions(0).is_current());
    EXPECT_EQ(list_response.sessions(1).session_id(), other.session_id());
    EXPECT_EQ(list_response.sessions(0).device_fingerprint().size(), 11u);

    proto::guard::RevokeSessionRequest revoke_self;
    revoke_self.set_access_token(current.access_token());
    revoke_self.set_session_id(current.session_id());
    SetClient(revoke_self.mutable_client());
    proto::guard::RevokeSessionResponse revoke_response;
    EXPECT_EQ(service_->RevokeSession(&context_, &revoke_self, &revoke_response).error_code(),
              grpc::StatusCode::INVALID_ARGUMENT);

    proto::guard::RevokeSessionRequest revoke_other;
    revoke_other.set_access_token(current.access_token());
    revoke_other.set_session_id(other.session_id());
    SetClient(revoke_other.mutable_client());
    EXPECT_TRUE(service_->RevokeSession(&context_, &revoke_other, &revoke_response).ok());
}

// 全部登出
TEST_F(SessionServiceTest, LogoutAll) {
    auto first = Login("alice");
    auto second = Login("alice", "10.0.0.2");

    proto::guard::LogoutAllRequest request;
    request.set_access_token(first.access_token());
    SetClient(request.mutable_client());
    proto::guard::LogoutAllResponse response;
    ASSERT_TRUE(service_->LogoutAll(&context_, &request, &response).ok());

    proto::guard::RefreshTokensRequest refresh;
    refresh.set_refresh_token(second.refresh_token());
    SetClient(refresh.mutable_client(), "10.0.0.2");
    proto::guard::RefreshTokensResponse refresh_response;
    EXPECT_EQ(service_->RefreshTokens(&context_, &refresh, &refresh_response).error_code(),
              grpc::StatusCode::UNAUTHENTICATED);
}

// 状态码映射
TEST(SessionServiceStatusTest, MapsStatusCodes) {
    using guard::common::Status;
    EXPECT_TRUE(SessionGuardServiceImpl::ToGrpcStatus(Status::OK()).ok());
    EXPECT_EQ(SessionGuardServiceImpl::ToGrpcStatus(Status::Unauthenticated("x")).error_code(),
              grpc::StatusCode::UNAUTHENTICATED);
    EXPECT_EQ(SessionGuardServiceImpl::ToGrpcStatus(Status::PermissionDenied("x")).error_code(),
              grpc::StatusCode::PERMISSION_DENIED);
    EXPECT_EQ(SessionGuardServiceImpl::ToGrpcStatus(Status::Unavailable("x")).error_code(),
              grpc::StatusCode::UNAVAILABLE);
    EXPECT_EQ(SessionGuardServiceImpl::ToGrpcStatus(Status::ResourceExhausted("x")).error_code(),
              grpc::StatusCode::RESOURCE_EXHAUSTED);
}

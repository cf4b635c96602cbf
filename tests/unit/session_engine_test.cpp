#include "common/crypto.hpp"
#include "core/session/revocation_store.hpp"
#include "core/session/session_engine.hpp"
#include "core/session/session_store.hpp"
#include "core/user/user_directory.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <vector>

using guard::common::StatusCode;
using guard::core::SessionSecurityEngine;
using guard::core::TokenPair;

namespace {
constexpr const char* kIp = "203.0.113.7";
constexpr const char* kUa = "Mozilla/5.0 (X11; Linux x86_64)";
constexpr const char* kOtherIp = "198.51.100.9";
constexpr const char* kOtherUa = "curl/8.0";
} // namespace

class SessionEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<testutils::ManualClock>();
        memory_ = std::make_shared<guard::cache::InMemoryKvStore>(clock_);
        kv_ = std::make_shared<testutils::FlakyKvStore>(memory_);
        users_ = std::make_shared<guard::core::InMemoryUserDirectory>();
        config_ = testutils::TestAuthConfig();
        engine_ = std::make_unique<SessionSecurityEngine>(config_, kv_, users_, clock_, "guard:");
        sessions_ = std::make_unique<guard::core::SessionStore>(
            memory_, "guard:", std::chrono::seconds(config_.session_retention_seconds), clock_);

        AddUser("user-1", "alice@example.com", "admin");
        AddUser("user-2", "bob@example.com", "member");
    }

    void AddUser(const std::string& id, const std::string& email, const std::string& role, bool active = true) {
        guard::core::UserProfile profile;
        profile.user_id = id;
        profile.email = email;
        profile.role = role;
        profile.is_active = active;
        users_->Upsert(profile);
    }

    TokenPair Login(const std::string& user_id = "user-1", const std::string& ip = kIp
                    , const std::string& ua = kUa) {
        auto profile = users_->GetUserById(user_id);
        auto pair = engine_->CreateTokenPair(user_id, profile.Value().email, profile.Value().role, ip, ua);
        EXPECT_TRUE(pair.IsOk()) << pair.GetStatus().Message();
        return pair.Value();
    }

    bool SessionActive(const std::string& user_id, const std::string& session_id) {
        auto rec = sessions_->Get(user_id, session_id);
        return rec.IsOk() && rec.Value().is_active;
    }

    static void ExpectRejected(const guard::common::Status& status) {
        EXPECT_EQ(status.Code(), StatusCode::kUnauthenticated);
        EXPECT_EQ(status.Message(), "Invalid or expired token");
    }

    std::shared_ptr<testutils::ManualClock> clock_;
    std::shared_ptr<guard::cache::InMemoryKvStore> memory_;
    std::shared_ptr<testutils::FlakyKvStore> kv_;
    std::shared_ptr<guard::core::InMemoryUserDirectory> users_;
    guard::common::AuthConfig config_;
    std::unique_ptr<SessionSecurityEngine> engine_;
    std::unique_ptr<guard::core::SessionStore> sessions_;
};

TEST_F(SessionEngineTest, RequiresStoreAndDirectory) {
    EXPECT_THROW(SessionSecurityEngine(config_, nullptr, users_, clock_), std::invalid_argument);
    EXPECT_THROW(SessionSecurityEngine(config_, kv_, nullptr, clock_), std::invalid_argument);
}

TEST_F(SessionEngineTest, CreateThenValidate) {
    auto pair = Login();
    EXPECT_EQ(pair.session_id.size(), 64u);
    EXPECT_EQ(pair.expires_in, 900);
    EXPECT_EQ(pair.refresh_expires_in, 604800);

    auto claims = engine_->ValidateAccessToken(pair.access_token, kIp, kUa);
    ASSERT_TRUE(claims.IsOk()) << claims.GetStatus().Message();
    EXPECT_EQ(claims.Value().user_id, "user-1");
    EXPECT_EQ(claims.Value().email, "alice@example.com");
    EXPECT_EQ(claims.Value().role, "admin");
    EXPECT_EQ(claims.Value().session_id, pair.session_id);
    EXPECT_TRUE(SessionActive("user-1", pair.session_id));
}

TEST_F(SessionEngineTest, CreatePersistsSessionAndRefreshHash) {
    auto pair = Login();
    auto rec = sessions_->Get("user-1", pair.session_id);
    ASSERT_TRUE(rec.IsOk());
    EXPECT_EQ(rec.Value().ip_address, kIp);
    EXPECT_EQ(rec.Value().user_agent, kUa);
    EXPECT_EQ(rec.Value().created_at_ms, clock_->NowMillis());

    auto hash = memory_->Get("guard:refresh:user-1:" + pair.session_id);
    ASSERT_TRUE(hash.IsOk());
    EXPECT_EQ(hash.Value(), guard::common::Sha256Hex(pair.refresh_token));
    EXPECT_EQ(memory_->Ttl("guard:refresh:user-1:" + pair.session_id), std::chrono::seconds(604800));
}

TEST_F(SessionEngineTest, ValidateUpdatesLastActivity) {
    auto pair = Login();
    clock_->Advance(std::chrono::seconds(30));
    ASSERT_TRUE(engine_->ValidateAccessToken(pair.access_token, kIp, kUa).IsOk());

    auto rec = sessions_->Get("user-1", pair.session_id);
    ASSERT_TRUE(rec.IsOk());
    EXPECT_EQ(rec.Value().last_activity_ms, clock_->NowMillis());
}

TEST_F(SessionEngineTest, RejectsGarbageAndExpiredTokens) {
    ExpectRejected(engine_->ValidateAccessToken("", kIp, kUa).GetStatus());
    ExpectRejected(engine_->ValidateAccessToken("not.a.jwt", kIp, kUa).GetStatus());

    auto pair = Login();
    clock_->Advance(std::chrono::seconds(901));
    ExpectRejected(engine_->ValidateAccessToken(pair.access_token, kIp, kUa).GetStatus());
}

TEST_F(SessionEngineTest, RefreshTokenIsNotAnAccessToken) {
    auto pair = Login();
    ExpectRejected(engine_->ValidateAccessToken(pair.refresh_token, kIp, kUa).GetStatus());
    ExpectRejected(engine_->RefreshTokens(pair.access_token, kIp, kUa).GetStatus());
}

TEST_F(SessionEngineTest, RefreshIsSingleUse) {
    auto first = Login();
    clock_->Advance(std::chrono::seconds(5));

    auto second = engine_->RefreshTokens(first.refresh_token, kIp, kUa);
    ASSERT_TRUE(second.IsOk()) << second.GetStatus().Message();
    EXPECT_NE(second.Value().refresh_token, first.refresh_token);

    ExpectRejected(engine_->RefreshTokens(first.refresh_token, kIp, kUa).GetStatus());
    EXPECT_TRUE(engine_->RefreshTokens(second.Value().refresh_token, kIp, kUa).IsOk());
}

TEST_F(SessionEngineTest, RefreshKeepsSessionAndCreationTime) {
    auto first = Login();
    const auto created_at = clock_->NowMillis();
    clock_->Advance(std::chrono::minutes(10));

    auto second = engine_->RefreshTokens(first.refresh_token, kIp, kUa);
    ASSERT_TRUE(second.IsOk()) << second.GetStatus().Message();
    EXPECT_EQ(second.Value().session_id, first.session_id);

    auto rec = sessions_->Get("user-1", first.session_id);
    ASSERT_TRUE(rec.IsOk());
    EXPECT_EQ(rec.Value().created_at_ms, created_at);
    EXPECT_EQ(rec.Value().last_activity_ms, clock_->NowMillis());

    // 旧刷新令牌的 jti 已拉黑
    auto old_jti = guard::core::TokenCodec::PeekTokenId(first.refresh_token);
    EXPECT_TRUE(memory_->Exists("guard:blacklist:" + old_jti).Value());
}

TEST_F(SessionEngineTest, RefreshPicksUpDirectoryChanges) {
    auto first = Login();
    AddUser("user-1", "alice@new.example.com", "owner");

    auto second = engine_->RefreshTokens(first.refresh_token, kIp, kUa);
    ASSERT_TRUE(second.IsOk()) << second.GetStatus().Message();
    auto claims = engine_->ValidateAccessToken(second.Value().access_token, kIp, kUa);
    ASSERT_TRUE(claims.IsOk());
    EXPECT_EQ(claims.Value().email, "alice@new.example.com");
    EXPECT_EQ(claims.Value().role, "owner");
}

TEST_F(SessionEngineTest, RefreshRejectsInactiveOrUnknownUser) {
    auto pair = Login();
    AddUser("user-1", "alice@example.com", "admin", false);
    auto denied = engine_->RefreshTokens(pair.refresh_token, kIp, kUa);
    EXPECT_EQ(denied.GetStatus().Code(), StatusCode::kPermissionDenied);

    auto other = Login("user-2");
    users_->Remove("user-2");
    ExpectRejected(engine_->RefreshTokens(other.refresh_token, kIp, kUa).GetStatus());
}

TEST_F(SessionEngineTest, RefreshFromAnotherDeviceKillsSession) {
    auto pair = Login();
    ExpectRejected(engine_->RefreshTokens(pair.refresh_token, kOtherIp, kUa).GetStatus());
    EXPECT_FALSE(SessionActive("user-1", pair.session_id));
    ExpectRejected(engine_->RefreshTokens(pair.refresh_token, kIp, kUa).GetStatus());
}

TEST_F(SessionEngineTest, RefreshRejectsStaleVersion) {
    auto pair = Login();
    guard::core::RevocationStore revocations(memory_, "guard:");
    ASSERT_TRUE(revocations.BumpTokenVersion("user-1").IsOk());
    ExpectRejected(engine_->RefreshTokens(pair.refresh_token, kIp, kUa).GetStatus());
}

TEST_F(SessionEngineTest, RefreshRejectsBlacklistedRefreshToken) {
    auto pair = Login();
    auto jti = guard::core::TokenCodec::PeekTokenId(pair.refresh_token);
    ASSERT_FALSE(jti.empty());
    ASSERT_TRUE(engine_->BlacklistToken(jti).IsOk());

    ExpectRejected(engine_->RefreshTokens(pair.refresh_token, kIp, kUa).GetStatus());
    // 哈希记录仍在, 拒绝来自黑名单
    EXPECT_TRUE(memory_->Exists("guard:refresh:user-1:" + pair.session_id).Value());
}

TEST_F(SessionEngineTest, LogoutDuringRefreshKeepsSessionEnded) {
    auto pair = Login();
    bool invalidated = false;
    kv_->OnSet([&](const std::string& key) {
        // 刷新写黑名单时, 另一个请求恰好登出了同一会话
        if (!invalidated && key.rfind("guard:blacklist:", 0) == 0) {
            invalidated = true;
            EXPECT_TRUE(engine_->InvalidateSession(pair.session_id).IsOk());
        }
        return guard::common::Status::OK();
    });
    auto refreshed = engine_->RefreshTokens(pair.refresh_token, kIp, kUa);
    kv_->OnSet(nullptr);

    ASSERT_TRUE(invalidated);
    ExpectRejected(refreshed.GetStatus());
    EXPECT_FALSE(SessionActive("user-1", pair.session_id));
    EXPECT_FALSE(memory_->Exists("guard:refresh:user-1:" + pair.session_id).Value());
    ExpectRejected(engine_->ValidateAccessToken(pair.access_token, kIp, kUa).GetStatus());
}

TEST_F(SessionEngineTest, FailedTokenIssueReleasesSessionSlot) {
    kv_->OnSet([](const std::string& key) {
        if (key.rfind("guard:refresh:", 0) == 0) {
            return guard::common::Status::Unavailable("write failed");
        }
        return guard::common::Status::OK();
    });
    auto pair = engine_->CreateTokenPair("user-1", "alice@example.com", "admin", kIp, kUa);
    kv_->OnSet(nullptr);

    EXPECT_EQ(pair.GetStatus().Code(), StatusCode::kUnavailable);
    auto list = engine_->ListUserSessions("user-1");
    ASSERT_TRUE(list.IsOk());
    EXPECT_TRUE(list.Value().empty());
}

TEST_F(SessionEngineTest, InvalidateAllKillsEveryRefreshToken) {
    auto a = Login();
    clock_->Advance(std::chrono::seconds(1));
    auto b = Login("user-1", kOtherIp, kOtherUa);
    auto other_user = Login("user-2");

    ASSERT_TRUE(engine_->InvalidateAllUserSessions("user-1").IsOk());

    ExpectRejected(engine_->RefreshTokens(a.refresh_token, kIp, kUa).GetStatus());
    ExpectRejected(engine_->RefreshTokens(b.refresh_token, kOtherIp, kOtherUa).GetStatus());
    ExpectRejected(engine_->ValidateAccessToken(a.access_token, kIp, kUa).GetStatus());
    EXPECT_FALSE(SessionActive("user-1", a.session_id));
    EXPECT_FALSE(SessionActive("user-1", b.session_id));

    guard::core::RevocationStore revocations(memory_, "guard:");
    EXPECT_EQ(revocations.GetTokenVersion("user-1").Value(), 2);

    // 其他用户不受影响
    EXPECT_TRUE(engine_->RefreshTokens(other_user.refresh_token, kIp, kUa).IsOk());

    // 之后重新登录可用
    auto fresh = Login();
    EXPECT_TRUE(engine_->RefreshTokens(fresh.refresh_token, kIp, kUa).IsOk());
}

TEST_F(SessionEngineTest, FingerprintMismatchInvalidatesSession) {
    auto pair = Login();
    ExpectRejected(engine_->ValidateAccessToken(pair.access_token, kIp, kOtherUa).GetStatus());
    EXPECT_FALSE(SessionActive("user-1", pair.session_id));

    // 原设备也无法继续使用
    ExpectRejected(engine_->ValidateAccessToken(pair.access_token, kIp, kUa).GetStatus());
    ExpectRejected(engine_->RefreshTokens(pair.refresh_token, kIp, kUa).GetStatus());
}

TEST_F(SessionEngineTest, IpChangeAlsoCountsAsMismatch) {
    auto pair = Login();
    ExpectRejected(engine_->ValidateAccessToken(pair.access_token, kOtherIp, kUa).GetStatus());
    EXPECT_FALSE(SessionActive("user-1", pair.session_id));
}

TEST_F(SessionEngineTest, SixthSessionEvictsLeastRecentlyActive) {
    std::vector<TokenPair> pairs;
    for (int i = 0; i < 5; ++i) {
        pairs.push_back(Login());
        clock_->Advance(std::chrono::seconds(1));
    }
    auto sixth = Login();

    auto list = engine_->ListUserSessions("user-1");
    ASSERT_TRUE(list.IsOk());
    EXPECT_EQ(list.Value().size(), 5u);
    EXPECT_FALSE(SessionActive("user-1", pairs[0].session_id));
    for (int i = 1; i < 5; ++i) {
        EXPECT_TRUE(SessionActive("user-1", pairs[i].session_id));
    }
    EXPECT_TRUE(SessionActive("user-1", sixth.session_id));
    ExpectRejected(engine_->RefreshTokens(pairs[0].refresh_token, kIp, kUa).GetStatus());
}

TEST_F(SessionEngineTest, EvictionUsesLastActivityNotCreation) {
    std::vector<TokenPair> pairs;
    for (int i = 0; i < 5; ++i) {
        pairs.push_back(Login());
        clock_->Advance(std::chrono::seconds(1));
    }
    // 最早创建的会话刚刚活动过
    ASSERT_TRUE(engine_->ValidateAccessToken(pairs[0].access_token, kIp, kUa).IsOk());
    clock_->Advance(std::chrono::seconds(1));

    Login();
    EXPECT_TRUE(SessionActive("user-1", pairs[0].session_id));
    EXPECT_FALSE(SessionActive("user-1", pairs[1].session_id));
}

TEST_F(SessionEngineTest, LoweredLimitEvictsDownToLimit) {
    for (int i = 0; i < 5; ++i) {
        Login();
        clock_->Advance(std::chrono::seconds(1));
    }
    auto lowered = config_;
    lowered.max_sessions = 2;
    SessionSecurityEngine engine(lowered, kv_, users_, clock_, "guard:");
    ASSERT_TRUE(engine.CreateTokenPair("user-1", "alice@example.com", "admin", kIp, kUa).IsOk());

    auto list = engine.ListUserSessions("user-1");
    ASSERT_TRUE(list.IsOk());
    EXPECT_EQ(list.Value().size(), 2u);
}

TEST_F(SessionEngineTest, BlacklistedTokenRejected) {
    auto pair = Login();
    auto jti = guard::core::TokenCodec::PeekTokenId(pair.access_token);
    ASSERT_FALSE(jti.empty());

    ASSERT_TRUE(engine_->BlacklistToken(jti).IsOk());
    ASSERT_TRUE(engine_->BlacklistToken(jti).IsOk());
    ExpectRejected(engine_->ValidateAccessToken(pair.access_token, kIp, kUa).GetStatus());
    EXPECT_EQ(memory_->Ttl("guard:blacklist:" + jti), std::chrono::seconds(86400));

    EXPECT_EQ(engine_->BlacklistToken("").Code(), StatusCode::kInvalidArgument);
}

TEST_F(SessionEngineTest, InvalidateSessionIsIdempotent) {
    auto pair = Login();
    ASSERT_TRUE(engine_->InvalidateSession(pair.session_id).IsOk());
    ASSERT_TRUE(engine_->InvalidateSession(pair.session_id).IsOk());
    EXPECT_TRUE(engine_->InvalidateSession("unknown-session").IsOk());

    EXPECT_FALSE(SessionActive("user-1", pair.session_id));
    EXPECT_FALSE(memory_->Exists("guard:refresh:user-1:" + pair.session_id).Value());
    ExpectRejected(engine_->ValidateAccessToken(pair.access_token, kIp, kUa).GetStatus());
}

TEST_F(SessionEngineTest, LoginUseRefreshScenario) {
    auto a = Login();
    clock_->Advance(std::chrono::seconds(10));
    ASSERT_TRUE(engine_->ValidateAccessToken(a.access_token, kIp, kUa).IsOk());
    auto touched = sessions_->Get("user-1", a.session_id);
    ASSERT_TRUE(touched.IsOk());
    EXPECT_EQ(touched.Value().last_activity_ms, clock_->NowMillis());

    clock_->Advance(std::chrono::seconds(10));
    auto b = engine_->RefreshTokens(a.refresh_token, kIp, kUa);
    ASSERT_TRUE(b.IsOk()) << b.GetStatus().Message();

    ExpectRejected(engine_->RefreshTokens(a.refresh_token, kIp, kUa).GetStatus());
    EXPECT_TRUE(engine_->ValidateAccessToken(b.Value().access_token, kIp, kUa).IsOk());
    EXPECT_TRUE(engine_->RefreshTokens(b.Value().refresh_token, kIp, kUa).IsOk());
}

TEST_F(SessionEngineTest, EndSessionRevokesBothTokens) {
    auto pair = Login();
    ASSERT_TRUE(engine_->EndSession(pair.access_token, kIp, kUa).IsOk());

    ExpectRejected(engine_->ValidateAccessToken(pair.access_token, kIp, kUa).GetStatus());
    ExpectRejected(engine_->RefreshTokens(pair.refresh_token, kIp, kUa).GetStatus());
    ExpectRejected(engine_->EndSession(pair.access_token, kIp, kUa));
}

TEST_F(SessionEngineTest, ListSessionsSortedAndMasked) {
    auto first = Login();
    clock_->Advance(std::chrono::seconds(1));
    auto second = Login("user-1", kOtherIp, kOtherUa);
    clock_->Advance(std::chrono::seconds(1));
    auto third = Login();
    ASSERT_TRUE(engine_->InvalidateSession(third.session_id).IsOk());
    clock_->Advance(std::chrono::seconds(1));
    ASSERT_TRUE(engine_->ValidateAccessToken(first.access_token, kIp, kUa).IsOk());

    auto list = engine_->ListUserSessions("user-1", second.session_id);
    ASSERT_TRUE(list.IsOk());
    ASSERT_EQ(list.Value().size(), 2u);
    EXPECT_EQ(list.Value()[0].session_id, first.session_id);
    EXPECT_EQ(list.Value()[1].session_id, second.session_id);
    EXPECT_FALSE(list.Value()[0].is_current);
    EXPECT_TRUE(list.Value()[1].is_current);
    EXPECT_EQ(list.Value()[1].ip_address, kOtherIp);
    for (const auto& summary : list.Value()) {
        EXPECT_EQ(summary.masked_fingerprint.size(), 11u);
        EXPECT_EQ(summary.masked_fingerprint.substr(8), "...");
    }
}

TEST_F(SessionEngineTest, RevokeUserSession) {
    auto current = Login();
    clock_->Advance(std::chrono::seconds(1));
    auto other = Login("user-1", kOtherIp, kOtherUa);
    auto foreign = Login("user-2");

    EXPECT_EQ(engine_->RevokeUserSession("user-1", current.session_id, current.session_id).Code(),
              StatusCode::kInvalidArgument);
    EXPECT_EQ(engine_->RevokeUserSession("user-1", foreign.session_id, current.session_id).Code(),
              StatusCode::kNotFound);
    EXPECT_TRUE(SessionActive("user-2", foreign.session_id));

    ASSERT_TRUE(engine_->RevokeUserSession("user-1", other.session_id, current.session_id).IsOk());
    EXPECT_FALSE(SessionActive("user-1", other.session_id));
    EXPECT_TRUE(SessionActive("user-1", current.session_id));

    // 已吊销的会话不能再次吊销
    EXPECT_EQ(engine_->RevokeUserSession("user-1", other.session_id, current.session_id).Code(),
              StatusCode::kNotFound);
}

TEST_F(SessionEngineTest, StoreOutageIsUnavailableNotUnauthenticated) {
    auto pair = Login();
    kv_->SetDown(true);

    EXPECT_EQ(engine_->ValidateAccessToken(pair.access_token, kIp, kUa).GetStatus().Code(),
              StatusCode::kUnavailable);
    EXPECT_EQ(engine_->RefreshTokens(pair.refresh_token, kIp, kUa).GetStatus().Code(),
              StatusCode::kUnavailable);
    EXPECT_EQ(engine_->CreateTokenPair("user-1", "a", "b", kIp, kUa).GetStatus().Code(),
              StatusCode::kUnavailable);
    EXPECT_EQ(engine_->InvalidateAllUserSessions("user-1").Code(), StatusCode::kUnavailable);
    EXPECT_EQ(engine_->BlacklistToken("jti").Code(), StatusCode::kUnavailable);
    // 原始错误信息保留, 便于排查
    EXPECT_EQ(engine_->InvalidateSession(pair.session_id).Message(), "connection refused");

    kv_->SetDown(false);
    EXPECT_TRUE(engine_->ValidateAccessToken(pair.access_token, kIp, kUa).IsOk());
}

TEST_F(SessionEngineTest, DirectoryOutageIsUnavailable) {
    auto lookup = [](const std::string&) -> guard::common::StatusOr<guard::core::UserProfile> {
        return guard::common::Status::Unavailable("directory down");
    };
    auto directory = std::make_shared<guard::core::CallbackUserDirectory>(lookup);
    SessionSecurityEngine engine(config_, kv_, directory, clock_, "guard:");

    auto pair = engine.CreateTokenPair("user-1", "alice@example.com", "admin", kIp, kUa);
    ASSERT_TRUE(pair.IsOk());
    EXPECT_EQ(engine.RefreshTokens(pair.Value().refresh_token, kIp, kUa).GetStatus().Code(),
              StatusCode::kUnavailable);
}

TEST(AuthErrorTest, StoreUnavailableMapsToUnavailable) {
    using guard::core::AuthErrorCode;
    auto status = guard::core::FromAuthError(AuthErrorCode::kStoreUnavailable);
    EXPECT_EQ(status.Code(), StatusCode::kUnavailable);
    EXPECT_EQ(status.Message(), "Session store unavailable");
    EXPECT_EQ(guard::core::FromAuthError(AuthErrorCode::kStoreUnavailable, "redis down").Message(), "redis down");
    EXPECT_EQ(guard::core::FromAuthError(AuthErrorCode::kBlacklisted).Code(), StatusCode::kUnauthenticated);
}

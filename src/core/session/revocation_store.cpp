#include "core/session/revocation_store.hpp"

#include <algorithm>
#include <charconv>

namespace guard {
namespace core {

namespace {
constexpr std::int64_t kInitialTokenVersion = 1;
} // namespace

RevocationStore::RevocationStore(std::shared_ptr<guard::cache::KvStore> store, std::string key_prefix)
    : store_(std::move(store)), key_prefix_(std::move(key_prefix)) {}

std::string RevocationStore::BlacklistKey(const std::string& token_id) const {
    return key_prefix_ + "blacklist:" + token_id;
}

std::string RevocationStore::RefreshKey(const std::string& user_id, const std::string& session_id) const {
    return key_prefix_ + "refresh:" + user_id + ":" + session_id;
}

std::string RevocationStore::VersionKey(const std::string& user_id) const {
    return key_prefix_ + "token_version:" + user_id;
}

guard::common::Status RevocationStore::Blacklist(const std::string& token_id, std::chrono::seconds ttl) {
    if (token_id.empty()) {
        return guard::common::Status::InvalidArgument("token id is empty");
    }
    return store_->Set(BlacklistKey(token_id), "true", std::max(ttl, std::chrono::seconds(1)));
}

guard::common::StatusOr<bool> RevocationStore::IsBlacklisted(const std::string& token_id) {
    return store_->Exists(BlacklistKey(token_id));
}

guard::common::Status RevocationStore::PutRefreshHash(const std::string& user_id
                                                      , const std::string& session_id
                                                      , const std::string& hash
                                                      , std::chrono::seconds ttl) {
    return store_->Set(RefreshKey(user_id, session_id), hash, std::max(ttl, std::chrono::seconds(1)));
}

guard::common::StatusOr<std::string> RevocationStore::GetRefreshHash(const std::string& user_id
                                                                     , const std::string& session_id) {
    return store_->Get(RefreshKey(user_id, session_id));
}

guard::common::Status RevocationStore::DeleteRefreshHash(const std::string& user_id, const std::string& session_id) {
    return store_->Del(RefreshKey(user_id, session_id));
}

guard::common::StatusOr<std::int64_t> RevocationStore::GetTokenVersion(const std::string& user_id) {
    auto resp = store_->Get(VersionKey(user_id));
    if (!resp.IsOk()) {
        if (resp.GetStatus().Code() == guard::common::StatusCode::kNotFound) {
            return guard::common::StatusOr<std::int64_t>(kInitialTokenVersion);
        }
        return resp.GetStatus();
    }
    const auto& text = resp.Value();
    std::int64_t version = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), version);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return guard::common::Status::Internal("invalid token version for user " + user_id);
    }
    return guard::common::StatusOr<std::int64_t>(version);
}

// 读-改-写; 并发递增时至少有一次生效, 旧令牌仍会失效
guard::common::StatusOr<std::int64_t> RevocationStore::BumpTokenVersion(const std::string& user_id) {
    auto current = GetTokenVersion(user_id);
    if (!current.IsOk()) {
        return current.GetStatus();
    }
    const std::int64_t next = current.Value() + 1;
    auto status = store_->Set(VersionKey(user_id), std::to_string(next), std::chrono::seconds(0));
    if (!status.IsOk()) {
        return status;
    }
    return guard::common::StatusOr<std::int64_t>(next);
}

} // namespace core
} // namespace guard

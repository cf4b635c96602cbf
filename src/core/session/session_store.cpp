#include "core/session/session_store.hpp"

#include "common/logger.hpp"

#include <nlohmann/json.hpp>

namespace guard {
namespace core {

namespace {

std::string Serialize(const SessionRecord& record) {
    nlohmann::json j{
        {"session_id", record.session_id},
        {"user_id", record.user_id},
        {"device_fingerprint", record.device_fingerprint},
        {"ip_address", record.ip_address},
        {"user_agent", record.user_agent},
        {"created_at_ms", record.created_at_ms},
        {"last_activity_ms", record.last_activity_ms},
        {"is_active", record.is_active},
    };
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

guard::common::StatusOr<SessionRecord> Deserialize(const std::string& payload) {
    auto json = nlohmann::json::parse(payload, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return guard::common::Status::Internal("invalid session payload");
    }
    SessionRecord rec;
    rec.session_id = json.value("session_id", "");
    rec.user_id = json.value("user_id", "");
    rec.device_fingerprint = json.value("device_fingerprint", "");
    rec.ip_address = json.value("ip_address", "");
    rec.user_agent = json.value("user_agent", "");
    rec.created_at_ms = json.value("created_at_ms", 0LL);
    rec.last_activity_ms = json.value("last_activity_ms", 0LL);
    rec.is_active = json.value("is_active", false);
    return guard::common::StatusOr<SessionRecord>(std::move(rec));
}

} // namespace

SessionStore::SessionStore(std::shared_ptr<guard::cache::KvStore> store
                           , std::string key_prefix
                           , std::chrono::seconds retention
                           , std::shared_ptr<const guard::common::Clock> clock)
    : store_(std::move(store))
    , key_prefix_(std::move(key_prefix))
    , retention_(retention)
    , clock_(std::move(clock)) {}

std::string SessionStore::SessionPrefix() const {
    return key_prefix_ + "session:";
}

std::string SessionStore::KeyFor(const std::string& user_id, const std::string& session_id) const {
    return SessionPrefix() + user_id + ":" + session_id;
}

// 写入会话, TTL 按创建时间计算剩余保留期
guard::common::Status SessionStore::Put(const SessionRecord& record) {
    const std::int64_t now_ms = clock_->NowMillis();
    const std::int64_t expires_at_ms =
        record.created_at_ms + std::chrono::duration_cast<std::chrono::milliseconds>(retention_).count();
    const std::int64_t remaining_ms = expires_at_ms - now_ms;
    if (remaining_ms <= 0) {
        // 已超出保留期, 直接删除
        return store_->Del(KeyFor(record.user_id, record.session_id));
    }
    // 向上取整到秒
    const std::chrono::seconds ttl((remaining_ms + 999) / 1000);
    return store_->Set(KeyFor(record.user_id, record.session_id), Serialize(record), ttl);
}

guard::common::StatusOr<SessionRecord> SessionStore::Get(const std::string& user_id
                                                         , const std::string& session_id) {
    auto resp = store_->Get(KeyFor(user_id, session_id));
    if (!resp.IsOk()) {
        if (resp.GetStatus().Code() == guard::common::StatusCode::kNotFound) {
            return guard::common::Status::NotFound("Session not found");
        }
        return resp.GetStatus();
    }
    return Deserialize(resp.Value());
}

guard::common::StatusOr<std::vector<SessionRecord>> SessionStore::ListForUser(const std::string& user_id) {
    auto keys = store_->Keys(SessionPrefix() + guard::cache::EscapeGlob(user_id) + ":*");
    if (!keys.IsOk()) {
        return keys.GetStatus();
    }

    std::vector<SessionRecord> sessions;
    sessions.reserve(keys.Value().size());
    for (const auto& key : keys.Value()) {
        auto resp = store_->Get(key);
        if (!resp.IsOk()) {
            // 枚举与读取之间过期
            if (resp.GetStatus().Code() == guard::common::StatusCode::kNotFound) {
                continue;
            }
            return resp.GetStatus();
        }
        auto rec = Deserialize(resp.Value());
        if (!rec.IsOk()) {
            GUARD_LOG_WARN("[SessionStore] skip corrupt record {}: {}", key, rec.GetStatus().Message());
            continue;
        }
        // 用户ID含 ':' 时前缀模式可能匹配到别人的会话
        if (rec.Value().user_id != user_id) {
            continue;
        }
        sessions.push_back(std::move(rec.Value()));
    }
    return guard::common::StatusOr<std::vector<SessionRecord>>(std::move(sessions));
}

guard::common::StatusOr<std::string> SessionStore::FindOwner(const std::string& session_id) {
    const std::string suffix = ":" + session_id;
    auto keys = store_->Keys(SessionPrefix() + "*" + guard::cache::EscapeGlob(suffix));
    if (!keys.IsOk()) {
        return keys.GetStatus();
    }
    const std::string prefix = SessionPrefix();
    for (const auto& key : keys.Value()) {
        if (key.size() <= prefix.size() + suffix.size()) {
            continue;
        }
        return guard::common::StatusOr<std::string>(
            key.substr(prefix.size(), key.size() - prefix.size() - suffix.size()));
    }
    return guard::common::Status::NotFound("Session not found");
}

guard::common::Status SessionStore::MarkInactive(const std::string& user_id, const std::string& session_id) {
    auto rec = Get(user_id, session_id);
    if (!rec.IsOk()) {
        if (rec.GetStatus().Code() == guard::common::StatusCode::kNotFound) {
            return guard::common::Status::OK();
        }
        return rec.GetStatus();
    }
    auto record = std::move(rec.Value());
    if (!record.is_active) {
        return guard::common::Status::OK();
    }
    record.is_active = false;
    return Put(record);
}

guard::common::Status SessionStore::Touch(const std::string& user_id, const std::string& session_id) {
    auto rec = Get(user_id, session_id);
    if (!rec.IsOk()) {
        return rec.GetStatus();
    }
    auto record = std::move(rec.Value());
    record.last_activity_ms = clock_->NowMillis();
    return Put(record);
}

} // namespace core
} // namespace guard

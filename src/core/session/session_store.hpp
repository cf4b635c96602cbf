#pragma once

#include "cache/kv_store.hpp"
#include "common/clock.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace guard {
namespace core {

// 会话记录, 代表一个已认证的设备/浏览器实例
struct SessionRecord {
    std::string session_id;
    std::string user_id;
    std::string device_fingerprint;
    std::string ip_address;
    std::string user_agent;
    std::int64_t created_at_ms = 0;
    std::int64_t last_activity_ms = 0;
    bool is_active = true;
};

// 会话存储: session:<user_id>:<session_id> -> JSON
// 记录自创建起保留固定时长, 更新不会延长保留期
class SessionStore {
public:
    SessionStore(std::shared_ptr<guard::cache::KvStore> store
                 , std::string key_prefix
                 , std::chrono::seconds retention
                 , std::shared_ptr<const guard::common::Clock> clock);

    guard::common::Status Put(const SessionRecord& record);
    guard::common::StatusOr<SessionRecord> Get(const std::string& user_id, const std::string& session_id);
    // 用户的全部会话 (包括已失效但尚未过期的)
    guard::common::StatusOr<std::vector<SessionRecord>> ListForUser(const std::string& user_id);
    // 通过会话ID反查所属用户
    guard::common::StatusOr<std::string> FindOwner(const std::string& session_id);

    // 标记失效; 会话不存在时返回 OK
    guard::common::Status MarkInactive(const std::string& user_id, const std::string& session_id);
    // 更新最近活动时间
    guard::common::Status Touch(const std::string& user_id, const std::string& session_id);

private:
    std::string KeyFor(const std::string& user_id, const std::string& session_id) const;
    std::string SessionPrefix() const;

    std::shared_ptr<guard::cache::KvStore> store_;
    std::string key_prefix_;
    std::chrono::seconds retention_;
    std::shared_ptr<const guard::common::Clock> clock_;
};

} // namespace core
} // namespace guard

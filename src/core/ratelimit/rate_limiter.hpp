#pragma once

#include "cache/kv_store.hpp"
#include "common/clock.hpp"
#include "common/config.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace guard {
namespace core {

// 滑动窗口限流 (近似)
//
// 计数保存在 KvStore 中, 多个进程共享同一份额度:
//   ratelimit:<scope>:<id>:<window_index> -> 次数
// 估算值 = 上一窗口次数 * 未过去的比例 + 当前窗口次数
class RateLimiter {
public:
    RateLimiter(std::shared_ptr<guard::cache::KvStore> store
                , std::string key_prefix
                , std::string scope
                , guard::common::RateLimitRule rule
                , std::shared_ptr<const guard::common::Clock> clock = nullptr);

    // 允许则记录一次尝试; 被拒绝的尝试不计数
    guard::common::StatusOr<bool> Allow(const std::string& id);
    // 当前窗口剩余次数
    guard::common::StatusOr<std::int64_t> Remaining(const std::string& id);
    // 清除 id 的计数, 例如登录成功后
    guard::common::Status Reset(const std::string& id);

    const std::string& Scope() const { return scope_; }

private:
    struct Window {
        std::int64_t index = 0;
        double previous_weight = 0.0;
    };

    Window CurrentWindow() const;
    std::string KeyFor(const std::string& id, std::int64_t index) const;
    guard::common::StatusOr<std::int64_t> ReadCount(const std::string& key);
    // 上一窗口加权后的已用次数
    guard::common::StatusOr<double> Estimate(const std::string& id, const Window& window);

    std::shared_ptr<guard::cache::KvStore> store_;
    std::string key_prefix_;
    std::string scope_;
    guard::common::RateLimitRule rule_;
    std::shared_ptr<const guard::common::Clock> clock_;
};

} // namespace core
} // namespace guard

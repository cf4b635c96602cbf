#include "core/ratelimit/rate_limiter.hpp"

#include "common/logger.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>

namespace guard {
namespace core {

RateLimiter::RateLimiter(std::shared_ptr<guard::cache::KvStore> store
                         , std::string key_prefix
                         , std::string scope
                         , guard::common::RateLimitRule rule
                         , std::shared_ptr<const guard::common::Clock> clock)
    : store_(std::move(store))
    , key_prefix_(std::move(key_prefix))
    , scope_(std::move(scope))
    , rule_(rule)
    , clock_(clock ? std::move(clock) : std::make_shared<guard::common::SystemClock>()) {
    rule_.window_seconds = std::max(rule_.window_seconds, 1);
}

RateLimiter::Window RateLimiter::CurrentWindow() const {
    const std::int64_t window_ms = static_cast<std::int64_t>(rule_.window_seconds) * 1000;
    const std::int64_t now_ms = clock_->NowMillis();
    Window window;
    window.index = now_ms / window_ms;
    const std::int64_t elapsed_ms = now_ms % window_ms;
    window.previous_weight = static_cast<double>(window_ms - elapsed_ms) / static_cast<double>(window_ms);
    return window;
}

std::string RateLimiter::KeyFor(const std::string& id, std::int64_t index) const {
    return key_prefix_ + "ratelimit:" + scope_ + ":" + id + ":" + std::to_string(index);
}

guard::common::StatusOr<std::int64_t> RateLimiter::ReadCount(const std::string& key) {
    auto resp = store_->Get(key);
    if (!resp.IsOk()) {
        if (resp.GetStatus().Code() == guard::common::StatusCode::kNotFound) {
            return guard::common::StatusOr<std::int64_t>(std::int64_t{0});
        }
        return resp.GetStatus();
    }
    const auto& text = resp.Value();
    std::int64_t count = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), count);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        // 计数损坏时从 0 开始
        GUARD_LOG_WARN("[RateLimiter] invalid counter at {}", key);
        return guard::common::StatusOr<std::int64_t>(std::int64_t{0});
    }
    return guard::common::StatusOr<std::int64_t>(count);
}

guard::common::StatusOr<double> RateLimiter::Estimate(const std::string& id, const Window& window) {
    auto previous = ReadCount(KeyFor(id, window.index - 1));
    if (!previous.IsOk()) {
        return previous.GetStatus();
    }
    auto current = ReadCount(KeyFor(id, window.index));
    if (!current.IsOk()) {
        return current.GetStatus();
    }
    const double used = static_cast<double>(previous.Value()) * window.previous_weight
                        + static_cast<double>(current.Value());
    return guard::common::StatusOr<double>(used);
}

guard::common::StatusOr<bool> RateLimiter::Allow(const std::string& id) {
    const Window window = CurrentWindow();
    auto used = Estimate(id, window);
    if (!used.IsOk()) {
        return used.GetStatus();
    }
    if (used.Value() >= static_cast<double>(rule_.max_attempts)) {
        GUARD_LOG_WARN("[RateLimiter] {} limit reached for {}", scope_, id);
        return guard::common::StatusOr<bool>(false);
    }

    const std::string key = KeyFor(id, window.index);
    auto current = ReadCount(key);
    if (!current.IsOk()) {
        return current.GetStatus();
    }
    // 当前窗口的计数要在下一个窗口里继续参与估算
    auto status = store_->Set(key, std::to_string(current.Value() + 1)
                              , std::chrono::seconds(2 * static_cast<std::int64_t>(rule_.window_seconds)));
    if (!status.IsOk()) {
        return status;
    }
    return guard::common::StatusOr<bool>(true);
}

guard::common::StatusOr<std::int64_t> RateLimiter::Remaining(const std::string& id) {
    auto used = Estimate(id, CurrentWindow());
    if (!used.IsOk()) {
        return used.GetStatus();
    }
    const auto consumed = static_cast<std::int64_t>(std::ceil(used.Value()));
    return guard::common::StatusOr<std::int64_t>(
        std::max<std::int64_t>(rule_.max_attempts - consumed, 0));
}

guard::common::Status RateLimiter::Reset(const std::string& id) {
    const Window window = CurrentWindow();
    auto status = store_->Del(KeyFor(id, window.index));
    if (!status.IsOk()) {
        return status;
    }
    return store_->Del(KeyFor(id, window.index - 1));
}

} // namespace core
} // namespace guard

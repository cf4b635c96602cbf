#include "cache/in_memory_kv_store.hpp"

#include <algorithm>
#include <mutex>

namespace guard {
namespace cache {

bool GlobMatch(const std::string& pattern, const std::string& text) {
    std::size_t p = 0;
    std::size_t t = 0;
    std::size_t star = std::string::npos;
    std::size_t backtrack = 0;
    while (t < text.size()) {
        if (p + 1 < pattern.size() && pattern[p] == '\\') {
            // 转义字符按字面匹配
            if (pattern[p + 1] == text[t]) {
                p += 2;
                ++t;
                continue;
            }
            if (star == std::string::npos) {
                return false;
            }
            p = star + 1;
            t = ++backtrack;
        } else if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
            ++p;
            ++t;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            backtrack = t;
        } else if (star != std::string::npos) {
            p = star + 1;
            t = ++backtrack;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

InMemoryKvStore::InMemoryKvStore(std::shared_ptr<const guard::common::Clock> clock)
    : clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = std::make_shared<guard::common::SystemClock>();
    }
}

guard::common::Status InMemoryKvStore::Set(const std::string& key, const std::string& value,
                                           std::chrono::seconds ttl) {
    Entry entry;
    entry.value = value;
    if (ttl.count() > 0) {
        entry.expires_at_ms = clock_->NowMillis() +
            std::chrono::duration_cast<std::chrono::milliseconds>(ttl).count();
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_[key] = std::move(entry);
    return guard::common::Status::OK();
}

guard::common::StatusOr<std::string> InMemoryKvStore::Get(const std::string& key) {
    const auto now = clock_->NowMillis();
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end() && !Expired(it->second, now)) {
            return guard::common::StatusOr<std::string>(it->second.value);
        }
        if (it == entries_.end()) {
            return guard::common::Status::NotFound("Key not found: " + key);
        }
    }
    // 已过期, 升级为写锁后清除
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end() && Expired(it->second, now)) {
        entries_.erase(it);
    }
    return guard::common::Status::NotFound("Key not found: " + key);
}

guard::common::Status InMemoryKvStore::Del(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.erase(key);
    return guard::common::Status::OK();
}

guard::common::StatusOr<std::vector<std::string>> InMemoryKvStore::Keys(const std::string& pattern) {
    const auto now = clock_->NowMillis();
    std::vector<std::string> keys;
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (Expired(it->second, now)) {
            it = entries_.erase(it);
            continue;
        }
        if (GlobMatch(pattern, it->first)) {
            keys.push_back(it->first);
        }
        ++it;
    }
    std::sort(keys.begin(), keys.end());
    return guard::common::StatusOr<std::vector<std::string>>(std::move(keys));
}

guard::common::StatusOr<bool> InMemoryKvStore::Exists(const std::string& key) {
    const auto now = clock_->NowMillis();
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(key);
    return guard::common::StatusOr<bool>(it != entries_.end() && !Expired(it->second, now));
}

std::chrono::seconds InMemoryKvStore::Ttl(const std::string& key) const {
    const auto now = clock_->NowMillis();
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end() || Expired(it->second, now)) {
        return std::chrono::seconds(-2);
    }
    if (it->second.expires_at_ms == 0) {
        return std::chrono::seconds(-1);
    }
    // 向上取整
    return std::chrono::seconds((it->second.expires_at_ms - now + 999) / 1000);
}

} // namespace cache
} // namespace guard

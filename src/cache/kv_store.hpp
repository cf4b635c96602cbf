#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace guard {
namespace cache {

// 带过期时间的键值存储接口
// 所有会话与吊销数据只通过这五个操作持久化
class KvStore {
public:
    virtual ~KvStore() = default;

    // ttl 为 0 表示不过期
    virtual guard::common::Status Set(const std::string& key, const std::string& value,
                                      std::chrono::seconds ttl) = 0;
    // 键不存在时返回 kNotFound
    virtual guard::common::StatusOr<std::string> Get(const std::string& key) = 0;
    // 删除不存在的键也返回 OK
    virtual guard::common::Status Del(const std::string& key) = 0;
    // glob 风格匹配 ('*' '?', 反斜杠转义)
    virtual guard::common::StatusOr<std::vector<std::string>> Keys(const std::string& pattern) = 0;
    virtual guard::common::StatusOr<bool> Exists(const std::string& key) = 0;
};

// 转义 glob 特殊字符, 用于把用户输入拼进 Keys 模式
inline std::string EscapeGlob(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

} // namespace cache
} // namespace guard

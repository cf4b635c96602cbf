#pragma once

#include <string>

namespace guard {
namespace core {

// 设备指纹: SHA-256(user_agent | ip | salt)
// 只用于发现令牌被拷贝到其他机器/网络, 不是完整的客户端指纹
class FingerprintGenerator {
public:
    explicit FingerprintGenerator(std::string salt);

    std::string Fingerprint(const std::string& user_agent, const std::string& ip) const;
    bool Matches(const std::string& expected, const std::string& user_agent, const std::string& ip) const;

    // 对外展示用, 只保留前 8 位
    static std::string Mask(const std::string& fingerprint);

private:
    std::string salt_;
};

}
}

#include "core/token/fingerprint.hpp"

#include "common/crypto.hpp"

namespace guard {
namespace core {

FingerprintGenerator::FingerprintGenerator(std::string salt) : salt_(std::move(salt)) {}

std::string FingerprintGenerator::Fingerprint(const std::string& user_agent, const std::string& ip) const {
    std::string material;
    material.reserve(user_agent.size() + ip.size() + salt_.size() + 2);
    material.append(user_agent).append("|").append(ip).append("|").append(salt_);
    return guard::common::Sha256Hex(material);
}

bool FingerprintGenerator::Matches(const std::string& expected
                                   , const std::string& user_agent
                                   , const std::string& ip) const {
    const std::string actual = Fingerprint(user_agent, ip);
    if (actual.empty()) {
        return false;
    }
    return guard::common::ConstantTimeEquals(expected, actual);
}

std::string FingerprintGenerator::Mask(const std::string& fingerprint) {
    constexpr std::size_t kVisible = 8;
    if (fingerprint.size() <= kVisible) {
        return fingerprint;
    }
    return fingerprint.substr(0, kVisible) + "...";
}

}
}

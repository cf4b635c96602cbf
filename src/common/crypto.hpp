#pragma once

#include "common/status_or.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace guard {
namespace common {

// SHA-256 摘要, 小写十六进制 (64 字符)
std::string Sha256Hex(std::string_view data);

// 使用 OpenSSL CSPRNG 生成 bytes 字节的随机数, 以十六进制返回
StatusOr<std::string> RandomHex(std::size_t bytes);

// 常量时间比较, 避免计时侧信道
bool ConstantTimeEquals(std::string_view a, std::string_view b);

}
}

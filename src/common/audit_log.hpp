#pragma once

#include "common/clock.hpp"

#include <nlohmann/json.hpp>

#include <string_view>

namespace guard {
namespace common {

// 写入一条结构化审计事件 (一行 JSON)
// 例: {"event":"session.created","ts":1700000000000,"user_id":"u1",...}
// clock 为空时使用系统时间
void Audit(std::string_view event
           , nlohmann::json fields = nlohmann::json::object()
           , const Clock* clock = nullptr);

}
}

#pragma once

#include <chrono>
#include <cstdint>

namespace guard {
namespace common {

// 时间源接口, 便于测试注入
class Clock {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    virtual ~Clock() = default;
    virtual TimePoint Now() const = 0;

    std::int64_t NowMillis() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(Now().time_since_epoch()).count();
    }
};

class SystemClock : public Clock {
public:
    TimePoint Now() const override {
        return std::chrono::system_clock::now();
    }
};

}
}

#pragma once

#include "common/status.hpp"

#include <type_traits>
#include <utility>

namespace guard {
namespace common {

// 返回一个包含状态或值的对象
template <typename T>
class StatusOr {
public:
    // 不带值时不允许是 OK 状态
    StatusOr(const Status& status) : status_(status) {
        EnsureError();
    }
    StatusOr(Status&& status) : status_(std::move(status)) {
        EnsureError();
    }

    template <class U = T, std::enable_if_t<std::is_constructible_v<T, U&&>, int> = 0>
    explicit StatusOr(U&& value)
        : status_(Status::OK()), value_(std::forward<U>(value)) {}

    bool IsOk() const {
        return status_.IsOk();
    }
    const Status& GetStatus() const {
        return status_;
    }

    // 访问存储的值
    T& Value() & {
        return value_;
    }
    T&& Value() && {
        return std::move(value_);
    }
    const T& Value() const& {
        return value_;
    }
    const T&& Value() const&& = delete;
private:
    void EnsureError() {
        if (status_.IsOk()) {
            status_ = Status::Internal("StatusOr constructed from OK status without a value");
        }
    }

    Status status_;
    T value_{};
};

}
}
#pragma once

#include "fastdocx/core/ErrorCode.hpp"
#include <utility>
#include <new>

namespace fastdocx {
namespace core {

/**
 * @brief Expected<T, E> - 不抛异常的查找结果
 *
 * 类似 std::expected (C++23)。包结构的底层查找（按类型找关系、按名找部件）
 * 通过它返回"未找到"，由上层决定是修复还是报错。
 */
template<typename T, typename E = Error>
class Expected {
private:
    union {
        T value_;
        E error_;
    };
    bool has_value_;

    void destroy() noexcept {
        if (has_value_) {
            value_.~T();
        } else {
            error_.~E();
        }
    }

public:
    using value_type = T;
    using error_type = E;

    Expected(const T& value) : has_value_(true) {
        new(&value_) T(value);
    }

    Expected(T&& value) : has_value_(true) {
        new(&value_) T(std::move(value));
    }

    Expected(const E& error) : has_value_(false) {
        new(&error_) E(error);
    }

    Expected(E&& error) : has_value_(false) {
        new(&error_) E(std::move(error));
    }

    Expected(const Expected& other) : has_value_(other.has_value_) {
        if (has_value_) {
            new(&value_) T(other.value_);
        } else {
            new(&error_) E(other.error_);
        }
    }

    Expected(Expected&& other) noexcept : has_value_(other.has_value_) {
        if (has_value_) {
            new(&value_) T(std::move(other.value_));
        } else {
            new(&error_) E(std::move(other.error_));
        }
    }

    ~Expected() {
        destroy();
    }

    Expected& operator=(const Expected& other) {
        if (this != &other) {
            destroy();
            has_value_ = other.has_value_;
            if (has_value_) {
                new(&value_) T(other.value_);
            } else {
                new(&error_) E(other.error_);
            }
        }
        return *this;
    }

    Expected& operator=(Expected&& other) noexcept {
        if (this != &other) {
            destroy();
            has_value_ = other.has_value_;
            if (has_value_) {
                new(&value_) T(std::move(other.value_));
            } else {
                new(&error_) E(std::move(other.error_));
            }
        }
        return *this;
    }

    // ========== 状态检查 ==========

    bool hasValue() const noexcept { return has_value_; }

    explicit operator bool() const noexcept { return has_value_; }

    // ========== 值访问（调用方负责先检查状态） ==========

    T& value() & noexcept { return value_; }
    const T& value() const & noexcept { return value_; }

    E& error() & noexcept { return error_; }
    const E& error() const & noexcept { return error_; }

    T& operator*() & noexcept { return value_; }
    const T& operator*() const & noexcept { return value_; }

    T* operator->() noexcept { return &value_; }
    const T* operator->() const noexcept { return &value_; }
};

// ========== 类型别名 ==========

template<typename T>
using Result = Expected<T, Error>;

}} // namespace fastdocx::core

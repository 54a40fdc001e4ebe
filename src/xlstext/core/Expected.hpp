#pragma once

#include "xlstext/core/ErrorCode.hpp"
#include <type_traits>
#include <utility>
#include <new>

namespace xlstext {
namespace core {

/**
 * @brief 把Error转换成对应的异常并抛出（实现在Exception.cpp）
 */
[[noreturn]] void throwError(const Error& error);

/**
 * @brief Expected<T, E> - 成功值或错误二选一
 *
 * 类似于std::expected (C++23)。库内部的可失败操作都返回它，
 * 只有在用户层（命令行工具）才通过valueOrThrow()转成异常。
 */
template<typename T, typename E = Error>
class Expected {
private:
    union {
        T value_;
        E error_;
    };
    bool has_value_;

public:
    using value_type = T;
    using error_type = E;

    Expected() : has_value_(true) {
        new(&value_) T{};
    }

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
        if (has_value_) {
            value_.~T();
        } else {
            error_.~E();
        }
    }

    Expected& operator=(const Expected& other) {
        if (this != &other) {
            this->~Expected();
            new(this) Expected(other);
        }
        return *this;
    }

    Expected& operator=(Expected&& other) noexcept {
        if (this != &other) {
            this->~Expected();
            new(this) Expected(std::move(other));
        }
        return *this;
    }

    // ========== 状态检查 ==========

    bool hasValue() const noexcept { return has_value_; }
    bool hasError() const noexcept { return !has_value_; }

    explicit operator bool() const noexcept { return has_value_; }

    // ========== 值访问（不检查） ==========

    T& value() & noexcept { return value_; }
    const T& value() const & noexcept { return value_; }
    T&& value() && noexcept { return std::move(value_); }

    E& error() & noexcept { return error_; }
    const E& error() const & noexcept { return error_; }
    E&& error() && noexcept { return std::move(error_); }

    /**
     * @brief 取值，失败时抛出异常
     */
    T& valueOrThrow() & {
        if (!has_value_) {
            raise();
        }
        return value_;
    }

    T valueOrThrow() && {
        if (!has_value_) {
            raise();
        }
        return std::move(value_);
    }

private:
    [[noreturn]] void raise() const {
        if constexpr (std::is_same_v<E, Error>) {
            throwError(error_);
        } else {
            throw E(error_);
        }
    }
};

// ========== 类型别名 ==========

template<typename T>
using Result = Expected<T, Error>;

}} // namespace xlstext::core

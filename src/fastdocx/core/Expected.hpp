#pragma once

#include "fastdocx/core/ErrorCode.hpp"
#include <type_traits>
#include <utility>
#include <new>

namespace fastdocx {
namespace core {

/**
 * @brief Expected<T, E> - 值或错误二选一的返回类型
 *
 * 与std::expected (C++23)语义相近：
 * - 底层路径不抛异常，错误随返回值传递
 * - 支持移动语义
 * - 支持map/andThen链式组合
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

    // ========== 构造函数 ==========

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
        destroy();
    }

    // ========== 赋值操作符 ==========

    Expected& operator=(const Expected& other) {
        if (this != &other) {
            destroy();
            new(this) Expected(other);
        }
        return *this;
    }

    Expected& operator=(Expected&& other) noexcept {
        if (this != &other) {
            destroy();
            new(this) Expected(std::move(other));
        }
        return *this;
    }

    // ========== 状态检查 ==========

    bool hasValue() const noexcept { return has_value_; }
    bool hasError() const noexcept { return !has_value_; }

    explicit operator bool() const noexcept { return has_value_; }

    // ========== 值访问 ==========

    /**
     * @brief 获取值（不检查，调用前须确认hasValue()）
     */
    T& value() & noexcept { return value_; }
    const T& value() const & noexcept { return value_; }
    T&& value() && noexcept { return std::move(value_); }

    /**
     * @brief 获取错误（不检查，调用前须确认hasError()）
     */
    E& error() & noexcept { return error_; }
    const E& error() const & noexcept { return error_; }
    E&& error() && noexcept { return std::move(error_); }

    const T& valueOr(const T& default_value) const & noexcept {
        return has_value_ ? value_ : default_value;
    }

    T valueOr(T&& default_value) && {
        return has_value_ ? std::move(value_) : std::move(default_value);
    }

    T& operator*() & noexcept { return value_; }
    const T& operator*() const & noexcept { return value_; }
    T&& operator*() && noexcept { return std::move(value_); }

    T* operator->() noexcept { return &value_; }
    const T* operator->() const noexcept { return &value_; }

    // ========== 函数式操作 ==========

    /**
     * @brief 成功时映射值，失败时透传错误
     */
    template<typename F>
    auto map(F&& func) const -> Expected<std::decay_t<decltype(func(value_))>, E> {
        using U = std::decay_t<decltype(func(value_))>;
        if (has_value_) {
            return Expected<U, E>(func(value_));
        }
        return Expected<U, E>(error_);
    }

    /**
     * @brief 链式操作，func须返回Expected
     */
    template<typename F>
    auto andThen(F&& func) const -> decltype(func(value_)) {
        if (has_value_) {
            return func(value_);
        }
        return decltype(func(value_))(error_);
    }

    /**
     * @brief 抛出异常（如果是错误）
     */
    const T& valueOrThrow() const & {
        if (!has_value_) {
            throwError(error_);
        }
        return value_;
    }

    T valueOrThrow() && {
        if (!has_value_) {
            throwError(error_);
        }
        return std::move(value_);
    }

private:
    void destroy() noexcept {
        if (has_value_) {
            value_.~T();
        } else {
            error_.~E();
        }
    }
};

/**
 * @brief 特化：void类型的Expected
 */
template<typename E>
class Expected<void, E> {
private:
    E error_;
    bool has_value_;

public:
    using value_type = void;
    using error_type = E;

    Expected() : has_value_(true) {}

    Expected(const E& error) : error_(error), has_value_(false) {}
    Expected(E&& error) : error_(std::move(error)), has_value_(false) {}

    bool hasValue() const noexcept { return has_value_; }
    bool hasError() const noexcept { return !has_value_; }

    explicit operator bool() const noexcept { return has_value_; }

    E& error() & noexcept { return error_; }
    const E& error() const & noexcept { return error_; }
    E&& error() && noexcept { return std::move(error_); }

    void valueOrThrow() const {
        if (!has_value_) {
            throwError(error_);
        }
    }
};

// ========== 类型别名 ==========

template<typename T>
using Result = Expected<T, Error>;

using VoidResult = Expected<void, Error>;

/**
 * @brief 成功的VoidResult
 */
inline VoidResult success() {
    return VoidResult();
}

}} // namespace fastdocx::core

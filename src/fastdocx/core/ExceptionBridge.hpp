/**
 * @file ExceptionBridge.hpp
 * @brief 异常转换层：连接底层Result/Expected和用户层Exception
 */

#pragma once

#include "Expected.hpp"
#include "ErrorCode.hpp"
#include "Exception.hpp"
#include <new>
#include <type_traits>

namespace fastdocx {
namespace core {

/**
 * @brief 异常转换层
 *
 * 底层模块统一返回Result/VoidResult，
 * 面向用户的便利接口通过本类转换为FastDocxException体系。
 */
class ExceptionBridge {
public:
    /**
     * @brief 将Result转换为值，失败时抛出异常
     * @throws FastDocxException 如果result包含错误
     */
    template<typename T>
    static T unwrap(Result<T>&& result) {
        if (result.hasError()) {
            throwFromError(result.error());
        }
        return std::move(result.value());
    }

    template<typename T>
    static T unwrap(const Result<T>& result) {
        if (result.hasError()) {
            throwFromError(result.error());
        }
        return result.value();
    }

    static void unwrap(const VoidResult& result) {
        if (result.hasError()) {
            throwFromError(result.error());
        }
    }

    /**
     * @brief 捕获异常并转换为Result
     * @param func 可能抛出异常的函数
     */
    template<typename F>
    static auto wrapCall(F&& func) -> Result<std::decay_t<decltype(func())>> {
        try {
            return Result<std::decay_t<decltype(func())>>(func());
        } catch (const FastDocxException& e) {
            return makeError(e.getErrorCode(), e.what());
        } catch (const std::bad_alloc&) {
            return makeError(ErrorCode::InternalError, "Memory allocation failed");
        } catch (const std::exception& e) {
            return makeError(ErrorCode::InternalError, e.what());
        }
    }

    /**
     * @brief 从ErrorCode映射到异常类型并抛出
     */
    [[noreturn]] static void throwFromError(const Error& error) {
        throwError(error);
    }
};

// 在用户层API中使用，自动转换Result为异常
#define FASTDOCX_UNWRAP(result) \
    fastdocx::core::ExceptionBridge::unwrap(result)

}} // namespace fastdocx::core

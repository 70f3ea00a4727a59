#pragma once

#include <cstdint>
#include <string>
#include <fmt/format.h>

namespace fastdocx {
namespace core {

/**
 * @brief FastDocx统一错误码
 *
 * 按区段划分：
 * - 1-19   通用错误
 * - 20-39  容器（zip包）错误
 * - 40-59  格式错误
 * - 60-69  引用错误
 * - 70-79  XML处理错误
 * - 80-89  外部协作组件错误
 */
enum class ErrorCode : uint8_t {
    // 成功
    Ok = 0,

    // 通用错误 (1-19)
    InvalidArgument = 1,
    InternalError = 3,

    // 容器错误 (20-39)
    ContainerUnreadable = 20,
    PartNotFound = 21,
    PartReadError = 22,

    // 格式错误 (40-59)
    MalformedRelationshipId = 40,
    MultipleRootElements = 41,
    MissingRootElement = 42,
    InvalidReferenceType = 43,

    // 引用错误 (60-69)
    MissingRelationshipTarget = 60,

    // XML处理错误 (70-79)
    XmlParseError = 70,
    XmlMissingElement = 71,

    // 协作组件错误 (80-89)
    StylesImportFailed = 80
};

/**
 * @brief 错误信息结构
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;  // 部件路径或关系ID

    Error() : code(ErrorCode::Ok) {}

    explicit Error(ErrorCode c);

    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}

    Error(ErrorCode c, const std::string& msg, const std::string& ctx)
        : code(c), message(msg), context(ctx) {}

    bool isOk() const noexcept { return code == ErrorCode::Ok; }
    bool isError() const noexcept { return code != ErrorCode::Ok; }

    std::string fullMessage() const {
        if (context.empty()) {
            return message;
        }
        return fmt::format("{} (Context: {})", message, context);
    }
};

/**
 * @brief 错误码转字符串
 */
const char* toString(ErrorCode code) noexcept;

/**
 * @brief 错误码是否属于容器类错误
 */
constexpr bool isContainerError(ErrorCode code) noexcept {
    return static_cast<uint8_t>(code) >= 20 && static_cast<uint8_t>(code) < 40;
}

/**
 * @brief 错误码是否属于格式类错误（含XML）
 */
constexpr bool isFormatError(ErrorCode code) noexcept {
    const auto v = static_cast<uint8_t>(code);
    return (v >= 40 && v < 60) || (v >= 70 && v < 80);
}

inline Error makeError(ErrorCode code) {
    return Error(code);
}

inline Error makeError(ErrorCode code, const std::string& message) {
    return Error(code, message);
}

inline Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    return Error(code, message, context);
}

/**
 * @brief 将错误转换为对应的异常并抛出（实现位于Exception.cpp）
 */
[[noreturn]] void throwError(const Error& error);

}} // namespace fastdocx::core

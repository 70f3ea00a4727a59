#pragma once

namespace fastdocx {
namespace archive {

// 错误码枚举
enum class ZipError {
    Ok,                   // 操作成功
    NotOpen,              // ZIP 文件未打开
    IoFail,               // I/O 操作失败
    BadFormat,            // ZIP 格式错误
    TooLarge,             // 条目太大
    FileNotFound,         // 条目未找到
    InvalidParameter,     // 无效参数
    InternalError         // 内部错误
};

// 只有 ZipError::Ok 被视为成功
constexpr bool operator!(ZipError error) noexcept {
    return error != ZipError::Ok;
}

constexpr bool isSuccess(ZipError error) noexcept {
    return error == ZipError::Ok;
}

constexpr bool isError(ZipError error) noexcept {
    return error != ZipError::Ok;
}

constexpr const char* toString(ZipError error) noexcept {
    switch (error) {
        case ZipError::Ok:               return "Ok";
        case ZipError::NotOpen:          return "NotOpen";
        case ZipError::IoFail:           return "IoFail";
        case ZipError::BadFormat:        return "BadFormat";
        case ZipError::TooLarge:         return "TooLarge";
        case ZipError::FileNotFound:     return "FileNotFound";
        case ZipError::InvalidParameter: return "InvalidParameter";
        case ZipError::InternalError:    return "InternalError";
    }
    return "Unknown";
}

}} // namespace fastdocx::archive

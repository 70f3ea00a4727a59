#include "fastdocx/core/ErrorCode.hpp"

namespace fastdocx {
namespace core {

Error::Error(ErrorCode c) : code(c), message(toString(c)) {}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:
            return "Success";

        // 通用错误
        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::InternalError:
            return "Internal error";

        // 容器错误
        case ErrorCode::ContainerUnreadable:
            return "Container unreadable";
        case ErrorCode::PartNotFound:
            return "Part not found";
        case ErrorCode::PartReadError:
            return "Part read error";

        // 格式错误
        case ErrorCode::MalformedRelationshipId:
            return "Malformed relationship id";
        case ErrorCode::MultipleRootElements:
            return "Multiple root elements";
        case ErrorCode::MissingRootElement:
            return "Missing root element";
        case ErrorCode::InvalidReferenceType:
            return "Invalid reference type";

        // 引用错误
        case ErrorCode::MissingRelationshipTarget:
            return "Missing relationship target";

        // XML处理错误
        case ErrorCode::XmlParseError:
            return "XML parse error";
        case ErrorCode::XmlMissingElement:
            return "Missing XML element";

        case ErrorCode::StylesImportFailed:
            return "Styles import failed";

        default:
            return "Unknown error";
    }
}

}} // namespace fastdocx::core

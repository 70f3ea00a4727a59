/**
 * @file Exception.cpp
 * @brief FastDocx异常类实现
 */

#include "Exception.hpp"
#include <sstream>
#include <fmt/format.h>

namespace fastdocx {
namespace core {

// FastDocxException 实现
FastDocxException::FastDocxException(const std::string& message,
                                     ErrorCode code,
                                     const char* file,
                                     int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string FastDocxException::getErrorCodeString() const {
    switch (error_code_) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InternalError: return "InternalError";
        case ErrorCode::ContainerUnreadable: return "ContainerUnreadable";
        case ErrorCode::PartNotFound: return "PartNotFound";
        case ErrorCode::PartReadError: return "PartReadError";
        case ErrorCode::MalformedRelationshipId: return "MalformedRelationshipId";
        case ErrorCode::MultipleRootElements: return "MultipleRootElements";
        case ErrorCode::MissingRootElement: return "MissingRootElement";
        case ErrorCode::InvalidReferenceType: return "InvalidReferenceType";
        case ErrorCode::MissingRelationshipTarget: return "MissingRelationshipTarget";
        case ErrorCode::XmlParseError: return "XmlParseError";
        case ErrorCode::XmlMissingElement: return "XmlMissingElement";
        case ErrorCode::StylesImportFailed: return "StylesImportFailed";
        default: return "Unknown";
    }
}

std::string FastDocxException::getDetailedMessage() const {
    std::ostringstream oss;
    oss << "[" << getErrorCodeString() << "] " << what();

    if (file_ && line_ > 0) {
        oss << " (at " << file_ << ":" << line_ << ")";
    }

    if (!context_.empty()) {
        oss << "\nContext:";
        for (const auto& ctx : context_) {
            oss << "\n  - " << ctx;
        }
    }

    return oss.str();
}

void FastDocxException::addContext(const std::string& context) {
    context_.push_back(context);
}

// ContainerException 实现
ContainerException::ContainerException(const std::string& message, const std::string& part_name,
                                       ErrorCode code, const char* file, int line)
    : FastDocxException(part_name.empty() ? message : fmt::format("{} (part: {})", message, part_name),
                        code, file, line)
    , part_name_(part_name) {
}

// FormatException 实现
FormatException::FormatException(const std::string& message,
                                 ErrorCode code, const char* file, int line)
    : FastDocxException(message, code, file, line) {
}

// ReferenceException 实现
ReferenceException::ReferenceException(const std::string& message,
                                       const std::string& relationship_id,
                                       const char* file, int line)
    : FastDocxException(message, ErrorCode::MissingRelationshipTarget, file, line)
    , relationship_id_(relationship_id) {
}

// XMLException 实现
XMLException::XMLException(const std::string& message,
                           const std::string& xml_path,
                           ErrorCode code, const char* file, int line)
    : FastDocxException(message, code, file, line)
    , xml_path_(xml_path) {
}

void throwError(const Error& error) {
    const std::string message = error.fullMessage();
    switch (error.code) {
        case ErrorCode::ContainerUnreadable:
        case ErrorCode::PartNotFound:
        case ErrorCode::PartReadError:
            throw ContainerException(message, error.context, error.code);

        case ErrorCode::MalformedRelationshipId:
        case ErrorCode::MultipleRootElements:
        case ErrorCode::MissingRootElement:
        case ErrorCode::InvalidReferenceType:
            throw FormatException(message, error.code);

        case ErrorCode::MissingRelationshipTarget:
            throw ReferenceException(message, error.context);

        case ErrorCode::XmlParseError:
        case ErrorCode::XmlMissingElement:
            throw XMLException(message, error.context, error.code);

        default:
            throw FastDocxException(message, error.code);
    }
}

}} // namespace fastdocx::core

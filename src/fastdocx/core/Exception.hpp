/**
 * @file Exception.hpp
 * @brief FastDocx异常类定义
 */

#ifndef FASTDOCX_EXCEPTION_HPP
#define FASTDOCX_EXCEPTION_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include "ErrorCode.hpp"

namespace fastdocx {
namespace core {

/**
 * @brief FastDocx基础异常类
 */
class FastDocxException : public std::runtime_error {
public:
    /**
     * @brief 构造函数
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的文件名
     * @param line 发生错误的行号
     */
    FastDocxException(const std::string& message,
                      ErrorCode code = ErrorCode::InternalError,
                      const char* file = nullptr,
                      int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }

    std::string getErrorCodeString() const;

    /**
     * @brief 获取详细错误信息，包含错误码、源码位置和上下文
     */
    std::string getDetailedMessage() const;

    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

    void addContext(const std::string& context);
    const std::vector<std::string>& getContext() const { return context_; }

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
    std::vector<std::string> context_;
};

/**
 * @brief 容器相关异常（无法打开的包、缺失或不可读的部件）
 */
class ContainerException : public FastDocxException {
public:
    ContainerException(const std::string& message, const std::string& part_name,
                       ErrorCode code = ErrorCode::PartNotFound,
                       const char* file = nullptr, int line = 0);

    const std::string& getPartName() const { return part_name_; }

private:
    std::string part_name_;
};

/**
 * @brief 格式相关异常
 */
class FormatException : public FastDocxException {
public:
    FormatException(const std::string& message,
                    ErrorCode code = ErrorCode::MalformedRelationshipId,
                    const char* file = nullptr, int line = 0);
};

/**
 * @brief 引用相关异常（节属性引用了不存在的关系）
 */
class ReferenceException : public FastDocxException {
public:
    ReferenceException(const std::string& message,
                       const std::string& relationship_id = "",
                       const char* file = nullptr, int line = 0);

    const std::string& getRelationshipId() const { return relationship_id_; }

private:
    std::string relationship_id_;
};

/**
 * @brief XML解析异常
 */
class XMLException : public FastDocxException {
public:
    XMLException(const std::string& message,
                 const std::string& xml_path = "",
                 ErrorCode code = ErrorCode::XmlParseError,
                 const char* file = nullptr, int line = 0);

    const std::string& getXMLPath() const { return xml_path_; }

private:
    std::string xml_path_;
};

} // namespace core
} // namespace fastdocx

// 便捷宏定义
#define FASTDOCX_THROW(ExceptionType, message, code) \
    throw ExceptionType(message, code, __FILE__, __LINE__)

#define FASTDOCX_THROW_IF(condition, ExceptionType, message, code) \
    do { if (condition) { FASTDOCX_THROW(ExceptionType, message, code); } } while(0)

#endif // FASTDOCX_EXCEPTION_HPP

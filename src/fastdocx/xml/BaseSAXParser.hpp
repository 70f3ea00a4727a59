#pragma once

#include "fastdocx/xml/XMLStreamReader.hpp"
#include "fastdocx/utils/ModuleLoggers.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace fastdocx {
namespace xml {

/**
 * @brief 通用SAX解析器基类
 *
 * 负责XMLStreamReader的回调接线与错误状态管理，
 * 子类只需实现onStartElement/onEndElement/onText。
 */
class BaseSAXParser {
protected:
    struct ParseState {
        bool has_error = false;
        std::string error_message;

        void reset() {
            has_error = false;
            error_message.clear();
        }
    };

    ParseState state_;

    // 是否去除文本两端空白，子类可在解析前修改
    bool trim_whitespace_ = true;

public:
    BaseSAXParser() = default;
    virtual ~BaseSAXParser() = default;

    BaseSAXParser(const BaseSAXParser&) = delete;
    BaseSAXParser& operator=(const BaseSAXParser&) = delete;

    /**
     * @brief 解析XML内容的统一入口
     * @param xml_content XML字符串内容
     * @return 是否解析成功
     */
    bool parseXML(const std::string& xml_content) {
        state_.reset();

        if (xml_content.empty()) {
            setError("Empty XML content");
            return false;
        }

        XMLStreamReader reader;
        reader.setTrimWhitespace(trim_whitespace_);

        reader.setStartElementCallback([this](std::string_view name, const std::vector<XMLAttribute>& attributes, int depth) {
            onStartElement(name, attributes, depth);
        });

        reader.setEndElementCallback([this](std::string_view name, int depth) {
            onEndElement(name, depth);
        });

        reader.setTextCallback([this](std::string_view text, int depth) {
            onText(text, depth);
        });

        reader.setErrorCallback([this](XMLParseError, const std::string& message, int line, int column) {
            state_.has_error = true;
            state_.error_message = "XML Parse Error at line " + std::to_string(line) +
                                   ", column " + std::to_string(column) + ": " + message;
        });

        auto result = reader.parseFromString(xml_content);

        if (result != XMLParseError::Ok) {
            if (!state_.has_error) {
                state_.has_error = true;
                state_.error_message = "XML parsing failed";
            }
            XML_DEBUG("SAX Parser Error: {}", state_.error_message);
            return false;
        }

        return !state_.has_error;
    }

    bool hasError() const { return state_.has_error; }
    const std::string& getErrorMessage() const { return state_.error_message; }

protected:
    // 子类重写的虚函数
    virtual void onStartElement(std::string_view name, const std::vector<XMLAttribute>& attributes, int depth) = 0;
    virtual void onEndElement(std::string_view name, int depth) = 0;
    virtual void onText(std::string_view /*text*/, int /*depth*/) {}

    void setError(const std::string& message) {
        state_.has_error = true;
        state_.error_message = message;
        XML_DEBUG("Parser Error: {}", message);
    }
};

}} // namespace fastdocx::xml

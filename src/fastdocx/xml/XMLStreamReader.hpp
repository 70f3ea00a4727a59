#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <functional>
#include <expat.h>

namespace fastdocx {
namespace xml {

/**
 * @brief 流式XML解析器，基于libexpat
 *
 * - SAX事件驱动，回调中的string_view只在回调期间有效
 * - 文本按文档顺序上报：子元素开始前先上报父元素中已累积的文本，
 *   因此混合内容中文本与子元素的相对位置得以保留
 * - 可选择是否去除文本两端空白
 */

// 解析错误枚举
enum class XMLParseError {
    Ok,                    // 解析成功
    InvalidInput,          // 无效输入
    ParserCreateFailed,    // 解析器创建失败
    ParseFailed,           // 解析失败（文档不是格式良好的XML）
    MemoryError,           // 内存错误
    CallbackError          // 回调函数错误
};

constexpr bool operator!(XMLParseError error) noexcept {
    return error != XMLParseError::Ok;
}

constexpr bool isSuccess(XMLParseError error) noexcept {
    return error == XMLParseError::Ok;
}

constexpr bool isError(XMLParseError error) noexcept {
    return error != XMLParseError::Ok;
}

// XML属性（引用expat内部缓冲区）
struct XMLAttribute {
    std::string_view name;
    std::string_view value;

    XMLAttribute(std::string_view n, std::string_view v)
        : name(n), value(v) {}
};

class XMLStreamReader {
public:
    using StartElementCallback = std::function<void(std::string_view name, const std::vector<XMLAttribute>& attributes, int depth)>;
    using EndElementCallback = std::function<void(std::string_view name, int depth)>;
    using TextCallback = std::function<void(std::string_view text, int depth)>;
    using ErrorCallback = std::function<void(XMLParseError error, const std::string& message, int line, int column)>;

    XMLStreamReader();
    ~XMLStreamReader();

    // 禁用拷贝构造和赋值
    XMLStreamReader(const XMLStreamReader&) = delete;
    XMLStreamReader& operator=(const XMLStreamReader&) = delete;

    void setStartElementCallback(StartElementCallback callback);
    void setEndElementCallback(EndElementCallback callback);
    void setTextCallback(TextCallback callback);
    void setErrorCallback(ErrorCallback callback);

    // 解析选项设置
    void setTrimWhitespace(bool trim);

    // 解析方法
    XMLParseError parseFromString(const std::string& xml_content);
    XMLParseError parseFromBuffer(const char* buffer, size_t size);

    // 状态查询
    XMLParseError getLastError() const { return last_error_; }
    const std::string& getLastErrorMessage() const { return last_error_message_; }
    int getCurrentDepth() const { return current_depth_; }
    size_t getElementsParsed() const { return elements_parsed_; }

    int getCurrentLineNumber() const;
    int getCurrentColumnNumber() const;

private:
    XML_Parser parser_ = nullptr;

    int current_depth_ = 0;
    XMLParseError last_error_ = XMLParseError::Ok;
    std::string last_error_message_;

    // 属性缓冲（每个开始标签复用）
    std::vector<XMLAttribute> attributes_;

    // 尚未上报的文本
    std::string current_text_;

    StartElementCallback start_element_callback_;
    EndElementCallback end_element_callback_;
    TextCallback text_callback_;
    ErrorCallback error_callback_;

    bool trim_whitespace_ = true;
    // 为空时由BOM或XML声明决定编码
    std::string encoding_;

    size_t elements_parsed_ = 0;

    static constexpr int MAX_DEPTH = 256;  // 最大嵌套深度

    // libexpat回调函数（静态）
    static void XMLCALL startElementHandler(void* userData, const XML_Char* name, const XML_Char** attrs);
    static void XMLCALL endElementHandler(void* userData, const XML_Char* name);
    static void XMLCALL characterDataHandler(void* userData, const XML_Char* data, int len);

    bool initializeParser();
    void cleanupParser();
    void resetState();
    void parseAttributes(const XML_Char** attrs);
    void flushText(int depth);
    std::string_view trimStringView(std::string_view str) const;
    void handleError(XMLParseError error, const std::string& message);
    void abortParsing(const std::string& message);
};

}} // namespace fastdocx::xml

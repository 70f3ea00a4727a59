/**
 * @file XMLStreamWriter.hpp
 * @brief XML流写入器
 */

#pragma once

#include "fastdocx/core/Constants.hpp"
#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace fastdocx {
namespace xml {

/**
 * @brief 流式XML写入器
 *
 * 支持两种输出模式：
 * - 内存缓冲：通过toString()取得结果
 * - 回调：缓冲区满或flush()时按块交给回调
 *
 * 属性在元素开始标签关闭前批量写入，无子内容的元素输出为自闭合形式。
 */
class XMLStreamWriter {
public:
    using WriteCallback = std::function<void(const std::string& chunk)>;

    enum class OutputMode {
        CALLBACK,       // 回调函数输出
        MEMORY_BUFFER   // 内存缓冲输出
    };

    XMLStreamWriter();

    /**
     * @brief 回调输出构造函数
     * @throws FastDocxException 回调为空
     */
    explicit XMLStreamWriter(WriteCallback callback);

    ~XMLStreamWriter() = default;

    XMLStreamWriter(const XMLStreamWriter&) = delete;
    XMLStreamWriter& operator=(const XMLStreamWriter&) = delete;
    XMLStreamWriter(XMLStreamWriter&&) = default;
    XMLStreamWriter& operator=(XMLStreamWriter&&) = default;

    void startDocument(const std::string& encoding = "UTF-8");

    /**
     * @brief 结束文档
     * @throws FastDocxException 仍有未关闭的元素
     */
    void endDocument();

    void startElement(const std::string& name);
    void endElement();

    void writeAttribute(const std::string& name, const std::string& value);
    void writeText(const std::string& text);

    void flush();

    /**
     * @brief 获取输出结果（仅内存模式）
     */
    std::string toString() const;

    size_t getBytesWritten() const { return bytes_written_; }

private:
    static constexpr size_t DEFAULT_BUFFER_SIZE = core::Constants::kIOBufferSize;

    void append(const std::string& data);
    void append(char c);
    void ensureElementClosed();
    void writeAttributesToBuffer();

    OutputMode output_mode_ = OutputMode::MEMORY_BUFFER;
    WriteCallback write_callback_;

    std::string buffer_;
    std::string memory_buffer_;

    std::vector<std::string> element_stack_;
    bool in_element_ = false;
    std::vector<std::pair<std::string, std::string>> pending_attributes_;

    size_t bytes_written_ = 0;
};

}} // namespace fastdocx::xml

#pragma once

#include "fastdocx/xml/BaseSAXParser.hpp"
#include "fastdocx/xml/ParsedValue.hpp"
#include "fastdocx/core/Expected.hpp"
#include <string>
#include <vector>

namespace fastdocx {
namespace xml {

/**
 * @brief 将XML文本解析为ParsedValue树
 *
 * 规则：
 * - 无属性且无子元素的元素：有非空文本时为Text，否则为Empty
 * - 其余元素为Element；存在子元素时丢弃纯空白文本
 * - 相邻的同名兄弟元素合并为一个Sequence子项，不相邻的重复名各自成项
 * - 文本不做首尾空白裁剪（保留xml:space="preserve"语义）
 * - 注释和处理指令不保留
 */
class ParsedValueBuilder : public BaseSAXParser {
public:
    ParsedValueBuilder();
    ~ParsedValueBuilder() override = default;

    /**
     * @brief 解析XML文本
     * @param xml_content XML内容
     * @param source_name 来源描述（部件路径），写入错误上下文
     * @return 成功返回ParsedDocument，失败返回XmlParseError
     */
    static core::Result<ParsedDocument> parse(const std::string& xml_content,
                                              const std::string& source_name = "");

private:
    struct Frame {
        std::string name;
        std::optional<Attributes> attributes;
        std::vector<ParsedEntry> entries;
        bool has_element_children = false;
    };

    std::vector<Frame> frames_;
    ParsedDocument document_;
    bool root_closed_ = false;

    void onStartElement(std::string_view name, const std::vector<XMLAttribute>& attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;
    void onText(std::string_view text, int depth) override;

    static ParsedValue finalize(Frame& frame);
    static void appendChild(Frame& parent, std::string name, ParsedValue value);
    static bool isWhitespace(std::string_view text);
};

}} // namespace fastdocx::xml

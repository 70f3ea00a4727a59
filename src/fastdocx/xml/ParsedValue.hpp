#pragma once

#include "fastdocx/xml/XmlAttributes.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fastdocx {
namespace xml {

struct ParsedEntry;

/**
 * @brief 解析器输出的中间形态
 *
 * 四种形态：
 * - Empty    空元素，无属性无内容
 * - Text     只有文本内容、无属性的元素
 * - Element  带属性或子元素的元素，子项按文档顺序保存在entries中
 * - Sequence 相邻同名兄弟元素的合并结果
 *
 * 元素中的文本片段以保留键kTextKey存为entry。
 */
class ParsedValue {
public:
    enum class Kind {
        Empty,
        Text,
        Element,
        Sequence
    };

    static constexpr const char* kTextKey = "#text";

    ParsedValue();

    static ParsedValue text(std::string value);
    static ParsedValue element(std::optional<Attributes> attributes, std::vector<ParsedEntry> entries);
    static ParsedValue sequence(std::vector<ParsedValue> items);

    Kind kind() const noexcept { return kind_; }
    bool isEmpty() const noexcept { return kind_ == Kind::Empty; }
    bool isText() const noexcept { return kind_ == Kind::Text; }
    bool isElement() const noexcept { return kind_ == Kind::Element; }
    bool isSequence() const noexcept { return kind_ == Kind::Sequence; }

    const std::string& textValue() const noexcept { return text_; }
    const std::optional<Attributes>& attributes() const noexcept { return attributes_; }
    const std::vector<ParsedEntry>& entries() const noexcept;
    const std::vector<ParsedValue>& items() const noexcept;

    /**
     * @brief 查找第一个键为key的子项（仅Element有效）
     */
    const ParsedValue* find(std::string_view key) const;

    /**
     * @brief 收集所有键为key的子项，单个值与Sequence统一展开为列表
     */
    std::vector<const ParsedValue*> collect(std::string_view key) const;

    /**
     * @brief 读取属性值（仅Element有效）
     */
    std::optional<std::string> attribute(std::string_view name) const;

    /**
     * @brief 追加一个序列项；当前值不是Sequence时先转换为单元素Sequence
     */
    void appendToSequence(ParsedValue item);

    bool operator==(const ParsedValue& other) const;
    bool operator!=(const ParsedValue& other) const { return !(*this == other); }

private:
    Kind kind_;
    std::string text_;
    std::optional<Attributes> attributes_;
    std::vector<ParsedEntry> entries_;
    std::vector<ParsedValue> items_;
};

/**
 * @brief 元素的一个子项：子元素名（或kTextKey）与对应值
 */
struct ParsedEntry {
    std::string key;
    ParsedValue value;

    bool operator==(const ParsedEntry& other) const {
        return key == other.key && value == other.value;
    }
};

/**
 * @brief 一次解析的结果：根元素名与根值
 */
struct ParsedDocument {
    std::string root_name;
    ParsedValue root;
};

}} // namespace fastdocx::xml

#pragma once

#include "fastdocx/xml/XmlAttributes.hpp"
#include <string>
#include <vector>

namespace fastdocx {
namespace xml {

/**
 * @brief 可序列化形态
 *
 * 元素表示为 {key: [content...]}；带属性时content的第一项是
 * 以保留标记"_attr"为键的属性对象：{key: [{_attr: {...}}, children...]}。
 * 文本子项直接以字符串出现在content中。
 */
class XmlableObject {
public:
    enum class Kind {
        Text,
        Attributes,
        Element
    };

    static XmlableObject text(std::string value);
    static XmlableObject attributes(Attributes values);
    static XmlableObject element(std::string key, std::vector<XmlableObject> content);

    Kind kind() const noexcept { return kind_; }

    /**
     * @brief 元素键；属性对象返回保留标记"_attr"，文本返回空串
     */
    const std::string& key() const noexcept { return key_; }
    const std::string& textValue() const noexcept { return text_; }
    const Attributes& attributeValues() const noexcept { return attributes_; }
    const std::vector<XmlableObject>& content() const noexcept { return content_; }

    bool operator==(const XmlableObject& other) const;
    bool operator!=(const XmlableObject& other) const { return !(*this == other); }

private:
    XmlableObject() = default;

    Kind kind_ = Kind::Text;
    std::string key_;
    std::string text_;
    Attributes attributes_;
    std::vector<XmlableObject> content_;
};

}} // namespace fastdocx::xml

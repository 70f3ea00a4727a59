#pragma once

#include "fastdocx/xml/XmlAttributes.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fastdocx {
namespace xml {

class ImportedXmlNode;

/**
 * @brief 节点的一个子项：嵌套节点或文本片段
 */
class XmlChild {
public:
    static XmlChild text(std::string value);
    static XmlChild element(ImportedXmlNode node);

    XmlChild(const XmlChild& other);
    XmlChild& operator=(const XmlChild& other);
    XmlChild(XmlChild&&) noexcept = default;
    XmlChild& operator=(XmlChild&&) noexcept = default;
    ~XmlChild();

    bool isText() const noexcept { return !node_; }
    bool isElement() const noexcept { return static_cast<bool>(node_); }

    const std::string& text() const noexcept { return text_; }
    const ImportedXmlNode& element() const { return *node_; }
    ImportedXmlNode& element() { return *node_; }

    bool operator==(const XmlChild& other) const;
    bool operator!=(const XmlChild& other) const { return !(*this == other); }

private:
    XmlChild() = default;

    std::string text_;
    std::unique_ptr<ImportedXmlNode> node_;
};

/**
 * @brief 通用XML节点
 *
 * 用于保存模型未解释的XML内容：元素名、可选的有序属性集、
 * 以及按顺序排列的子节点与文本片段（允许混合内容）。
 * 属性缺失（nullopt）与属性为空集是两种不同状态。
 */
class ImportedXmlNode {
public:
    /**
     * @throws FastDocxException name为空时
     */
    explicit ImportedXmlNode(std::string name, std::optional<Attributes> attributes = std::nullopt);

    const std::string& name() const noexcept { return name_; }

    const std::optional<Attributes>& attributes() const noexcept { return attributes_; }
    bool hasAttributes() const noexcept { return attributes_.has_value(); }
    std::optional<std::string> attribute(std::string_view attr_name) const;

    const std::vector<XmlChild>& children() const noexcept { return children_; }
    std::vector<XmlChild>& children() noexcept { return children_; }
    size_t childCount() const noexcept { return children_.size(); }

    void appendChild(ImportedXmlNode child);
    void appendText(std::string text);

    /**
     * @brief 查找第一个指定名称的直接子节点
     */
    const ImportedXmlNode* findChild(std::string_view child_name) const;
    std::vector<const ImportedXmlNode*> findChildren(std::string_view child_name) const;

    /**
     * @brief 递归拼接所有文本片段
     */
    std::string textContent() const;

    bool operator==(const ImportedXmlNode& other) const;
    bool operator!=(const ImportedXmlNode& other) const { return !(*this == other); }

private:
    std::string name_;
    std::optional<Attributes> attributes_;
    std::vector<XmlChild> children_;
};

}} // namespace fastdocx::xml

#pragma once

#include "fastdocx/xml/ImportedXmlNode.hpp"
#include <memory>
#include <string>
#include <vector>

namespace fastdocx {
namespace document {

/**
 * @brief 导入的样式部件（word/styles.xml）
 *
 * 以通用节点保存整个w:styles树，以便原样输出。
 */
class Styles {
public:
    explicit Styles(xml::ImportedXmlNode root);

    const xml::ImportedXmlNode& root() const noexcept { return root_; }

    /**
     * @brief 所有w:style的w:styleId，按文档顺序
     */
    std::vector<std::string> styleIds() const;

    /**
     * @brief 按w:styleId查找w:style
     * @return 未找到返回nullptr
     */
    const xml::ImportedXmlNode* findStyle(const std::string& style_id) const;

    size_t styleCount() const;

private:
    xml::ImportedXmlNode root_;
};

/**
 * @brief 样式工厂接口
 */
class IStylesFactory {
public:
    virtual ~IStylesFactory() = default;

    /**
     * @brief 从styles.xml内容创建样式对象
     * @throws FastDocxException 内容无法解析
     */
    virtual std::unique_ptr<Styles> newInstance(const std::string& xml_content) const = 0;
};

/**
 * @brief 默认工厂：要求根元素为w:styles并整体保留
 */
class ExternalStylesFactory : public IStylesFactory {
public:
    std::unique_ptr<Styles> newInstance(const std::string& xml_content) const override;
};

}} // namespace fastdocx::document

#pragma once

#include "fastdocx/xml/ImportedXmlNode.hpp"
#include "fastdocx/xml/ParsedValue.hpp"
#include "fastdocx/xml/XmlableObject.hpp"
#include "fastdocx/core/Expected.hpp"
#include <string>
#include <vector>

namespace fastdocx {
namespace xml {

/**
 * @brief ParsedValue与ImportedXmlNode、XmlableObject之间的转换
 */
class TreeConverter {
public:
    /**
     * @brief 将解析值转换为节点列表
     *
     * - Sequence：逐项以同一名称转换并展平一层
     * - Element：生成带属性的节点，子项按顺序递归转换后追加
     * - Text：非空时生成只含一个文本子项的节点
     * - Empty：生成无子项的节点
     */
    static std::vector<ImportedXmlNode> convert(const std::string& name, const ParsedValue& value);

    /**
     * @brief 转换并要求结果恰好为一个节点
     * @return 多于一个节点时返回MultipleRootElements
     */
    static core::Result<ImportedXmlNode> convertSingle(const std::string& name, const ParsedValue& value);

    /**
     * @brief 以指定根元素转换整个文档
     * @return 根元素名不符时返回MissingRootElement
     */
    static core::Result<ImportedXmlNode> convertRoot(const std::string& expected_name,
                                                     const ParsedDocument& document,
                                                     const std::string& source_name = "");

    /**
     * @brief 从XML文本直接构造节点
     */
    static core::Result<ImportedXmlNode> fromXmlString(const std::string& xml_content);

    /**
     * @brief 转换为可序列化形态，属性以"_attr"项置于内容首位
     */
    static XmlableObject toSerializable(const ImportedXmlNode& node);

private:
    static void convertInto(const std::string& name, const ParsedValue& value,
                            std::vector<ImportedXmlNode>& out);
};

}} // namespace fastdocx::xml

#pragma once

#include "fastdocx/document/HeaderFooterReference.hpp"
#include "fastdocx/xml/ParsedValue.hpp"
#include "fastdocx/core/Expected.hpp"
#include <string>
#include <string_view>

namespace fastdocx {
namespace document {

struct ExtractorOptions {
    bool strict_reference_types = true;     // 未知w:type是否报错
    bool warn_on_multiple_sections = true;  // 存在多个节时是否告警
};

/**
 * @brief 主文档节属性的分析结果
 */
struct SectionSummary {
    DocumentReferences references;
    bool title_page_defined = false;
    size_t ignored_sections = 0;  // 未处理的额外节数量
};

/**
 * @brief 从word/document.xml中读取页眉页脚引用与首页标志
 *
 * 只读取w:document/w:body下的第一个w:sectPr。文档包含多个节时，
 * 其余节（额外的body级w:sectPr或段落w:pPr中的w:sectPr）被忽略并记录告警。
 */
class DocumentReferenceExtractor {
public:
    DocumentReferenceExtractor() = default;
    explicit DocumentReferenceExtractor(ExtractorOptions options) : options_(options) {}

    /**
     * @brief 提取页眉页脚引用，保持源文档顺序
     * @return 缺少w:document时返回MissingRootElement，缺少w:body或w:sectPr时返回XmlMissingElement，
     *         r:id格式错误时返回MalformedRelationshipId
     */
    core::Result<DocumentReferences> extractReferences(const std::string& document_xml) const;

    /**
     * @brief w:sectPr下是否存在w:titlePg（不论取值）
     */
    core::Result<bool> titlePageDefined(const std::string& document_xml) const;

    /**
     * @brief 一次解析同时得到引用与首页标志
     */
    core::Result<SectionSummary> analyze(const std::string& document_xml) const;

private:
    ExtractorOptions options_;

    static core::Result<const xml::ParsedValue*> locateBody(const xml::ParsedDocument& document);
    static core::Result<const xml::ParsedValue*> locateSectionProperties(const xml::ParsedValue& body);
    static size_t countAdditionalSections(const xml::ParsedValue& body);

    core::Result<std::vector<DocumentReference>> collectReferences(const xml::ParsedValue& section_properties,
                                                                   std::string_view element_name) const;
};

}} // namespace fastdocx::document

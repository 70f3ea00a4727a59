#include "fastdocx/document/DocumentReferenceExtractor.hpp"
#include "fastdocx/xml/ParsedValueBuilder.hpp"
#include "fastdocx/opc/Relationship.hpp"
#include "fastdocx/core/Constants.hpp"
#include "fastdocx/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace fastdocx {
namespace document {

namespace {

constexpr const char* kDocumentElement = "w:document";
constexpr const char* kBodyElement = "w:body";
constexpr const char* kSectionPropertiesElement = "w:sectPr";
constexpr const char* kHeaderReferenceElement = "w:headerReference";
constexpr const char* kFooterReferenceElement = "w:footerReference";
constexpr const char* kTitlePageElement = "w:titlePg";

// 相邻同名元素被合并为Sequence，取第一个
const xml::ParsedValue* firstOf(const xml::ParsedValue* value) {
    if (value && value->isSequence()) {
        return value->items().empty() ? nullptr : &value->items().front();
    }
    return value;
}

} // namespace

core::Result<const xml::ParsedValue*> DocumentReferenceExtractor::locateBody(const xml::ParsedDocument& document) {
    if (document.root_name != kDocumentElement) {
        return core::makeError(core::ErrorCode::MissingRootElement,
                               fmt::format("Expected <{}> root but found <{}>", kDocumentElement, document.root_name),
                               core::Constants::kDocumentPart);
    }

    const xml::ParsedValue* body = firstOf(document.root.find(kBodyElement));
    if (!body) {
        return core::makeError(core::ErrorCode::XmlMissingElement,
                               fmt::format("<{}> has no <{}>", kDocumentElement, kBodyElement),
                               core::Constants::kDocumentPart);
    }
    return body;
}

core::Result<const xml::ParsedValue*> DocumentReferenceExtractor::locateSectionProperties(const xml::ParsedValue& body) {
    const xml::ParsedValue* section = firstOf(body.find(kSectionPropertiesElement));
    if (!section) {
        return core::makeError(core::ErrorCode::XmlMissingElement,
                               fmt::format("<{}> has no <{}>", kBodyElement, kSectionPropertiesElement),
                               core::Constants::kDocumentPart);
    }
    return section;
}

size_t DocumentReferenceExtractor::countAdditionalSections(const xml::ParsedValue& body) {
    size_t body_sections = body.collect(kSectionPropertiesElement).size();
    size_t extra = body_sections > 0 ? body_sections - 1 : 0;

    // 段落级分节符 w:p/w:pPr/w:sectPr
    for (const xml::ParsedValue* paragraph : body.collect("w:p")) {
        for (const xml::ParsedValue* properties : paragraph->collect("w:pPr")) {
            extra += properties->collect(kSectionPropertiesElement).size();
        }
    }
    return extra;
}

core::Result<std::vector<DocumentReference>> DocumentReferenceExtractor::collectReferences(
    const xml::ParsedValue& section_properties, std::string_view element_name) const {
    std::vector<DocumentReference> result;

    for (const xml::ParsedValue* item : section_properties.collect(element_name)) {
        std::string raw_id = item->attribute("r:id").value_or("");
        auto id = opc::parseRelationshipId(raw_id);
        if (!id) {
            auto error = id.error();
            error.context = fmt::format("{} <{}>", core::Constants::kDocumentPart, element_name);
            return error;
        }

        DocumentReference reference;
        reference.relationship_id = *id;

        if (auto raw_type = item->attribute("w:type")) {
            auto type = parseHeaderFooterType(*raw_type);
            if (type) {
                reference.type = *type;
            } else if (options_.strict_reference_types) {
                return core::makeError(core::ErrorCode::InvalidReferenceType,
                                       fmt::format("Unknown reference type '{}' on <{}>", *raw_type, element_name),
                                       raw_id);
            } else {
                DOC_WARN("未知的引用类型 '{}' ({}), 按default处理", *raw_type, raw_id);
            }
        }

        result.push_back(reference);
    }
    return result;
}

core::Result<SectionSummary> DocumentReferenceExtractor::analyze(const std::string& document_xml) const {
    auto parsed = xml::ParsedValueBuilder::parse(document_xml, core::Constants::kDocumentPart);
    if (!parsed) {
        return parsed.error();
    }

    auto body = locateBody(*parsed);
    if (!body) {
        return body.error();
    }
    auto section = locateSectionProperties(**body);
    if (!section) {
        return section.error();
    }

    SectionSummary summary;

    auto headers = collectReferences(**section, kHeaderReferenceElement);
    if (!headers) {
        return headers.error();
    }
    auto footers = collectReferences(**section, kFooterReferenceElement);
    if (!footers) {
        return footers.error();
    }
    summary.references.headers = std::move(headers.value());
    summary.references.footers = std::move(footers.value());
    summary.title_page_defined = (*section)->find(kTitlePageElement) != nullptr;
    summary.ignored_sections = countAdditionalSections(**body);

    if (summary.ignored_sections > 0 && options_.warn_on_multiple_sections) {
        DOC_WARN("文档包含 {} 个额外的节, 仅使用第一个body级w:sectPr", summary.ignored_sections);
    }

    DOC_DEBUG("节属性: {} 个页眉引用, {} 个页脚引用, titlePg={}",
              summary.references.headers.size(), summary.references.footers.size(),
              summary.title_page_defined);
    return summary;
}

core::Result<DocumentReferences> DocumentReferenceExtractor::extractReferences(const std::string& document_xml) const {
    return analyze(document_xml).map([](const SectionSummary& summary) {
        return summary.references;
    });
}

core::Result<bool> DocumentReferenceExtractor::titlePageDefined(const std::string& document_xml) const {
    return analyze(document_xml).map([](const SectionSummary& summary) {
        return summary.title_page_defined;
    });
}

}} // namespace fastdocx::document

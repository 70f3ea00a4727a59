#include "fastdocx/document/Styles.hpp"
#include "fastdocx/xml/ParsedValueBuilder.hpp"
#include "fastdocx/xml/TreeConverter.hpp"
#include "fastdocx/core/Constants.hpp"
#include "fastdocx/core/ExceptionBridge.hpp"
#include "fastdocx/utils/ModuleLoggers.hpp"

namespace fastdocx {
namespace document {

namespace {
constexpr const char* kStyleElement = "w:style";
constexpr const char* kStyleIdAttribute = "w:styleId";
}

Styles::Styles(xml::ImportedXmlNode root) : root_(std::move(root)) {
}

std::vector<std::string> Styles::styleIds() const {
    std::vector<std::string> ids;
    for (const xml::ImportedXmlNode* style : root_.findChildren(kStyleElement)) {
        if (auto id = style->attribute(kStyleIdAttribute)) {
            ids.push_back(*id);
        }
    }
    return ids;
}

const xml::ImportedXmlNode* Styles::findStyle(const std::string& style_id) const {
    for (const xml::ImportedXmlNode* style : root_.findChildren(kStyleElement)) {
        if (style->attribute(kStyleIdAttribute) == style_id) {
            return style;
        }
    }
    return nullptr;
}

size_t Styles::styleCount() const {
    return root_.findChildren(kStyleElement).size();
}

std::unique_ptr<Styles> ExternalStylesFactory::newInstance(const std::string& xml_content) const {
    auto parsed = FASTDOCX_UNWRAP(xml::ParsedValueBuilder::parse(xml_content, core::Constants::kStylesPart));
    auto root = FASTDOCX_UNWRAP(xml::TreeConverter::convertRoot(core::Constants::kStylesRootElement, parsed,
                                                                core::Constants::kStylesPart));
    auto styles = std::make_unique<Styles>(std::move(root));
    DOC_DEBUG("导入样式: {} 个w:style", styles->styleCount());
    return styles;
}

}} // namespace fastdocx::document

#include "fastdocx/xml/TreeConverter.hpp"
#include "fastdocx/xml/ParsedValueBuilder.hpp"
#include "fastdocx/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace fastdocx {
namespace xml {

std::vector<ImportedXmlNode> TreeConverter::convert(const std::string& name, const ParsedValue& value) {
    std::vector<ImportedXmlNode> out;
    convertInto(name, value, out);
    return out;
}

void TreeConverter::convertInto(const std::string& name, const ParsedValue& value,
                                std::vector<ImportedXmlNode>& out) {
    switch (value.kind()) {
        case ParsedValue::Kind::Sequence:
            for (const auto& item : value.items()) {
                convertInto(name, item, out);
            }
            return;

        case ParsedValue::Kind::Element: {
            ImportedXmlNode node(name, value.attributes());
            for (const auto& entry : value.entries()) {
                if (entry.key == ParsedValue::kTextKey) {
                    if (!entry.value.textValue().empty()) {
                        node.appendText(entry.value.textValue());
                    }
                    continue;
                }
                std::vector<ImportedXmlNode> converted;
                convertInto(entry.key, entry.value, converted);
                for (auto& child : converted) {
                    node.appendChild(std::move(child));
                }
            }
            out.push_back(std::move(node));
            return;
        }

        case ParsedValue::Kind::Text: {
            ImportedXmlNode node(name);
            if (!value.textValue().empty()) {
                node.appendText(value.textValue());
            }
            out.push_back(std::move(node));
            return;
        }

        case ParsedValue::Kind::Empty:
            out.emplace_back(name);
            return;
    }
}

core::Result<ImportedXmlNode> TreeConverter::convertSingle(const std::string& name, const ParsedValue& value) {
    std::vector<ImportedXmlNode> nodes = convert(name, value);
    if (nodes.size() > 1) {
        return core::makeError(core::ErrorCode::MultipleRootElements,
                               fmt::format("Invalid conversion, input must be one element but got {}", nodes.size()),
                               name);
    }
    if (nodes.empty()) {
        return core::makeError(core::ErrorCode::MissingRootElement,
                               "Invalid conversion, input produced no element", name);
    }
    return std::move(nodes.front());
}

core::Result<ImportedXmlNode> TreeConverter::convertRoot(const std::string& expected_name,
                                                         const ParsedDocument& document,
                                                         const std::string& source_name) {
    if (document.root_name != expected_name) {
        XML_DEBUG("根元素不匹配: 期望 <{}>, 实际 <{}>", expected_name, document.root_name);
        return core::makeError(core::ErrorCode::MissingRootElement,
                               fmt::format("Expected root element <{}> but found <{}>",
                                           expected_name, document.root_name),
                               source_name);
    }
    return convertSingle(expected_name, document.root);
}

core::Result<ImportedXmlNode> TreeConverter::fromXmlString(const std::string& xml_content) {
    auto parsed = ParsedValueBuilder::parse(xml_content);
    if (!parsed) {
        return parsed.error();
    }
    return convertSingle(parsed->root_name, parsed->root);
}

XmlableObject TreeConverter::toSerializable(const ImportedXmlNode& node) {
    std::vector<XmlableObject> content;
    content.reserve(node.childCount() + (node.hasAttributes() ? 1 : 0));

    if (node.hasAttributes()) {
        content.push_back(XmlableObject::attributes(*node.attributes()));
    }

    for (const auto& child : node.children()) {
        if (child.isText()) {
            content.push_back(XmlableObject::text(child.text()));
        } else {
            content.push_back(toSerializable(child.element()));
        }
    }

    return XmlableObject::element(node.name(), std::move(content));
}

}} // namespace fastdocx::xml

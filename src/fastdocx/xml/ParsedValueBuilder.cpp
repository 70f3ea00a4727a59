#include "fastdocx/xml/ParsedValueBuilder.hpp"

namespace fastdocx {
namespace xml {

ParsedValueBuilder::ParsedValueBuilder() {
    trim_whitespace_ = false;
}

core::Result<ParsedDocument> ParsedValueBuilder::parse(const std::string& xml_content,
                                                       const std::string& source_name) {
    ParsedValueBuilder builder;
    if (!builder.parseXML(xml_content)) {
        return core::makeError(core::ErrorCode::XmlParseError, builder.getErrorMessage(), source_name);
    }

    if (!builder.root_closed_ || !builder.frames_.empty()) {
        return core::makeError(core::ErrorCode::XmlParseError, "Incomplete XML document", source_name);
    }

    XML_DEBUG("解析完成: {} 根元素 <{}>", source_name.empty() ? "<string>" : source_name,
              builder.document_.root_name);
    return std::move(builder.document_);
}

void ParsedValueBuilder::onStartElement(std::string_view name, const std::vector<XMLAttribute>& attributes, int /*depth*/) {
    Frame frame;
    frame.name = std::string(name);
    if (!attributes.empty()) {
        Attributes attrs;
        attrs.reserve(attributes.size());
        for (const auto& attr : attributes) {
            attrs.emplace_back(std::string(attr.name), std::string(attr.value));
        }
        frame.attributes = std::move(attrs);
    }
    frames_.push_back(std::move(frame));
}

void ParsedValueBuilder::onEndElement(std::string_view /*name*/, int /*depth*/) {
    if (frames_.empty()) {
        setError("Unbalanced end element");
        return;
    }

    Frame frame = std::move(frames_.back());
    frames_.pop_back();
    ParsedValue value = finalize(frame);

    if (frames_.empty()) {
        document_.root_name = std::move(frame.name);
        document_.root = std::move(value);
        root_closed_ = true;
        return;
    }

    appendChild(frames_.back(), std::move(frame.name), std::move(value));
}

void ParsedValueBuilder::onText(std::string_view text, int /*depth*/) {
    if (frames_.empty()) {
        return;
    }

    Frame& top = frames_.back();

    // 最后一个子元素之后的空白不会保留
    if (top.has_element_children && isWhitespace(text)) {
        return;
    }

    if (!top.entries.empty() && top.entries.back().key == ParsedValue::kTextKey) {
        ParsedValue& last = top.entries.back().value;
        last = ParsedValue::text(last.textValue() + std::string(text));
        return;
    }

    top.entries.push_back(ParsedEntry{ParsedValue::kTextKey, ParsedValue::text(std::string(text))});
}

ParsedValue ParsedValueBuilder::finalize(Frame& frame) {
    if (!frame.attributes && !frame.has_element_children) {
        std::string text;
        for (const auto& entry : frame.entries) {
            text += entry.value.textValue();
        }
        return text.empty() ? ParsedValue() : ParsedValue::text(std::move(text));
    }

    return ParsedValue::element(std::move(frame.attributes), std::move(frame.entries));
}

void ParsedValueBuilder::appendChild(Frame& parent, std::string name, ParsedValue value) {
    // 子元素前的纯空白文本属于格式化缩进
    while (!parent.entries.empty() &&
           parent.entries.back().key == ParsedValue::kTextKey &&
           isWhitespace(parent.entries.back().value.textValue())) {
        parent.entries.pop_back();
    }

    parent.has_element_children = true;

    if (!parent.entries.empty() && parent.entries.back().key == name) {
        parent.entries.back().value.appendToSequence(std::move(value));
        return;
    }

    parent.entries.push_back(ParsedEntry{std::move(name), std::move(value)});
}

bool ParsedValueBuilder::isWhitespace(std::string_view text) {
    return text.find_first_not_of(" \t\n\r") == std::string_view::npos;
}

}} // namespace fastdocx::xml

#include "fastdocx/xml/ParsedValue.hpp"

namespace fastdocx {
namespace xml {

ParsedValue::ParsedValue() : kind_(Kind::Empty) {}

ParsedValue ParsedValue::text(std::string value) {
    ParsedValue result;
    result.kind_ = Kind::Text;
    result.text_ = std::move(value);
    return result;
}

ParsedValue ParsedValue::element(std::optional<Attributes> attributes, std::vector<ParsedEntry> entries) {
    ParsedValue result;
    result.kind_ = Kind::Element;
    result.attributes_ = std::move(attributes);
    result.entries_ = std::move(entries);
    return result;
}

ParsedValue ParsedValue::sequence(std::vector<ParsedValue> items) {
    ParsedValue result;
    result.kind_ = Kind::Sequence;
    result.items_ = std::move(items);
    return result;
}

const std::vector<ParsedEntry>& ParsedValue::entries() const noexcept {
    return entries_;
}

const std::vector<ParsedValue>& ParsedValue::items() const noexcept {
    return items_;
}

const ParsedValue* ParsedValue::find(std::string_view key) const {
    if (kind_ != Kind::Element) {
        return nullptr;
    }
    for (const auto& entry : entries_) {
        if (entry.key == key) {
            return &entry.value;
        }
    }
    return nullptr;
}

std::vector<const ParsedValue*> ParsedValue::collect(std::string_view key) const {
    std::vector<const ParsedValue*> result;
    if (kind_ != Kind::Element) {
        return result;
    }
    for (const auto& entry : entries_) {
        if (entry.key != key) {
            continue;
        }
        if (entry.value.isSequence()) {
            for (const auto& item : entry.value.items_) {
                result.push_back(&item);
            }
        } else {
            result.push_back(&entry.value);
        }
    }
    return result;
}

std::optional<std::string> ParsedValue::attribute(std::string_view name) const {
    if (kind_ != Kind::Element || !attributes_) {
        return std::nullopt;
    }
    return findAttributeValue(*attributes_, name);
}

void ParsedValue::appendToSequence(ParsedValue item) {
    if (kind_ != Kind::Sequence) {
        ParsedValue first = std::move(*this);
        *this = ParsedValue();
        kind_ = Kind::Sequence;
        items_.push_back(std::move(first));
    }
    items_.push_back(std::move(item));
}

bool ParsedValue::operator==(const ParsedValue& other) const {
    if (kind_ != other.kind_) {
        return false;
    }
    switch (kind_) {
        case Kind::Empty:
            return true;
        case Kind::Text:
            return text_ == other.text_;
        case Kind::Element:
            return attributes_ == other.attributes_ && entries_ == other.entries_;
        case Kind::Sequence:
            return items_ == other.items_;
    }
    return false;
}

}} // namespace fastdocx::xml

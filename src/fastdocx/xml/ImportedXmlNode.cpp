#include "fastdocx/xml/ImportedXmlNode.hpp"
#include "fastdocx/core/Exception.hpp"

namespace fastdocx {
namespace xml {

// ========== XmlChild ==========

XmlChild XmlChild::text(std::string value) {
    XmlChild child;
    child.text_ = std::move(value);
    return child;
}

XmlChild XmlChild::element(ImportedXmlNode node) {
    XmlChild child;
    child.node_ = std::make_unique<ImportedXmlNode>(std::move(node));
    return child;
}

XmlChild::XmlChild(const XmlChild& other)
    : text_(other.text_),
      node_(other.node_ ? std::make_unique<ImportedXmlNode>(*other.node_) : nullptr) {
}

XmlChild& XmlChild::operator=(const XmlChild& other) {
    if (this != &other) {
        XmlChild copy(other);
        *this = std::move(copy);
    }
    return *this;
}

XmlChild::~XmlChild() = default;

bool XmlChild::operator==(const XmlChild& other) const {
    if (isText() != other.isText()) {
        return false;
    }
    return isText() ? text_ == other.text_ : *node_ == *other.node_;
}

// ========== ImportedXmlNode ==========

ImportedXmlNode::ImportedXmlNode(std::string name, std::optional<Attributes> attributes)
    : name_(std::move(name)), attributes_(std::move(attributes)) {
    if (name_.empty()) {
        FASTDOCX_THROW(core::FastDocxException, "XML node name cannot be empty", core::ErrorCode::InvalidArgument);
    }
}

std::optional<std::string> ImportedXmlNode::attribute(std::string_view attr_name) const {
    if (!attributes_) {
        return std::nullopt;
    }
    return findAttributeValue(*attributes_, attr_name);
}

void ImportedXmlNode::appendChild(ImportedXmlNode child) {
    children_.push_back(XmlChild::element(std::move(child)));
}

void ImportedXmlNode::appendText(std::string text) {
    children_.push_back(XmlChild::text(std::move(text)));
}

const ImportedXmlNode* ImportedXmlNode::findChild(std::string_view child_name) const {
    for (const auto& child : children_) {
        if (child.isElement() && child.element().name() == child_name) {
            return &child.element();
        }
    }
    return nullptr;
}

std::vector<const ImportedXmlNode*> ImportedXmlNode::findChildren(std::string_view child_name) const {
    std::vector<const ImportedXmlNode*> result;
    for (const auto& child : children_) {
        if (child.isElement() && child.element().name() == child_name) {
            result.push_back(&child.element());
        }
    }
    return result;
}

std::string ImportedXmlNode::textContent() const {
    std::string result;
    for (const auto& child : children_) {
        result += child.isText() ? child.text() : child.element().textContent();
    }
    return result;
}

bool ImportedXmlNode::operator==(const ImportedXmlNode& other) const {
    return name_ == other.name_ &&
           attributes_ == other.attributes_ &&
           children_ == other.children_;
}

}} // namespace fastdocx::xml

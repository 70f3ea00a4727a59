#include "fastdocx/xml/XmlableObject.hpp"
#include "fastdocx/core/Constants.hpp"

namespace fastdocx {
namespace xml {

XmlableObject XmlableObject::text(std::string value) {
    XmlableObject obj;
    obj.kind_ = Kind::Text;
    obj.text_ = std::move(value);
    return obj;
}

XmlableObject XmlableObject::attributes(Attributes values) {
    XmlableObject obj;
    obj.kind_ = Kind::Attributes;
    obj.key_ = core::Constants::kAttributesMarker;
    obj.attributes_ = std::move(values);
    return obj;
}

XmlableObject XmlableObject::element(std::string key, std::vector<XmlableObject> content) {
    XmlableObject obj;
    obj.kind_ = Kind::Element;
    obj.key_ = std::move(key);
    obj.content_ = std::move(content);
    return obj;
}

bool XmlableObject::operator==(const XmlableObject& other) const {
    return kind_ == other.kind_ &&
           key_ == other.key_ &&
           text_ == other.text_ &&
           attributes_ == other.attributes_ &&
           content_ == other.content_;
}

}} // namespace fastdocx::xml

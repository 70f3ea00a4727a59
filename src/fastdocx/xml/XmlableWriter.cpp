#include "fastdocx/xml/XmlableWriter.hpp"
#include "fastdocx/xml/XMLStreamWriter.hpp"
#include "fastdocx/core/ExceptionBridge.hpp"
#include "fastdocx/utils/ModuleLoggers.hpp"

namespace fastdocx {
namespace xml {

core::Result<std::string> XmlableWriter::write(const XmlableObject& object, bool declaration) {
    if (object.kind() != XmlableObject::Kind::Element) {
        return core::makeError(core::ErrorCode::XmlMissingElement,
                               "Serializable root must be an element", object.key());
    }

    auto valid = validate(object);
    if (!valid) {
        return valid.error();
    }

    return core::ExceptionBridge::wrapCall([&]() {
        XMLStreamWriter writer;
        if (declaration) {
            writer.startDocument();
        }
        writeElement(writer, object);
        writer.endDocument();
        XML_DEBUG("序列化 <{}> 完成, {} 字节", object.key(), writer.getBytesWritten());
        return writer.toString();
    });
}

core::VoidResult XmlableWriter::validate(const XmlableObject& object) {
    const auto& content = object.content();
    for (size_t i = 0; i < content.size(); ++i) {
        const auto& item = content[i];
        if (item.kind() == XmlableObject::Kind::Attributes && i != 0) {
            return core::makeError(core::ErrorCode::XmlMissingElement,
                                   "Attribute marker must be the first content entry", object.key());
        }
        if (item.kind() == XmlableObject::Kind::Element) {
            auto nested = validate(item);
            if (!nested) {
                return nested;
            }
        }
    }
    return core::success();
}

void XmlableWriter::writeElement(XMLStreamWriter& writer, const XmlableObject& object) {
    writer.startElement(object.key());
    for (const auto& item : object.content()) {
        switch (item.kind()) {
            case XmlableObject::Kind::Attributes:
                for (const auto& attr : item.attributeValues()) {
                    writer.writeAttribute(attr.first, attr.second);
                }
                break;
            case XmlableObject::Kind::Text:
                writer.writeText(item.textValue());
                break;
            case XmlableObject::Kind::Element:
                writeElement(writer, item);
                break;
        }
    }
    writer.endElement();
}

}} // namespace fastdocx::xml

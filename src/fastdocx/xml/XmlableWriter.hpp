#pragma once

#include "fastdocx/xml/XmlableObject.hpp"
#include "fastdocx/core/Expected.hpp"
#include <string>

namespace fastdocx {
namespace xml {

class XMLStreamWriter;

/**
 * @brief 将可序列化形态输出为XML文本
 */
class XmlableWriter {
public:
    /**
     * @brief 输出XML文本
     * @param object 根对象，必须是Element
     * @param declaration 是否输出XML声明
     * @return "_attr"项不在内容首位或根不是元素时返回XmlMissingElement
     */
    static core::Result<std::string> write(const XmlableObject& object, bool declaration = true);

private:
    static core::VoidResult validate(const XmlableObject& object);
    static void writeElement(XMLStreamWriter& writer, const XmlableObject& object);
};

}} // namespace fastdocx::xml

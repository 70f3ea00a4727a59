#include "fastdocx/xml/XMLStreamWriter.hpp"
#include "fastdocx/xml/XMLEscapes.hpp"
#include "fastdocx/core/Exception.hpp"
#include "fastdocx/utils/ModuleLoggers.hpp"

namespace fastdocx {
namespace xml {

XMLStreamWriter::XMLStreamWriter() {
    buffer_.reserve(DEFAULT_BUFFER_SIZE);
    pending_attributes_.reserve(16);
}

XMLStreamWriter::XMLStreamWriter(WriteCallback callback)
    : output_mode_(OutputMode::CALLBACK), write_callback_(std::move(callback)) {
    if (!write_callback_) {
        FASTDOCX_THROW(core::FastDocxException, "Callback cannot be null", core::ErrorCode::InvalidArgument);
    }
    buffer_.reserve(DEFAULT_BUFFER_SIZE);
    pending_attributes_.reserve(16);
}

void XMLStreamWriter::append(const std::string& data) {
    buffer_ += data;
    if (buffer_.size() >= DEFAULT_BUFFER_SIZE) {
        flush();
    }
}

void XMLStreamWriter::append(char c) {
    buffer_ += c;
    if (buffer_.size() >= DEFAULT_BUFFER_SIZE) {
        flush();
    }
}

void XMLStreamWriter::flush() {
    if (buffer_.empty()) {
        return;
    }
    bytes_written_ += buffer_.size();
    if (output_mode_ == OutputMode::CALLBACK) {
        write_callback_(buffer_);
    } else {
        memory_buffer_ += buffer_;
    }
    buffer_.clear();
}

void XMLStreamWriter::startDocument(const std::string& encoding) {
    append("<?xml version=\"1.0\" encoding=\"" + encoding + "\" standalone=\"yes\"?>\n");
}

void XMLStreamWriter::endDocument() {
    if (!element_stack_.empty()) {
        FASTDOCX_THROW(core::FastDocxException,
                       "Document ended with unclosed element <" + element_stack_.back() + ">",
                       core::ErrorCode::InvalidArgument);
    }
    flush();
}

void XMLStreamWriter::startElement(const std::string& name) {
    if (name.empty()) {
        FASTDOCX_THROW(core::FastDocxException, "Element name cannot be empty", core::ErrorCode::InvalidArgument);
    }

    ensureElementClosed();

    append('<');
    append(name);

    element_stack_.push_back(name);
    in_element_ = true;
}

void XMLStreamWriter::endElement() {
    if (element_stack_.empty()) {
        FASTDOCX_THROW(core::FastDocxException, "No element to close", core::ErrorCode::InvalidArgument);
    }

    std::string element_name = std::move(element_stack_.back());
    element_stack_.pop_back();

    if (in_element_) {
        // 自闭合元素
        writeAttributesToBuffer();
        append(" />");
        in_element_ = false;
    } else {
        append("</");
        append(element_name);
        append('>');
    }
}

void XMLStreamWriter::writeAttribute(const std::string& name, const std::string& value) {
    if (!in_element_) {
        FASTDOCX_THROW(core::FastDocxException, "Cannot write attribute outside of element",
                       core::ErrorCode::InvalidArgument);
    }
    if (name.empty()) {
        FASTDOCX_THROW(core::FastDocxException, "Attribute name cannot be empty", core::ErrorCode::InvalidArgument);
    }
    pending_attributes_.emplace_back(name, value);
}

void XMLStreamWriter::writeText(const std::string& text) {
    if (text.empty()) {
        return;
    }
    if (element_stack_.empty()) {
        FASTDOCX_THROW(core::FastDocxException, "Cannot write text outside of root element",
                       core::ErrorCode::InvalidArgument);
    }

    ensureElementClosed();

    std::string escaped;
    escaped.reserve(XMLEscapes::escapedSize(text));
    XMLEscapes::appendEscaped(escaped, text);
    append(escaped);
}

std::string XMLStreamWriter::toString() const {
    if (output_mode_ != OutputMode::MEMORY_BUFFER) {
        XML_WARN("toString() called in non-memory mode");
        return "";
    }
    return memory_buffer_ + buffer_;
}

void XMLStreamWriter::ensureElementClosed() {
    if (in_element_) {
        writeAttributesToBuffer();
        append('>');
        in_element_ = false;
    }
}

void XMLStreamWriter::writeAttributesToBuffer() {
    if (pending_attributes_.empty()) return;

    size_t estimated_size = 0;
    for (const auto& attr : pending_attributes_) {
        estimated_size += 4 + attr.first.size() + XMLEscapes::escapedSize(attr.second, XMLEscapes::Context::Attribute);
    }

    std::string attribute_buffer;
    attribute_buffer.reserve(estimated_size);

    for (const auto& attr : pending_attributes_) {
        attribute_buffer += ' ';
        attribute_buffer += attr.first;
        attribute_buffer += "=\"";
        XMLEscapes::appendEscaped(attribute_buffer, attr.second, XMLEscapes::Context::Attribute);
        attribute_buffer += '"';
    }

    append(attribute_buffer);
    pending_attributes_.clear();
}

}} // namespace fastdocx::xml

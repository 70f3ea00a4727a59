#include "fastdocx/xml/XMLStreamReader.hpp"
#include "fastdocx/utils/ModuleLoggers.hpp"
#include <cstring>
#include <limits>
#include <fmt/format.h>

namespace fastdocx {
namespace xml {

XMLStreamReader::XMLStreamReader() {
    attributes_.reserve(16);
    resetState();
}

XMLStreamReader::~XMLStreamReader() {
    cleanupParser();
}

bool XMLStreamReader::initializeParser() {
    cleanupParser();

    parser_ = XML_ParserCreate(encoding_.empty() ? nullptr : encoding_.c_str());
    if (!parser_) {
        handleError(XMLParseError::ParserCreateFailed, "Failed to create XML parser");
        return false;
    }

    XML_SetUserData(parser_, this);
    XML_SetElementHandler(parser_, startElementHandler, endElementHandler);
    XML_SetCharacterDataHandler(parser_, characterDataHandler);
    return true;
}

void XMLStreamReader::cleanupParser() {
    if (parser_) {
        XML_ParserFree(parser_);
        parser_ = nullptr;
    }
}

void XMLStreamReader::resetState() {
    current_depth_ = 0;
    last_error_ = XMLParseError::Ok;
    last_error_message_.clear();
    attributes_.clear();
    current_text_.clear();
    elements_parsed_ = 0;
}

void XMLStreamReader::setStartElementCallback(StartElementCallback callback) {
    start_element_callback_ = std::move(callback);
}

void XMLStreamReader::setEndElementCallback(EndElementCallback callback) {
    end_element_callback_ = std::move(callback);
}

void XMLStreamReader::setTextCallback(TextCallback callback) {
    text_callback_ = std::move(callback);
}

void XMLStreamReader::setErrorCallback(ErrorCallback callback) {
    error_callback_ = std::move(callback);
}

void XMLStreamReader::setTrimWhitespace(bool trim) {
    trim_whitespace_ = trim;
}

XMLParseError XMLStreamReader::parseFromString(const std::string& xml_content) {
    return parseFromBuffer(xml_content.data(), xml_content.size());
}

XMLParseError XMLStreamReader::parseFromBuffer(const char* buffer, size_t size) {
    resetState();

    if (!buffer || size == 0) {
        handleError(XMLParseError::InvalidInput, "Invalid buffer or size");
        return XMLParseError::InvalidInput;
    }

    if (size > static_cast<size_t>(std::numeric_limits<int>::max())) {
        handleError(XMLParseError::InvalidInput, "XML buffer too large");
        return XMLParseError::InvalidInput;
    }

    if (!initializeParser()) {
        return last_error_;
    }

    void* expat_buffer = XML_GetBuffer(parser_, static_cast<int>(size));
    if (!expat_buffer) {
        handleError(XMLParseError::MemoryError, "Failed to get Expat buffer");
        return XMLParseError::MemoryError;
    }

    std::memcpy(expat_buffer, buffer, size);

    if (XML_ParseBuffer(parser_, static_cast<int>(size), 1) == XML_STATUS_ERROR) {
        // 回调出错时已记录错误并中止解析
        if (last_error_ == XMLParseError::CallbackError) {
            return last_error_;
        }
        std::string error_msg = fmt::format("Parse error at line {}, column {}: {}",
            XML_GetCurrentLineNumber(parser_),
            XML_GetCurrentColumnNumber(parser_),
            XML_ErrorString(XML_GetErrorCode(parser_)));
        handleError(XMLParseError::ParseFailed, error_msg);
        return XMLParseError::ParseFailed;
    }

    XML_DEBUG("Successfully parsed {} bytes, {} elements", size, elements_parsed_);
    return XMLParseError::Ok;
}

int XMLStreamReader::getCurrentLineNumber() const {
    return parser_ ? static_cast<int>(XML_GetCurrentLineNumber(parser_)) : -1;
}

int XMLStreamReader::getCurrentColumnNumber() const {
    return parser_ ? static_cast<int>(XML_GetCurrentColumnNumber(parser_)) : -1;
}

// libexpat回调函数实现
void XMLCALL XMLStreamReader::startElementHandler(void* userData, const XML_Char* name, const XML_Char** attrs) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);

    if (reader->current_depth_ >= MAX_DEPTH) {
        reader->abortParsing(fmt::format("Element nesting deeper than {}", MAX_DEPTH));
        return;
    }

    // 父元素中位于本元素之前的文本
    reader->flushText(reader->current_depth_ - 1);

    std::string_view element_name{name, std::strlen(name)};
    reader->elements_parsed_++;
    reader->parseAttributes(attrs);

    FASTDOCX_LOG_SAX_TRACE("start <{}> depth={} attrs={}", element_name, reader->current_depth_, reader->attributes_.size());

    if (reader->start_element_callback_) {
        try {
            reader->start_element_callback_(element_name, reader->attributes_, reader->current_depth_);
        } catch (const std::exception& e) {
            reader->abortParsing("Start element callback error: " + std::string(e.what()));
            return;
        }
    }

    reader->current_depth_++;
}

void XMLCALL XMLStreamReader::endElementHandler(void* userData, const XML_Char* name) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);

    reader->current_depth_--;
    reader->flushText(reader->current_depth_);

    std::string_view element_name{name, std::strlen(name)};

    if (reader->end_element_callback_) {
        try {
            reader->end_element_callback_(element_name, reader->current_depth_);
        } catch (const std::exception& e) {
            reader->abortParsing("End element callback error: " + std::string(e.what()));
        }
    }
}

void XMLCALL XMLStreamReader::characterDataHandler(void* userData, const XML_Char* data, int len) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);

    if (len > 0) {
        reader->current_text_.append(data, static_cast<size_t>(len));
    }
}

void XMLStreamReader::flushText(int depth) {
    if (current_text_.empty()) {
        return;
    }

    std::string_view text_content = trim_whitespace_ ?
        trimStringView(current_text_) : std::string_view{current_text_};

    if (!text_content.empty() && text_callback_ && depth >= 0) {
        try {
            text_callback_(text_content, depth);
        } catch (const std::exception& e) {
            current_text_.clear();
            abortParsing("Text callback error: " + std::string(e.what()));
            return;
        }
    }
    current_text_.clear();
}

void XMLStreamReader::parseAttributes(const XML_Char** attrs) {
    attributes_.clear();

    if (attrs) {
        for (int i = 0; attrs[i]; i += 2) {
            if (attrs[i + 1]) {
                attributes_.emplace_back(
                    std::string_view{attrs[i], std::strlen(attrs[i])},
                    std::string_view{attrs[i + 1], std::strlen(attrs[i + 1])}
                );
            }
        }
    }
}

std::string_view XMLStreamReader::trimStringView(std::string_view str) const {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) {
        return std::string_view{};
    }

    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

void XMLStreamReader::abortParsing(const std::string& message) {
    handleError(XMLParseError::CallbackError, message);
    if (parser_) {
        XML_StopParser(parser_, XML_FALSE);
    }
}

void XMLStreamReader::handleError(XMLParseError error, const std::string& message) {
    last_error_ = error;
    last_error_message_ = message;

    XML_DEBUG("XML parse error: {}", message);

    if (error_callback_) {
        error_callback_(error, message, getCurrentLineNumber(), getCurrentColumnNumber());
    }
}

}} // namespace fastdocx::xml

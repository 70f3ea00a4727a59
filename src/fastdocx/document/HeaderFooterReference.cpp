#include "fastdocx/document/HeaderFooterReference.hpp"

namespace fastdocx {
namespace document {

std::optional<HeaderFooterType> parseHeaderFooterType(std::string_view value) noexcept {
    if (value == "default") return HeaderFooterType::Default;
    if (value == "first")   return HeaderFooterType::First;
    if (value == "even")    return HeaderFooterType::Even;
    return std::nullopt;
}

const char* toString(HeaderFooterType type) noexcept {
    switch (type) {
        case HeaderFooterType::Default: return "default";
        case HeaderFooterType::First:   return "first";
        case HeaderFooterType::Even:    return "even";
    }
    return "default";
}

}} // namespace fastdocx::document

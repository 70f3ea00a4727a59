#include "fastdocx/opc/Relationship.hpp"
#include "fastdocx/core/Constants.hpp"
#include <fmt/format.h>
#include <limits>

namespace fastdocx {
namespace opc {

namespace {
constexpr std::string_view kIdPrefix = "rId";
}

core::Result<uint32_t> parseRelationshipId(std::string_view text) {
    if (text.size() <= kIdPrefix.size() || text.substr(0, kIdPrefix.size()) != kIdPrefix) {
        return core::makeError(core::ErrorCode::MalformedRelationshipId,
                               fmt::format("Invalid relationship id '{}'", text), std::string(text));
    }

    uint64_t value = 0;
    for (char c : text.substr(kIdPrefix.size())) {
        if (c < '0' || c > '9') {
            return core::makeError(core::ErrorCode::MalformedRelationshipId,
                                   fmt::format("Invalid relationship id '{}'", text), std::string(text));
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
        if (value > std::numeric_limits<uint32_t>::max()) {
            return core::makeError(core::ErrorCode::MalformedRelationshipId,
                                   fmt::format("Relationship id '{}' is out of range", text), std::string(text));
        }
    }
    return static_cast<uint32_t>(value);
}

RelationshipKind relationshipKindFromType(std::string_view type_uri) noexcept {
    if (type_uri == core::Constants::kHeaderRelationshipType) {
        return RelationshipKind::Header;
    }
    if (type_uri == core::Constants::kFooterRelationshipType) {
        return RelationshipKind::Footer;
    }
    if (type_uri == core::Constants::kImageRelationshipType) {
        return RelationshipKind::Image;
    }
    if (type_uri == core::Constants::kHyperlinkRelationshipType) {
        return RelationshipKind::Hyperlink;
    }
    return RelationshipKind::Unknown;
}

const char* toString(RelationshipKind kind) noexcept {
    switch (kind) {
        case RelationshipKind::Header:    return "header";
        case RelationshipKind::Footer:    return "footer";
        case RelationshipKind::Image:     return "image";
        case RelationshipKind::Hyperlink: return "hyperlink";
        case RelationshipKind::Unknown:   return "unknown";
    }
    return "unknown";
}

}} // namespace fastdocx::opc

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace fastdocx {
namespace document {

/**
 * @brief 页眉页脚放置类型（w:type）
 */
enum class HeaderFooterType {
    Default,
    First,
    Even
};

/**
 * @brief 解析w:type取值，未知取值返回nullopt
 */
std::optional<HeaderFooterType> parseHeaderFooterType(std::string_view value) noexcept;

const char* toString(HeaderFooterType type) noexcept;

/**
 * @brief 节属性中的一条页眉或页脚引用
 */
struct DocumentReference {
    uint32_t relationship_id = 0;
    HeaderFooterType type = HeaderFooterType::Default;
};

struct DocumentReferences {
    std::vector<DocumentReference> headers;
    std::vector<DocumentReference> footers;
};

}} // namespace fastdocx::document

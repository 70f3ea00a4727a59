#pragma once

#include "fastdocx/document/HeaderFooterPart.hpp"
#include "fastdocx/document/HeaderFooterReference.hpp"
#include "fastdocx/document/Media.hpp"
#include "fastdocx/document/Styles.hpp"
#include <cstdint>
#include <memory>
#include <vector>

namespace fastdocx {
namespace document {

/**
 * @brief 按放置类型挂接的页眉或页脚
 */
struct PlacedPart {
    HeaderFooterType type;
    HeaderFooterPart part;
};

/**
 * @brief 模板导入结果
 *
 * next_relationship_id 恒等于 1 + 导入的页眉页脚部件数，
 * 与源包中的关系ID无关。
 */
struct DocumentTemplate {
    std::vector<PlacedPart> headers;
    std::vector<PlacedPart> footers;
    std::shared_ptr<Styles> styles;
    std::shared_ptr<Media> media;
    bool title_page_defined = false;
    uint32_t next_relationship_id = 1;

    size_t partCount() const { return headers.size() + footers.size(); }
};

}} // namespace fastdocx::document

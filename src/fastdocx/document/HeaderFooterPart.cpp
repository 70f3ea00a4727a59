#include "fastdocx/document/HeaderFooterPart.hpp"
#include "fastdocx/core/Exception.hpp"
#include "fastdocx/utils/ModuleLoggers.hpp"

namespace fastdocx {
namespace document {

const char* toString(PartKind kind) noexcept {
    return kind == PartKind::Header ? "header" : "footer";
}

HeaderFooterPart::HeaderFooterPart(PartKind kind, uint32_t relationship_id, std::string part_name,
                                   xml::ImportedXmlNode root, std::shared_ptr<Media> media)
    : kind_(kind),
      relationship_id_(relationship_id),
      part_name_(std::move(part_name)),
      root_(std::move(root)),
      media_(std::move(media)) {
    if (!media_) {
        FASTDOCX_THROW(core::FastDocxException, "Media store cannot be null", core::ErrorCode::InvalidArgument);
    }
}

void HeaderFooterPart::addImageRelationship(std::vector<uint8_t> data, uint32_t id, const std::string& target) {
    ImageRelationship relationship;
    relationship.id = id;
    relationship.target = target;
    relationship.media = media_->addImage(std::move(data), target);
    images_.push_back(std::move(relationship));
    DOC_DEBUG("{} rId{}: 图片关系 rId{} -> {}", toString(kind_), relationship_id_, id, target);
}

void HeaderFooterPart::addHyperlinkRelationship(const std::string& target, uint32_t id, const std::string& target_mode) {
    hyperlinks_.push_back(HyperlinkRelationship{id, target, target_mode});
    DOC_DEBUG("{} rId{}: 超链接关系 rId{} -> {} ({})", toString(kind_), relationship_id_, id, target, target_mode);
}

}} // namespace fastdocx::document

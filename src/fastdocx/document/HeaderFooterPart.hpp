#pragma once

#include "fastdocx/document/Media.hpp"
#include "fastdocx/xml/ImportedXmlNode.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace fastdocx {
namespace document {

enum class PartKind {
    Header,
    Footer
};

const char* toString(PartKind kind) noexcept;

/**
 * @brief 部件内嵌的图片关系
 */
struct ImageRelationship {
    uint32_t id = 0;              // 源包中的原始ID
    std::string target;           // 图片在包内的路径
    std::shared_ptr<const MediaData> media;
};

/**
 * @brief 部件内嵌的超链接关系
 */
struct HyperlinkRelationship {
    uint32_t id = 0;
    std::string target;
    std::string target_mode;
};

/**
 * @brief 导入的页眉或页脚部件
 *
 * 持有部件的根节点（w:hdr / w:ftr），新分配的关系ID，
 * 以及部件自身关系文件中的图片和超链接。
 */
class HeaderFooterPart {
public:
    HeaderFooterPart(PartKind kind, uint32_t relationship_id, std::string part_name,
                     xml::ImportedXmlNode root, std::shared_ptr<Media> media);

    PartKind kind() const noexcept { return kind_; }
    uint32_t relationshipId() const noexcept { return relationship_id_; }
    const std::string& partName() const noexcept { return part_name_; }

    const xml::ImportedXmlNode& root() const noexcept { return root_; }
    xml::ImportedXmlNode& root() noexcept { return root_; }

    const std::shared_ptr<Media>& media() const noexcept { return media_; }

    /**
     * @brief 注册图片关系，图片数据存入共享媒体库
     */
    void addImageRelationship(std::vector<uint8_t> data, uint32_t id, const std::string& target);

    void addHyperlinkRelationship(const std::string& target, uint32_t id, const std::string& target_mode);

    const std::vector<ImageRelationship>& images() const noexcept { return images_; }
    const std::vector<HyperlinkRelationship>& hyperlinks() const noexcept { return hyperlinks_; }

private:
    PartKind kind_;
    uint32_t relationship_id_;
    std::string part_name_;
    xml::ImportedXmlNode root_;
    std::shared_ptr<Media> media_;
    std::vector<ImageRelationship> images_;
    std::vector<HyperlinkRelationship> hyperlinks_;
};

}} // namespace fastdocx::document

#pragma once

#include <cstddef>

namespace fastdocx {
namespace core {

/**
 * @brief 包内固定路径、关系类型URI及保留键
 */
struct Constants {
    static constexpr size_t kIOBufferSize = 8192;

    // 固定部件路径
    static constexpr const char* kStylesPart = "word/styles.xml";
    static constexpr const char* kDocumentPart = "word/document.xml";
    static constexpr const char* kDocumentRelationshipsPart = "word/_rels/document.xml.rels";
    static constexpr const char* kRelationshipsDirectory = "_rels";
    static constexpr const char* kRelationshipsExtension = ".rels";

    // 关系类型
    static constexpr const char* kHeaderRelationshipType =
        "http://schemas.openxmlformats.org/officeDocument/2006/relationships/header";
    static constexpr const char* kFooterRelationshipType =
        "http://schemas.openxmlformats.org/officeDocument/2006/relationships/footer";
    static constexpr const char* kImageRelationshipType =
        "http://schemas.openxmlformats.org/officeDocument/2006/relationships/image";
    static constexpr const char* kHyperlinkRelationshipType =
        "http://schemas.openxmlformats.org/officeDocument/2006/relationships/hyperlink";

    static constexpr const char* kTargetModeExternal = "External";

    // 根元素
    static constexpr const char* kHeaderRootElement = "w:hdr";
    static constexpr const char* kFooterRootElement = "w:ftr";
    static constexpr const char* kStylesRootElement = "w:styles";
    static constexpr const char* kRelationshipsRootElement = "Relationships";

    // 序列化边界上的属性标记
    static constexpr const char* kAttributesMarker = "_attr";
};

}} // namespace fastdocx::core

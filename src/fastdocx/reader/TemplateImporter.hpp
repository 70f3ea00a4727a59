#pragma once

#include "fastdocx/reader/ImportOptions.hpp"
#include "fastdocx/document/DocumentTemplate.hpp"
#include "fastdocx/document/DocumentReferenceExtractor.hpp"
#include "fastdocx/opc/RelationshipIndex.hpp"
#include "fastdocx/core/Expected.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace fastdocx {

namespace archive {
    class ZipReader;
}

namespace reader {

/**
 * @brief DOTX模板导入器
 *
 * 导入流程：
 * 1. 打开容器
 * 2. 通过样式工厂导入word/styles.xml
 * 3. 读取word/document.xml中的页眉页脚引用与首页标志
 * 4. 读取word/_rels/document.xml.rels
 * 5. 按源顺序先页眉后页脚：查找关系、加载部件、转换为通用节点、
 *    分配新的关系ID（从1开始）、解析部件自身的图片与超链接关系
 *
 * 任一步失败都返回错误，不产生部分结果。一个导入器可重复使用，
 * 每次导入之间不共享可变状态（ImportOptions::shared_media除外）。
 */
class TemplateImporter {
public:
    TemplateImporter();
    explicit TemplateImporter(ImportOptions options);

    /**
     * @brief 从内存中的模板包导入
     * @param data 模板包字节，右值传入时直接移交给ZipReader，不做拷贝
     */
    core::Result<document::DocumentTemplate> importTemplate(std::vector<uint8_t> data) const;

    /**
     * @brief 从文件导入
     */
    core::Result<document::DocumentTemplate> importTemplateFile(const std::string& path) const;

    /**
     * @brief 导入，失败时抛出FastDocxException体系的异常
     */
    document::DocumentTemplate importTemplateOrThrow(std::vector<uint8_t> data) const;

    const ImportOptions& options() const { return options_; }

private:
    /**
     * @brief 一个待加载的页眉或页脚部件
     */
    struct PartJob {
        document::PartKind kind;
        document::HeaderFooterType type;
        opc::RelationshipEntry relationship;
        std::string part_name;
        uint32_t assigned_id;
    };

    ImportOptions options_;

    core::Result<document::DocumentTemplate> importFrom(archive::ZipReader& reader) const;

    core::Result<std::shared_ptr<document::Styles>> loadStyles(const archive::ZipReader& reader) const;

    core::Result<std::vector<PartJob>> planParts(const document::DocumentReferences& references,
                                                 const opc::RelationshipIndex& relationships) const;

    core::Result<document::HeaderFooterPart> loadPart(const archive::ZipReader& reader, const PartJob& job,
                                                      const std::shared_ptr<document::Media>& media) const;

    core::VoidResult resolveNestedRelationships(const archive::ZipReader& reader,
                                                document::HeaderFooterPart& part) const;

    static core::Result<std::string> readTextPart(const archive::ZipReader& reader, const std::string& part_name);
    static core::Result<std::vector<uint8_t>> readBinaryPart(const archive::ZipReader& reader,
                                                             const std::string& part_name);
};

}} // namespace fastdocx::reader

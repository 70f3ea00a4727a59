#pragma once

#include "fastdocx/opc/Relationship.hpp"
#include "fastdocx/core/Expected.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace fastdocx {
namespace opc {

/**
 * @brief .rels关系文件的索引
 *
 * 解析时只保留导入器认识的类型（header/footer/image/hyperlink），
 * 其余类型丢弃。按数值ID建立O(1)索引，ID重复时以第一条为准。
 */
class RelationshipIndex {
public:
    RelationshipIndex() = default;

    /**
     * @brief 解析关系XML为条目列表
     * @param xml_content .rels文件内容
     * @param part_name 关系文件路径，用于错误上下文
     * @return 根元素不是Relationships时返回MissingRootElement；
     *         条目缺少Id/Type/Target时返回XmlMissingElement；
     *         ID格式错误时返回MalformedRelationshipId
     */
    static core::Result<std::vector<RelationshipEntry>> parseRelationships(const std::string& xml_content,
                                                                          const std::string& part_name = "");

    /**
     * @brief 解析并建立索引
     */
    static core::Result<RelationshipIndex> parse(const std::string& xml_content,
                                                 const std::string& part_name = "");

    explicit RelationshipIndex(std::vector<RelationshipEntry> entries);

    /**
     * @brief 根据ID查找关系
     * @return 关系指针，未找到返回nullptr
     */
    const RelationshipEntry* findById(uint32_t id) const;

    std::vector<const RelationshipEntry*> findByKind(RelationshipKind kind) const;

    const std::vector<RelationshipEntry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<RelationshipEntry> entries_;
    std::unordered_map<uint32_t, size_t> id_index_;
};

}} // namespace fastdocx::opc

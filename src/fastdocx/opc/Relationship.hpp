#pragma once

#include "fastdocx/core/Expected.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace fastdocx {
namespace opc {

/**
 * @brief 导入器关心的关系类型
 */
enum class RelationshipKind {
    Header,
    Footer,
    Image,
    Hyperlink,
    Unknown
};

/**
 * @brief 一条关系记录
 */
struct RelationshipEntry {
    uint32_t id = 0;           // "rId7" → 7
    std::string target;        // 相对于所属部件目录的路径
    RelationshipKind kind = RelationshipKind::Unknown;
    std::string target_mode;   // 默认 "Internal"
    std::string type_uri;

    RelationshipEntry() : target_mode("Internal") {}
};

/**
 * @brief 解析关系ID
 *
 * 只接受"rId"后跟一位或多位十进制数字的形式，
 * 其余形式及超出uint32范围的数值返回MalformedRelationshipId。
 */
core::Result<uint32_t> parseRelationshipId(std::string_view text);

/**
 * @brief 关系类型URI映射到RelationshipKind，未知类型返回Unknown
 */
RelationshipKind relationshipKindFromType(std::string_view type_uri) noexcept;

const char* toString(RelationshipKind kind) noexcept;

}} // namespace fastdocx::opc

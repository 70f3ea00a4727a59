#include "fastdocx/opc/RelationshipIndex.hpp"
#include "fastdocx/core/Constants.hpp"
#include "fastdocx/xml/ParsedValueBuilder.hpp"
#include "fastdocx/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace fastdocx {
namespace opc {

core::Result<std::vector<RelationshipEntry>> RelationshipIndex::parseRelationships(const std::string& xml_content,
                                                                                   const std::string& part_name) {
    auto parsed = xml::ParsedValueBuilder::parse(xml_content, part_name);
    if (!parsed) {
        return parsed.error();
    }

    if (parsed->root_name != core::Constants::kRelationshipsRootElement) {
        return core::makeError(core::ErrorCode::MissingRootElement,
                               fmt::format("Expected <{}> root but found <{}>",
                                           core::Constants::kRelationshipsRootElement, parsed->root_name),
                               part_name);
    }

    std::vector<RelationshipEntry> result;
    size_t skipped = 0;

    for (const xml::ParsedValue* item : parsed->root.collect("Relationship")) {
        auto id = item->attribute("Id");
        auto type = item->attribute("Type");
        auto target = item->attribute("Target");

        if (!id || !type || !target) {
            return core::makeError(core::ErrorCode::XmlMissingElement,
                                   fmt::format("Relationship is missing a required attribute: id='{}', type='{}', target='{}'",
                                               id.value_or(""), type.value_or(""), target.value_or("")),
                                   part_name);
        }

        auto numeric_id = parseRelationshipId(*id);
        if (!numeric_id) {
            auto error = numeric_id.error();
            error.context = fmt::format("{} ({})", part_name, *id);
            return error;
        }

        RelationshipKind kind = relationshipKindFromType(*type);
        if (kind == RelationshipKind::Unknown) {
            ++skipped;
            continue;
        }

        RelationshipEntry entry;
        entry.id = *numeric_id;
        entry.target = *target;
        entry.kind = kind;
        entry.type_uri = *type;
        if (auto mode = item->attribute("TargetMode")) {
            entry.target_mode = *mode;
        }

        OPC_DEBUG("关系 {} -> {} ({})", *id, entry.target, toString(kind));
        result.push_back(std::move(entry));
    }

    OPC_DEBUG("{}: {} 条关系, 忽略 {} 条未知类型", part_name, result.size(), skipped);
    return result;
}

core::Result<RelationshipIndex> RelationshipIndex::parse(const std::string& xml_content,
                                                         const std::string& part_name) {
    auto entries = parseRelationships(xml_content, part_name);
    if (!entries) {
        return entries.error();
    }
    return RelationshipIndex(std::move(entries.value()));
}

RelationshipIndex::RelationshipIndex(std::vector<RelationshipEntry> entries)
    : entries_(std::move(entries)) {
    id_index_.reserve(entries_.size());
    for (size_t i = 0; i < entries_.size(); ++i) {
        auto inserted = id_index_.emplace(entries_[i].id, i);
        if (!inserted.second) {
            OPC_WARN("重复的关系ID rId{}, 保留第一条", entries_[i].id);
        }
    }
}

const RelationshipEntry* RelationshipIndex::findById(uint32_t id) const {
    auto it = id_index_.find(id);
    if (it == id_index_.end()) {
        return nullptr;
    }
    return &entries_[it->second];
}

std::vector<const RelationshipEntry*> RelationshipIndex::findByKind(RelationshipKind kind) const {
    std::vector<const RelationshipEntry*> result;
    for (const auto& entry : entries_) {
        if (entry.kind == kind) {
            result.push_back(&entry);
        }
    }
    return result;
}

}} // namespace fastdocx::opc

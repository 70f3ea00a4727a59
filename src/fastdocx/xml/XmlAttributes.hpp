#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fastdocx {
namespace xml {

/**
 * @brief 有序属性集合（保持源文档中的属性顺序）
 */
using Attributes = std::vector<std::pair<std::string, std::string>>;

inline std::optional<std::string> findAttributeValue(const Attributes& attributes, std::string_view name) {
    for (const auto& [key, value] : attributes) {
        if (key == name) {
            return value;
        }
    }
    return std::nullopt;
}

}} // namespace fastdocx::xml

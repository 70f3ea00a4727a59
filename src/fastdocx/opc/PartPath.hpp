#pragma once

#include <string>
#include <string_view>

namespace fastdocx {
namespace opc {

/**
 * @brief 部件所在目录
 * @return "word/header1.xml" → "word"；没有目录时返回空串
 */
std::string directoryOf(std::string_view part_name);

/**
 * @brief 解析关系目标为包内部件路径
 *
 * - 以'/'开头的目标视为包根下的绝对路径
 * - 其余目标相对于base_dir，并折叠"."与".."段
 * - 越过包根的".."被忽略
 */
std::string resolvePartPath(std::string_view base_dir, std::string_view target);

/**
 * @brief 部件对应的关系文件路径
 * @return "word/header1.xml" → "word/_rels/header1.xml.rels"
 */
std::string relationshipsPathFor(std::string_view part_name);

}} // namespace fastdocx::opc

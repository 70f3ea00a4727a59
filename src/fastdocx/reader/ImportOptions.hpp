#pragma once

#include "fastdocx/document/Media.hpp"
#include "fastdocx/document/Styles.hpp"
#include <cstddef>
#include <memory>

namespace fastdocx {
namespace reader {

/**
 * @brief 模板导入选项
 */
struct ImportOptions {
    // 并行加载页眉页脚部件的线程数（0表示顺序加载）
    size_t worker_threads = 0;

    // 引用校验选项
    bool strict_reference_types = true;     // 未知w:type报InvalidReferenceType
    bool warn_on_multiple_sections = true;  // 多节文档记录告警

    // 协作组件
    std::shared_ptr<const document::IStylesFactory> styles_factory;  // 为空时使用ExternalStylesFactory
    std::shared_ptr<document::Media> shared_media;                   // 为空时每次导入新建
};

}} // namespace fastdocx::reader

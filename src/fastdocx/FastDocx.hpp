#pragma once

// FastDocx库 - DOTX模板导入

#include <string>

#include "fastdocx/core/ErrorCode.hpp"
#include "fastdocx/core/Expected.hpp"
#include "fastdocx/document/DocumentTemplate.hpp"
#include "fastdocx/reader/ImportOptions.hpp"
#include "fastdocx/reader/TemplateImporter.hpp"

// 版本信息
#define FASTDOCX_VERSION_MAJOR 1
#define FASTDOCX_VERSION_MINOR 0
#define FASTDOCX_VERSION_PATCH 0
#define FASTDOCX_VERSION_STRING "1.0.0"

namespace fastdocx {

inline std::string getVersion() {
    return FASTDOCX_VERSION_STRING;
}

/**
 * @brief 初始化FastDocx库
 * @param log_file_path 日志文件路径
 * @param enable_console 是否启用控制台日志
 * @return 初始化是否成功
 */
bool initialize(const std::string& log_file_path = "logs/fastdocx.log",
                bool enable_console = true);

/**
 * @brief 清理FastDocx库资源
 */
void cleanup();

} // namespace fastdocx

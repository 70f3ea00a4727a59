#pragma once
#include "Logger.hpp"
#include "LogConfig.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 每个模块都有自己的日志宏，格式: [等级][模块] 消息
 * 第一个参数必须是字符串字面量
 */

// 核心模块 (core)
#define CORE_DEBUG(...)    FASTDOCX_LOG_DEBUG("[DBG][core] " __VA_ARGS__)
#define CORE_INFO(...)     FASTDOCX_LOG_INFO("[INF][core] " __VA_ARGS__)
#define CORE_WARN(...)     FASTDOCX_LOG_WARN("[WRN][core] " __VA_ARGS__)
#define CORE_ERROR(...)    FASTDOCX_LOG_ERROR("[ERR][core] " __VA_ARGS__)

// 导入模块 (reader)
#define READER_DEBUG(...)    FASTDOCX_LOG_DEBUG("[DBG][read] " __VA_ARGS__)
#define READER_INFO(...)     FASTDOCX_LOG_INFO("[INF][read] " __VA_ARGS__)
#define READER_WARN(...)     FASTDOCX_LOG_WARN("[WRN][read] " __VA_ARGS__)
#define READER_ERROR(...)    FASTDOCX_LOG_ERROR("[ERR][read] " __VA_ARGS__)

// XML模块 (xml)
#define XML_TRACE(...)    FASTDOCX_LOG_TRACE("[TRC][xml ] " __VA_ARGS__)
#define XML_DEBUG(...)    FASTDOCX_LOG_DEBUG("[DBG][xml ] " __VA_ARGS__)
#define XML_WARN(...)     FASTDOCX_LOG_WARN("[WRN][xml ] " __VA_ARGS__)
#define XML_ERROR(...)    FASTDOCX_LOG_ERROR("[ERR][xml ] " __VA_ARGS__)

// 归档模块 (archive)
#define ARCHIVE_DEBUG(...)    FASTDOCX_LOG_DEBUG("[DBG][arch] " __VA_ARGS__)
#define ARCHIVE_INFO(...)     FASTDOCX_LOG_INFO("[INF][arch] " __VA_ARGS__)
#define ARCHIVE_WARN(...)     FASTDOCX_LOG_WARN("[WRN][arch] " __VA_ARGS__)
#define ARCHIVE_ERROR(...)    FASTDOCX_LOG_ERROR("[ERR][arch] " __VA_ARGS__)

// OPC模块 (opc)
#define OPC_DEBUG(...)    FASTDOCX_LOG_DEBUG("[DBG][opc ] " __VA_ARGS__)
#define OPC_WARN(...)     FASTDOCX_LOG_WARN("[WRN][opc ] " __VA_ARGS__)
#define OPC_ERROR(...)    FASTDOCX_LOG_ERROR("[ERR][opc ] " __VA_ARGS__)

// 文档模型模块 (document)
#define DOC_DEBUG(...)    FASTDOCX_LOG_DEBUG("[DBG][doc ] " __VA_ARGS__)
#define DOC_INFO(...)     FASTDOCX_LOG_INFO("[INF][doc ] " __VA_ARGS__)
#define DOC_WARN(...)     FASTDOCX_LOG_WARN("[WRN][doc ] " __VA_ARGS__)
#define DOC_ERROR(...)    FASTDOCX_LOG_ERROR("[ERR][doc ] " __VA_ARGS__)

// 条件日志宏
#if ENABLE_ZIP_DEBUG_LOGS
    #define FASTDOCX_LOG_ZIP_DEBUG(...) ARCHIVE_DEBUG(__VA_ARGS__)
#else
    #define FASTDOCX_LOG_ZIP_DEBUG(...) do {} while(0)
#endif

#if ENABLE_SAX_TRACE_LOGS
    #define FASTDOCX_LOG_SAX_TRACE(...) XML_TRACE(__VA_ARGS__)
#else
    #define FASTDOCX_LOG_SAX_TRACE(...) do {} while(0)
#endif

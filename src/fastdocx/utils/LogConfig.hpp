#pragma once

// 日志控制宏
// 设置为 0 禁用特定类型的日志，设置为 1 启用

#define ENABLE_ZIP_DEBUG_LOGS 0      // ZIP条目级别的调试日志
#define ENABLE_SAX_TRACE_LOGS 0      // SAX事件级别的跟踪日志（量很大）

// 条件日志宏在ModuleLoggers.hpp中用模块宏定义：
// FASTDOCX_LOG_ZIP_DEBUG -> ARCHIVE_DEBUG
// FASTDOCX_LOG_SAX_TRACE -> XML_TRACE

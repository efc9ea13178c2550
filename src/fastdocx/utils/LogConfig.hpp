#pragma once

// 日志控制宏
// 设置为 0 禁用特定类型的日志，设置为 1 启用

#define ENABLE_ZIP_DEBUG_LOGS 0        // ZIP 条目级调试日志
#define ENABLE_XML_TRACE_LOGS 0        // XML 元素级跟踪日志

#pragma once
#include "Logger.hpp"
#include "LogConfig.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 每个模块都有自己的日志宏，格式: [等级][模块] 消息
 */

// 核心模块 (core)
#define CORE_DEBUG(...)    FASTDOCX_LOG_DEBUG("[DBG][core] " __VA_ARGS__)
#define CORE_INFO(...)     FASTDOCX_LOG_INFO("[INF][core] " __VA_ARGS__)
#define CORE_WARN(...)     FASTDOCX_LOG_WARN("[WRN][core] " __VA_ARGS__)
#define CORE_ERROR(...)    FASTDOCX_LOG_ERROR("[ERR][core] " __VA_ARGS__)

// 包结构模块 (opc)
#define OPC_DEBUG(...)    FASTDOCX_LOG_DEBUG("[DBG][opc ] " __VA_ARGS__)
#define OPC_INFO(...)     FASTDOCX_LOG_INFO("[INF][opc ] " __VA_ARGS__)
#define OPC_WARN(...)     FASTDOCX_LOG_WARN("[WRN][opc ] " __VA_ARGS__)
#define OPC_ERROR(...)    FASTDOCX_LOG_ERROR("[ERR][opc ] " __VA_ARGS__)

// 部件模块 (parts)
#define PARTS_DEBUG(...)    FASTDOCX_LOG_DEBUG("[DBG][part] " __VA_ARGS__)
#define PARTS_INFO(...)     FASTDOCX_LOG_INFO("[INF][part] " __VA_ARGS__)
#define PARTS_WARN(...)     FASTDOCX_LOG_WARN("[WRN][part] " __VA_ARGS__)
#define PARTS_ERROR(...)    FASTDOCX_LOG_ERROR("[ERR][part] " __VA_ARGS__)

// 样式模块 (styles)
#define STYLE_DEBUG(...)    FASTDOCX_LOG_DEBUG("[DBG][styl] " __VA_ARGS__)
#define STYLE_INFO(...)     FASTDOCX_LOG_INFO("[INF][styl] " __VA_ARGS__)
#define STYLE_WARN(...)     FASTDOCX_LOG_WARN("[WRN][styl] " __VA_ARGS__)
#define STYLE_ERROR(...)    FASTDOCX_LOG_ERROR("[ERR][styl] " __VA_ARGS__)

// 读取模块 (reader)
#define READER_DEBUG(...)    FASTDOCX_LOG_DEBUG("[DBG][read] " __VA_ARGS__)
#define READER_WARN(...)     FASTDOCX_LOG_WARN("[WRN][read] " __VA_ARGS__)
#define READER_ERROR(...)    FASTDOCX_LOG_ERROR("[ERR][read] " __VA_ARGS__)

// XML模块 (xml)
#define XML_DEBUG(...)    FASTDOCX_LOG_DEBUG("[DBG][xml ] " __VA_ARGS__)
#define XML_WARN(...)     FASTDOCX_LOG_WARN("[WRN][xml ] " __VA_ARGS__)
#define XML_ERROR(...)    FASTDOCX_LOG_ERROR("[ERR][xml ] " __VA_ARGS__)

// 归档模块 (archive)
#define ARCHIVE_DEBUG(...)    FASTDOCX_LOG_DEBUG("[DBG][arch] " __VA_ARGS__)
#define ARCHIVE_INFO(...)     FASTDOCX_LOG_INFO("[INF][arch] " __VA_ARGS__)
#define ARCHIVE_WARN(...)     FASTDOCX_LOG_WARN("[WRN][arch] " __VA_ARGS__)
#define ARCHIVE_ERROR(...)    FASTDOCX_LOG_ERROR("[ERR][arch] " __VA_ARGS__)

// 示例程序 (examples)
#define EXAMPLE_DEBUG(...)    FASTDOCX_LOG_DEBUG("[DBG][demo] " __VA_ARGS__)
#define EXAMPLE_INFO(...)     FASTDOCX_LOG_INFO("[INF][demo] " __VA_ARGS__)
#define EXAMPLE_WARN(...)     FASTDOCX_LOG_WARN("[WRN][demo] " __VA_ARGS__)
#define EXAMPLE_ERROR(...)    FASTDOCX_LOG_ERROR("[ERR][demo] " __VA_ARGS__)

// 条件日志宏
#if ENABLE_ZIP_DEBUG_LOGS
    #define FASTDOCX_LOG_ZIP_DEBUG(...) ARCHIVE_DEBUG(__VA_ARGS__)
#else
    #define FASTDOCX_LOG_ZIP_DEBUG(...) do {} while(0)
#endif

#if ENABLE_XML_TRACE_LOGS
    #define FASTDOCX_LOG_XML_TRACE(...) FASTDOCX_LOG_TRACE("[TRC][xml ] " __VA_ARGS__)
#else
    #define FASTDOCX_LOG_XML_TRACE(...) do {} while(0)
#endif

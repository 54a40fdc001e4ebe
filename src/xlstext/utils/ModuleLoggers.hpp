#pragma once
#include "Logger.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 每个模块都有自己的日志宏，格式: [等级][模块] 消息
 */

// 转换核心 (core)
#define CORE_TRACE(...)    XLSTEXT_LOG_TRACE("[TRC][core] " __VA_ARGS__)
#define CORE_DEBUG(...)    XLSTEXT_LOG_DEBUG("[DBG][core] " __VA_ARGS__)
#define CORE_INFO(...)     XLSTEXT_LOG_INFO("[INF][core] " __VA_ARGS__)
#define CORE_WARN(...)     XLSTEXT_LOG_WARN("[WRN][core] " __VA_ARGS__)
#define CORE_ERROR(...)    XLSTEXT_LOG_ERROR("[ERR][core] " __VA_ARGS__)

// 文档读取 (reader)
#define READER_DEBUG(...)  XLSTEXT_LOG_DEBUG("[DBG][read] " __VA_ARGS__)
#define READER_INFO(...)   XLSTEXT_LOG_INFO("[INF][read] " __VA_ARGS__)
#define READER_WARN(...)   XLSTEXT_LOG_WARN("[WRN][read] " __VA_ARGS__)
#define READER_ERROR(...)  XLSTEXT_LOG_ERROR("[ERR][read] " __VA_ARGS__)

// 工具模块 (utils)
#define UTILS_DEBUG(...)   XLSTEXT_LOG_DEBUG("[DBG][util] " __VA_ARGS__)
#define UTILS_WARN(...)    XLSTEXT_LOG_WARN("[WRN][util] " __VA_ARGS__)
#define UTILS_ERROR(...)   XLSTEXT_LOG_ERROR("[ERR][util] " __VA_ARGS__)

// 命令行工具 (app)
#define APP_DEBUG(...)     XLSTEXT_LOG_DEBUG("[DBG][app ] " __VA_ARGS__)
#define APP_INFO(...)      XLSTEXT_LOG_INFO("[INF][app ] " __VA_ARGS__)
#define APP_WARN(...)      XLSTEXT_LOG_WARN("[WRN][app ] " __VA_ARGS__)
#define APP_ERROR(...)     XLSTEXT_LOG_ERROR("[ERR][app ] " __VA_ARGS__)

#pragma once
#include "Logger.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 每个模块都有自己的日志宏，格式: [等级][模块] 消息
 */

// 核心模块 (core)
#define CORE_DEBUG(...)    COLSTORE_LOG_DEBUG("[DBG][core] " __VA_ARGS__)
#define CORE_INFO(...)     COLSTORE_LOG_INFO("[INF][core] " __VA_ARGS__)
#define CORE_WARN(...)     COLSTORE_LOG_WARN("[WRN][core] " __VA_ARGS__)
#define CORE_ERROR(...)    COLSTORE_LOG_ERROR("[ERR][core] " __VA_ARGS__)

// 字节流模块 (io)
#define IO_DEBUG(...)      COLSTORE_LOG_DEBUG("[DBG][io  ] " __VA_ARGS__)
#define IO_INFO(...)       COLSTORE_LOG_INFO("[INF][io  ] " __VA_ARGS__)
#define IO_WARN(...)       COLSTORE_LOG_WARN("[WRN][io  ] " __VA_ARGS__)
#define IO_ERROR(...)      COLSTORE_LOG_ERROR("[ERR][io  ] " __VA_ARGS__)

// 有序字典模块 (sstable)
#define SSTABLE_DEBUG(...)    COLSTORE_LOG_DEBUG("[DBG][sstb] " __VA_ARGS__)
#define SSTABLE_INFO(...)     COLSTORE_LOG_INFO("[INF][sstb] " __VA_ARGS__)
#define SSTABLE_WARN(...)     COLSTORE_LOG_WARN("[WRN][sstb] " __VA_ARGS__)
#define SSTABLE_ERROR(...)    COLSTORE_LOG_ERROR("[ERR][sstb] " __VA_ARGS__)
#define SSTABLE_CRITICAL(...) COLSTORE_LOG_CRITICAL("[CRT][sstb] " __VA_ARGS__)

// 段读写模块 (segment)
#define SEGMENT_TRACE(...)    COLSTORE_LOG_TRACE("[TRC][seg ] " __VA_ARGS__)
#define SEGMENT_DEBUG(...)    COLSTORE_LOG_DEBUG("[DBG][seg ] " __VA_ARGS__)
#define SEGMENT_INFO(...)     COLSTORE_LOG_INFO("[INF][seg ] " __VA_ARGS__)
#define SEGMENT_WARN(...)     COLSTORE_LOG_WARN("[WRN][seg ] " __VA_ARGS__)
#define SEGMENT_ERROR(...)    COLSTORE_LOG_ERROR("[ERR][seg ] " __VA_ARGS__)
#define SEGMENT_CRITICAL(...) COLSTORE_LOG_CRITICAL("[CRT][seg ] " __VA_ARGS__)

// 示例程序 (example)
#define EXAMPLE_DEBUG(...)    COLSTORE_LOG_DEBUG("[DBG][demo] " __VA_ARGS__)
#define EXAMPLE_INFO(...)     COLSTORE_LOG_INFO("[INF][demo] " __VA_ARGS__)
#define EXAMPLE_WARN(...)     COLSTORE_LOG_WARN("[WRN][demo] " __VA_ARGS__)
#define EXAMPLE_ERROR(...)    COLSTORE_LOG_ERROR("[ERR][demo] " __VA_ARGS__)

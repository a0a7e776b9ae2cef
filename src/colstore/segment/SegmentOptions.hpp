#pragma once

#include "colstore/core/Constants.hpp"
#include <cstddef>

namespace colstore {
namespace segment {

/**
 * @brief 段写入器配置
 */
struct SegmentWriterOptions {
    size_t index_block_size = core::Constants::kDefaultIndexBlockSize;        // 索引数据块目标大小
    size_t index_initial_capacity = core::Constants::kDefaultIndexCapacity;   // 索引缓冲预分配
    size_t key_buffer_reserve = 64;                                           // 列键缓冲预分配
    bool flush_on_finalize = true;                                            // finalize后刷新底层流
};

}} // namespace colstore::segment

#pragma once

#include <cstddef>
#include <cstdint>

namespace colstore {
namespace core {

// 通用常量集中定义，便于统一调整与复用
struct Constants {
    // 段尾部：索引长度（u64 小端）
    static constexpr size_t kSegmentTrailerSize = 8;

    // 列键中列名与类型码之间的分隔字节
    static constexpr uint8_t kColumnKeySeparator = 0x00;

    // SSTable 默认块大小与尾部
    static constexpr size_t kDefaultIndexBlockSize = 4096;
    static constexpr size_t kDefaultIndexCapacity = 100000;
    static constexpr size_t kSSTableFooterSize = 24;
    static constexpr uint64_t kSSTableMagic = 0x31304C4254535343ULL;  // "CSSTBL01"
};

} // namespace core
} // namespace colstore

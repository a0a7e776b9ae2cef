#pragma once

#include <cstdint>
#include <string>
#include <fmt/format.h>

namespace colstore {
namespace sstable {

/**
 * @brief 半开区间 [start, end) 的绝对字节偏移
 */
struct ByteRange {
    uint64_t start = 0;
    uint64_t end = 0;

    ByteRange() = default;
    ByteRange(uint64_t s, uint64_t e) : start(s), end(e) {}

    uint64_t length() const noexcept { return end - start; }
    bool empty() const noexcept { return start == end; }
    bool isValid() const noexcept { return start <= end; }

    bool operator==(const ByteRange& other) const noexcept {
        return start == other.start && end == other.end;
    }
    bool operator!=(const ByteRange& other) const noexcept {
        return !(*this == other);
    }

    std::string toString() const {
        return fmt::format("[{}, {})", start, end);
    }
};

}} // namespace colstore::sstable

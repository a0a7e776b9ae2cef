#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

namespace colstore {
namespace io {

// 小端定长整数与LEB128变长整数编解码

inline void appendU64LE(std::vector<uint8_t>& out, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<uint8_t>(value >> (8 * i)));
    }
}

inline void encodeU64LE(uint64_t value, uint8_t* out) {
    for (int i = 0; i < 8; ++i) {
        out[i] = static_cast<uint8_t>(value >> (8 * i));
    }
}

inline uint64_t readU64LE(const uint8_t* data) {
    uint64_t value = 0;
    for (int i = 7; i >= 0; --i) {
        value = (value << 8) | data[i];
    }
    return value;
}

inline void appendVarint(std::vector<uint8_t>& out, uint64_t value) {
    while (value >= 0x80) {
        out.push_back(static_cast<uint8_t>(value | 0x80));
        value >>= 7;
    }
    out.push_back(static_cast<uint8_t>(value));
}

/**
 * @brief 解码一个LEB128变长整数
 * @param pos 输入位置，成功时前移
 * @param end 输入末尾
 * @return 是否成功（截断或超过10字节返回false）
 */
inline bool readVarint(const uint8_t*& pos, const uint8_t* end, uint64_t& value) {
    value = 0;
    const uint8_t* p = pos;
    for (int shift = 0; shift < 64; shift += 7) {
        if (p == end) {
            return false;
        }
        uint8_t byte = *p++;
        value |= static_cast<uint64_t>(byte & 0x7F) << shift;
        if ((byte & 0x80) == 0) {
            pos = p;
            return true;
        }
    }
    return false;
}

}} // namespace colstore::io

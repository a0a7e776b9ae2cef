#pragma once

#include "colstore/core/Expected.hpp"
#include <array>
#include <cstdint>

namespace colstore {
namespace columnar {

// 列值类型，代码占类型码的低6位
enum class ColumnType : uint8_t {
    I64 = 0,
    U64 = 1,
    F64 = 2,
    Bytes = 3,
    Str = 4,
    Bool = 5,
    IpAddr = 6,
    DateTime = 7
};

// 基数，代码占类型码的高2位
enum class Cardinality : uint8_t {
    Required = 0,     // 每行恰好一个值
    Optional = 1,     // 每行0或1个值
    Multivalued = 2   // 每行任意个值
};

constexpr std::array<ColumnType, 8> kAllColumnTypes = {
    ColumnType::I64, ColumnType::U64, ColumnType::F64, ColumnType::Bytes,
    ColumnType::Str, ColumnType::Bool, ColumnType::IpAddr, ColumnType::DateTime
};

constexpr std::array<Cardinality, 3> kAllCardinalities = {
    Cardinality::Required, Cardinality::Optional, Cardinality::Multivalued
};

const char* toString(ColumnType type) noexcept;
const char* toString(Cardinality cardinality) noexcept;

/**
 * @brief 列类型与基数的组合，与单字节类型码一一对应
 *
 * code = (cardinality << 6) | type
 */
struct ColumnTypeAndCardinality {
    ColumnType type = ColumnType::Bytes;
    Cardinality cardinality = Cardinality::Required;

    constexpr ColumnTypeAndCardinality() = default;
    constexpr ColumnTypeAndCardinality(ColumnType t, Cardinality c) : type(t), cardinality(c) {}

    constexpr uint8_t toCode() const noexcept {
        return static_cast<uint8_t>((static_cast<uint8_t>(cardinality) << 6) |
                                    static_cast<uint8_t>(type));
    }

    /**
     * @brief 从类型码解码，未知的类型位或基数位返回CorruptedData
     */
    static core::Result<ColumnTypeAndCardinality> tryFromCode(uint8_t code);

    constexpr bool operator==(const ColumnTypeAndCardinality& other) const noexcept {
        return type == other.type && cardinality == other.cardinality;
    }
    constexpr bool operator!=(const ColumnTypeAndCardinality& other) const noexcept {
        return !(*this == other);
    }
};

}} // namespace colstore::columnar

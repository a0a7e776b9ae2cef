#include "colstore/columnar/ColumnType.hpp"
#include <fmt/format.h>

namespace colstore {
namespace columnar {

const char* toString(ColumnType type) noexcept {
    switch (type) {
        case ColumnType::I64:      return "i64";
        case ColumnType::U64:      return "u64";
        case ColumnType::F64:      return "f64";
        case ColumnType::Bytes:    return "bytes";
        case ColumnType::Str:      return "str";
        case ColumnType::Bool:     return "bool";
        case ColumnType::IpAddr:   return "ip_addr";
        case ColumnType::DateTime: return "datetime";
        default:                   return "unknown";
    }
}

const char* toString(Cardinality cardinality) noexcept {
    switch (cardinality) {
        case Cardinality::Required:    return "required";
        case Cardinality::Optional:    return "optional";
        case Cardinality::Multivalued: return "multivalued";
        default:                       return "unknown";
    }
}

core::Result<ColumnTypeAndCardinality> ColumnTypeAndCardinality::tryFromCode(uint8_t code) {
    uint8_t type_code = code & 0x3F;
    uint8_t cardinality_code = code >> 6;
    if (type_code > static_cast<uint8_t>(ColumnType::DateTime)) {
        return core::makeError(core::ErrorCode::CorruptedData,
                               fmt::format("unknown column type code {}", type_code));
    }
    if (cardinality_code > static_cast<uint8_t>(Cardinality::Multivalued)) {
        return core::makeError(core::ErrorCode::CorruptedData,
                               fmt::format("unknown cardinality code {}", cardinality_code));
    }
    return ColumnTypeAndCardinality(static_cast<ColumnType>(type_code),
                                    static_cast<Cardinality>(cardinality_code));
}

}} // namespace colstore::columnar

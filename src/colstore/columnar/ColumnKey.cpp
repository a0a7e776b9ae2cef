#include "colstore/columnar/ColumnKey.hpp"
#include "colstore/core/Constants.hpp"

namespace colstore {
namespace columnar {

void prepareColumnKey(std::string_view column_name,
                      ColumnTypeAndCardinality type_and_cardinality,
                      std::string& buffer) {
    buffer.clear();
    buffer.append(column_name.data(), column_name.size());
    buffer.push_back(static_cast<char>(core::Constants::kColumnKeySeparator));
    buffer.push_back(static_cast<char>(type_and_cardinality.toCode()));
}

std::string encodeColumnKey(std::string_view column_name,
                            ColumnTypeAndCardinality type_and_cardinality) {
    std::string key;
    key.reserve(column_name.size() + 2);
    prepareColumnKey(column_name, type_and_cardinality, key);
    return key;
}

bool isValidColumnName(std::string_view column_name) noexcept {
    return column_name.find(static_cast<char>(core::Constants::kColumnKeySeparator)) ==
           std::string_view::npos;
}

core::Result<DecodedColumnKey> decodeColumnKey(std::string_view key) {
    if (key.size() < 2 ||
        static_cast<uint8_t>(key[key.size() - 2]) != core::Constants::kColumnKeySeparator) {
        return core::makeError(core::ErrorCode::CorruptedData, "malformed column key");
    }
    auto type_and_cardinality =
        ColumnTypeAndCardinality::tryFromCode(static_cast<uint8_t>(key.back()));
    if (!type_and_cardinality) {
        return std::move(type_and_cardinality).error();
    }
    DecodedColumnKey decoded;
    decoded.column_name.assign(key.data(), key.size() - 2);
    decoded.type_and_cardinality = type_and_cardinality.value();
    return decoded;
}

std::string columnKeyPrefix(std::string_view column_name) {
    std::string prefix(column_name);
    prefix.push_back(static_cast<char>(core::Constants::kColumnKeySeparator));
    return prefix;
}

}} // namespace colstore::columnar

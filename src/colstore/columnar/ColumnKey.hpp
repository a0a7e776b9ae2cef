#pragma once

#include "colstore/columnar/ColumnType.hpp"
#include "colstore/core/Expected.hpp"
#include <string>
#include <string_view>

namespace colstore {
namespace columnar {

/**
 * @brief 将列键编码进buffer：name ++ 0x00 ++ 类型码
 *
 * 先清空buffer再写入，buffer可跨列复用。不检查列名内容，
 * 列名合法性由isValidColumnName()判断。
 */
void prepareColumnKey(std::string_view column_name,
                      ColumnTypeAndCardinality type_and_cardinality,
                      std::string& buffer);

std::string encodeColumnKey(std::string_view column_name,
                            ColumnTypeAndCardinality type_and_cardinality);

/**
 * @brief 列名中不得出现分隔字节0x00
 */
bool isValidColumnName(std::string_view column_name) noexcept;

struct DecodedColumnKey {
    std::string column_name;
    ColumnTypeAndCardinality type_and_cardinality;
};

/**
 * @brief 解码列键：最后一个字节为类型码，倒数第二个字节必须是0x00
 */
core::Result<DecodedColumnKey> decodeColumnKey(std::string_view key);

/**
 * @brief 某列名下全部列键的公共前缀（name ++ 0x00）
 */
std::string columnKeyPrefix(std::string_view column_name);

}} // namespace colstore::columnar

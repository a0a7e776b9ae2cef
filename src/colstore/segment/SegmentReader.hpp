#pragma once

#include "colstore/columnar/ColumnType.hpp"
#include "colstore/core/Expected.hpp"
#include "colstore/io/ByteSource.hpp"
#include "colstore/sstable/ByteRange.hpp"
#include "colstore/sstable/SSTableReader.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace colstore {
namespace segment {

/**
 * @brief 段中一列的位置信息
 */
struct ColumnHandle {
    std::string column_name;
    columnar::ColumnTypeAndCardinality type_and_cardinality;
    sstable::ByteRange range;

    uint64_t numBytes() const noexcept { return range.length(); }
};

/**
 * @brief 段读取器
 *
 * 打开时只读取尾部与索引，列负载按需读取。
 */
class SegmentReader {
public:
    /**
     * @brief 读取尾部、定位并解析索引
     * @return 段过短、索引长度越界或索引损坏时返回CorruptedData
     */
    static core::Result<SegmentReader> open(std::shared_ptr<io::IByteSource> source);

    /**
     * @brief 按列键顺序列出全部列
     */
    core::Result<std::vector<ColumnHandle>> listColumns() const;

    /**
     * @brief 列出列名以name_prefix开头的列
     */
    core::Result<std::vector<ColumnHandle>> listColumnsWithPrefix(std::string_view name_prefix) const;

    /**
     * @brief 列名恰好为column_name的全部列（各类型/基数）
     */
    core::Result<std::vector<ColumnHandle>> readColumns(std::string_view column_name) const;

    core::Result<std::optional<ColumnHandle>> findColumn(
        std::string_view column_name,
        columnar::ColumnTypeAndCardinality type_and_cardinality) const;

    /**
     * @brief 读取一列的原始负载
     */
    core::Result<std::vector<uint8_t>> readColumnBytes(const ColumnHandle& column) const;

    uint64_t payloadBytes() const noexcept { return payload_bytes_; }
    uint64_t indexBytes() const noexcept { return index_bytes_; }
    uint64_t numColumns() const noexcept { return index_.numTerms(); }

private:
    SegmentReader(std::shared_ptr<io::IByteSource> source, sstable::SSTableReader index,
                  uint64_t payload_bytes, uint64_t index_bytes);

    static core::Result<std::vector<ColumnHandle>> toHandles(
        core::Result<std::vector<sstable::SSTableReader::Entry>> entries);

    std::shared_ptr<io::IByteSource> source_;
    sstable::SSTableReader index_;
    uint64_t payload_bytes_;
    uint64_t index_bytes_;
};

}} // namespace colstore::segment

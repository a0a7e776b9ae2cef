#pragma once

#include "colstore/columnar/ColumnType.hpp"
#include "colstore/core/Expected.hpp"
#include "colstore/io/CountingWriter.hpp"
#include "colstore/segment/ColumnSpanRecorder.hpp"
#include "colstore/segment/SegmentOptions.hpp"
#include "colstore/sstable/SSTableWriter.hpp"
#include <memory>
#include <string>
#include <string_view>

namespace colstore {
namespace segment {

/**
 * @brief 列式段写入器
 *
 * 段布局：各列负载按写入顺序首尾相接，随后是有序索引（列键 -> 字节区间），
 * 最后8字节为索引长度（u64 小端）。整个过程只向前写，不回退。
 *
 * 用法：
 * @code
 * SegmentWriter writer(std::make_unique<io::MemorySink>());
 * {
 *     auto column = writer.beginColumn("price", {ColumnType::F64, Cardinality::Required});
 *     column.writeAll(payload);
 * }   // 离开作用域时登记字节区间
 * writer.finalize();
 * @endcode
 *
 * 约束：
 * - 同一时刻至多一个打开的列，beginColumn/finalize在有打开的列时抛OperationException
 * - 列必须按列键严格递增的顺序写入，违反时进程终止
 * - finalize只能调用一次
 * - 析构时不得有打开的列，否则进程终止
 */
class SegmentWriter {
public:
    explicit SegmentWriter(std::unique_ptr<io::IByteSink> sink,
                           SegmentWriterOptions options = SegmentWriterOptions());
    ~SegmentWriter();

    // 打开的列持有指向写入器的指针，禁止拷贝和移动
    SegmentWriter(const SegmentWriter&) = delete;
    SegmentWriter& operator=(const SegmentWriter&) = delete;
    SegmentWriter(SegmentWriter&&) = delete;
    SegmentWriter& operator=(SegmentWriter&&) = delete;

    /**
     * @brief 开始一列，不写入任何字节
     * @param column_name 列名，不得包含0x00
     * @throws ParameterException 列名包含0x00
     * @throws OperationException 已有打开的列或已finalize
     */
    ColumnSpanRecorder beginColumn(std::string_view column_name,
                                   columnar::ColumnTypeAndCardinality type_and_cardinality);

    /**
     * @brief 写出索引与尾部
     * @return 底层流写入失败时返回IoError，此时段不可用
     * @throws OperationException 有打开的列或重复调用
     */
    core::VoidResult finalize();

    uint64_t writtenBytes() const noexcept { return writer_.writtenBytes(); }
    uint64_t numColumns() const noexcept { return num_columns_; }
    bool hasOpenColumn() const noexcept { return column_open_; }
    bool isFinalized() const noexcept { return finalized_; }
    const SegmentWriterOptions& options() const noexcept { return options_; }

    io::IByteSink& sink() { return writer_.inner(); }
    const io::IByteSink& sink() const { return writer_.inner(); }

private:
    friend class ColumnSpanRecorder;

    core::Result<size_t> writeColumnBytes(const uint8_t* data, size_t size);
    core::VoidResult writeAllColumnBytes(const uint8_t* data, size_t size);
    core::VoidResult flushColumnBytes();
    void endColumn(uint64_t start_offset, uint64_t end_offset) noexcept;

    SegmentWriterOptions options_;
    io::CountingWriter writer_;
    sstable::SSTableWriter index_;
    std::string key_buffer_;
    uint64_t num_columns_ = 0;
    bool column_open_ = false;
    bool finalized_ = false;
};

}} // namespace colstore::segment

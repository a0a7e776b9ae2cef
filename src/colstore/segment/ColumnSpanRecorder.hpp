#pragma once

#include "colstore/core/Expected.hpp"
#include <cstdint>
#include <string_view>
#include <vector>

namespace colstore {
namespace segment {

class SegmentWriter;

/**
 * @brief 单列负载的写入句柄
 *
 * 由SegmentWriter::beginColumn()返回，写入的字节直接转发到段的输出流。
 * close()或析构时把 [起始偏移, 当前偏移) 登记到索引，且只登记一次。
 * 只能移动，被移走的句柄析构时什么也不做。
 */
class ColumnSpanRecorder {
public:
    ~ColumnSpanRecorder();

    ColumnSpanRecorder(ColumnSpanRecorder&& other) noexcept;
    ColumnSpanRecorder& operator=(ColumnSpanRecorder&&) = delete;
    ColumnSpanRecorder(const ColumnSpanRecorder&) = delete;
    ColumnSpanRecorder& operator=(const ColumnSpanRecorder&) = delete;

    /**
     * @brief 写入负载，可能只写入一部分
     * @return 实际写入的字节数；句柄已关闭时返回InvalidState
     */
    core::Result<size_t> write(const uint8_t* data, size_t size);

    core::VoidResult writeAll(const uint8_t* data, size_t size);
    core::VoidResult writeAll(std::string_view data);
    core::VoidResult writeAll(const std::vector<uint8_t>& data);

    core::VoidResult flush();

    /**
     * @brief 结束该列并登记字节区间，重复调用无效果
     */
    void close() noexcept;

    bool isOpen() const noexcept { return writer_ != nullptr; }
    uint64_t startOffset() const noexcept { return start_offset_; }

    /**
     * @brief 该列目前已写入的字节数（关闭后为最终长度）
     */
    uint64_t bytesWritten() const noexcept;

private:
    friend class SegmentWriter;

    ColumnSpanRecorder(SegmentWriter& writer, uint64_t start_offset) noexcept;

    core::Error closedError() const;

    SegmentWriter* writer_;
    uint64_t start_offset_;
    uint64_t end_offset_;
};

}} // namespace colstore::segment

#include "colstore/segment/SegmentWriter.hpp"
#include "colstore/columnar/ColumnKey.hpp"
#include "colstore/core/Exception.hpp"
#include "colstore/io/BinaryUtils.hpp"
#include "colstore/utils/ModuleLoggers.hpp"
#include <exception>

namespace colstore {
namespace segment {

SegmentWriter::SegmentWriter(std::unique_ptr<io::IByteSink> sink, SegmentWriterOptions options)
    : options_(options)
    , writer_(std::move(sink))
    , index_(options.index_block_size, options.index_initial_capacity) {
    key_buffer_.reserve(options_.key_buffer_reserve);
    SEGMENT_DEBUG("Segment writer created on {}", writer_.getTypeName());
}

SegmentWriter::~SegmentWriter() {
    // 打开的列持有指向本对象的指针，析构后无法再登记
    if (column_open_) {
        SEGMENT_CRITICAL("Segment writer destroyed while column {} is still open at offset {}",
                         num_columns_, writer_.writtenBytes());
        std::terminate();
    }
    if (!finalized_) {
        SEGMENT_WARN("Segment writer destroyed without finalize after {} columns, {} bytes; output is incomplete",
                     num_columns_, writer_.writtenBytes());
    }
}

ColumnSpanRecorder SegmentWriter::beginColumn(std::string_view column_name,
                                              columnar::ColumnTypeAndCardinality type_and_cardinality) {
    COLSTORE_THROW_IF(finalized_, core::OperationException,
                      "Segment writer already finalized", "beginColumn");
    COLSTORE_THROW_IF(column_open_, core::OperationException,
                      "Another column is still open on this segment writer", "beginColumn");
    COLSTORE_THROW_IF(!columnar::isValidColumnName(column_name), core::ParameterException,
                      "Column name must not contain the 0x00 separator byte", "column_name");

    uint64_t start_offset = writer_.writtenBytes();
    columnar::prepareColumnKey(column_name, type_and_cardinality, key_buffer_);

    if (!index_.acceptsKey(key_buffer_)) {
        SEGMENT_CRITICAL("Column '{}' ({}, {}) is not after the previous column in key order",
                         column_name, columnar::toString(type_and_cardinality.type),
                         columnar::toString(type_and_cardinality.cardinality));
        std::terminate();
    }

    column_open_ = true;
    SEGMENT_TRACE("Begin column '{}' ({}, {}) at offset {}", column_name,
                  columnar::toString(type_and_cardinality.type),
                  columnar::toString(type_and_cardinality.cardinality), start_offset);
    return ColumnSpanRecorder(*this, start_offset);
}

core::Result<size_t> SegmentWriter::writeColumnBytes(const uint8_t* data, size_t size) {
    auto result = writer_.write(data, size);
    if (!result) {
        SEGMENT_ERROR("Column write failed at offset {}: {}", writer_.writtenBytes(),
                      result.error().fullMessage());
    }
    return result;
}

core::VoidResult SegmentWriter::writeAllColumnBytes(const uint8_t* data, size_t size) {
    auto result = writer_.writeAll(data, size);
    if (!result) {
        SEGMENT_ERROR("Column write failed at offset {}: {}", writer_.writtenBytes(),
                      result.error().fullMessage());
    }
    return result;
}

core::VoidResult SegmentWriter::flushColumnBytes() {
    auto result = writer_.flush();
    if (!result) {
        SEGMENT_ERROR("Flush failed at offset {}: {}", writer_.writtenBytes(),
                      result.error().fullMessage());
    }
    return result;
}

void SegmentWriter::endColumn(uint64_t start_offset, uint64_t end_offset) noexcept {
    index_.insertCannotFail(key_buffer_, sstable::ByteRange(start_offset, end_offset));
    key_buffer_.clear();
    column_open_ = false;
    ++num_columns_;
    SEGMENT_TRACE("End column at [{}, {})", start_offset, end_offset);
}

core::VoidResult SegmentWriter::finalize() {
    COLSTORE_THROW_IF(finalized_, core::OperationException,
                      "Segment writer already finalized", "finalize");
    COLSTORE_THROW_IF(column_open_, core::OperationException,
                      "Cannot finalize while a column is open", "finalize");
    finalized_ = true;

    auto index_bytes = index_.finish();
    if (!index_bytes) {
        return std::move(index_bytes).error();
    }
    const std::vector<uint8_t>& bytes = index_bytes.value();
    uint64_t payload_bytes = writer_.writtenBytes();

    auto result = writer_.writeAll(bytes.data(), bytes.size());
    if (!result) {
        SEGMENT_ERROR("Failed to write segment index ({} bytes): {}", bytes.size(),
                      result.error().fullMessage());
        return result;
    }

    uint8_t trailer[core::Constants::kSegmentTrailerSize];
    io::encodeU64LE(static_cast<uint64_t>(bytes.size()), trailer);
    result = writer_.writeAll(trailer, sizeof(trailer));
    if (!result) {
        SEGMENT_ERROR("Failed to write segment trailer: {}", result.error().fullMessage());
        return result;
    }

    if (options_.flush_on_finalize) {
        result = writer_.flush();
        if (!result) {
            SEGMENT_ERROR("Failed to flush segment: {}", result.error().fullMessage());
            return result;
        }
    }

    SEGMENT_INFO("Segment finalized: {} columns, {} payload bytes, {} index bytes, {} total",
                 num_columns_, payload_bytes, bytes.size(), writer_.writtenBytes());
    return {};
}

}} // namespace colstore::segment

#include "colstore/segment/ColumnSpanRecorder.hpp"
#include "colstore/segment/SegmentWriter.hpp"

namespace colstore {
namespace segment {

ColumnSpanRecorder::ColumnSpanRecorder(SegmentWriter& writer, uint64_t start_offset) noexcept
    : writer_(&writer), start_offset_(start_offset), end_offset_(start_offset) {
}

ColumnSpanRecorder::ColumnSpanRecorder(ColumnSpanRecorder&& other) noexcept
    : writer_(other.writer_), start_offset_(other.start_offset_), end_offset_(other.end_offset_) {
    other.writer_ = nullptr;
}

ColumnSpanRecorder::~ColumnSpanRecorder() {
    close();
}

void ColumnSpanRecorder::close() noexcept {
    if (!writer_) {
        return;
    }
    SegmentWriter* writer = writer_;
    writer_ = nullptr;
    end_offset_ = writer->writtenBytes();
    writer->endColumn(start_offset_, end_offset_);
}

core::Result<size_t> ColumnSpanRecorder::write(const uint8_t* data, size_t size) {
    if (!writer_) {
        return closedError();
    }
    return writer_->writeColumnBytes(data, size);
}

core::VoidResult ColumnSpanRecorder::writeAll(const uint8_t* data, size_t size) {
    if (!writer_) {
        return closedError();
    }
    return writer_->writeAllColumnBytes(data, size);
}

core::VoidResult ColumnSpanRecorder::writeAll(std::string_view data) {
    return writeAll(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

core::VoidResult ColumnSpanRecorder::writeAll(const std::vector<uint8_t>& data) {
    return writeAll(data.data(), data.size());
}

core::VoidResult ColumnSpanRecorder::flush() {
    if (!writer_) {
        return closedError();
    }
    return writer_->flushColumnBytes();
}

uint64_t ColumnSpanRecorder::bytesWritten() const noexcept {
    if (writer_) {
        return writer_->writtenBytes() - start_offset_;
    }
    return end_offset_ - start_offset_;
}

core::Error ColumnSpanRecorder::closedError() const {
    return core::makeError(core::ErrorCode::InvalidState, "column span recorder is closed");
}

}} // namespace colstore::segment

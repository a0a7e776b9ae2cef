#include "colstore/segment/SegmentReader.hpp"
#include "colstore/columnar/ColumnKey.hpp"
#include "colstore/core/Constants.hpp"
#include "colstore/core/Exception.hpp"
#include "colstore/io/BinaryUtils.hpp"
#include "colstore/utils/ModuleLoggers.hpp"

namespace colstore {
namespace segment {

namespace {

core::Error corrupted(const std::string& what) {
    SEGMENT_ERROR("Corrupted segment: {}", what);
    return core::makeError(core::ErrorCode::CorruptedData, "corrupted segment: " + what);
}

} // namespace

SegmentReader::SegmentReader(std::shared_ptr<io::IByteSource> source, sstable::SSTableReader index,
                             uint64_t payload_bytes, uint64_t index_bytes)
    : source_(std::move(source))
    , index_(std::move(index))
    , payload_bytes_(payload_bytes)
    , index_bytes_(index_bytes) {
}

core::Result<SegmentReader> SegmentReader::open(std::shared_ptr<io::IByteSource> source) {
    COLSTORE_THROW_IF(!source, core::ParameterException, "Byte source cannot be null", "source");

    constexpr uint64_t trailer_size = core::Constants::kSegmentTrailerSize;
    uint64_t total = source->size();
    if (total < trailer_size) {
        return corrupted(fmt::format("{} bytes is shorter than the trailer", total));
    }

    auto trailer = source->readAt(total - trailer_size, trailer_size);
    if (!trailer) {
        return std::move(trailer).error();
    }
    uint64_t index_bytes = io::readU64LE(trailer.value().data());
    if (index_bytes > total - trailer_size) {
        return corrupted(fmt::format("index length {} exceeds segment size {}", index_bytes, total));
    }
    uint64_t payload_bytes = total - trailer_size - index_bytes;

    auto index_data = source->readAt(payload_bytes, static_cast<size_t>(index_bytes));
    if (!index_data) {
        return std::move(index_data).error();
    }
    auto index = sstable::SSTableReader::open(std::move(index_data).value());
    if (!index) {
        return std::move(index).error();
    }

    SEGMENT_DEBUG("Opened segment: {} columns, {} payload bytes, {} index bytes",
                  index.value().numTerms(), payload_bytes, index_bytes);
    return SegmentReader(std::move(source), std::move(index).value(), payload_bytes, index_bytes);
}

core::Result<std::vector<ColumnHandle>> SegmentReader::toHandles(
        core::Result<std::vector<sstable::SSTableReader::Entry>> entries) {
    if (!entries) {
        return std::move(entries).error();
    }
    std::vector<ColumnHandle> handles;
    handles.reserve(entries.value().size());
    for (auto& entry : entries.value()) {
        auto decoded = columnar::decodeColumnKey(entry.key);
        if (!decoded) {
            return std::move(decoded).error();
        }
        ColumnHandle handle;
        handle.column_name = std::move(decoded.value().column_name);
        handle.type_and_cardinality = decoded.value().type_and_cardinality;
        handle.range = entry.value;
        handles.push_back(std::move(handle));
    }
    return handles;
}

core::Result<std::vector<ColumnHandle>> SegmentReader::listColumns() const {
    return toHandles(index_.entries());
}

core::Result<std::vector<ColumnHandle>> SegmentReader::listColumnsWithPrefix(std::string_view name_prefix) const {
    return toHandles(index_.prefix(name_prefix));
}

core::Result<std::vector<ColumnHandle>> SegmentReader::readColumns(std::string_view column_name) const {
    return toHandles(index_.prefix(columnar::columnKeyPrefix(column_name)));
}

core::Result<std::optional<ColumnHandle>> SegmentReader::findColumn(
        std::string_view column_name,
        columnar::ColumnTypeAndCardinality type_and_cardinality) const {
    auto range = index_.get(columnar::encodeColumnKey(column_name, type_and_cardinality));
    if (!range) {
        return std::move(range).error();
    }
    if (!range.value()) {
        return std::optional<ColumnHandle>();
    }
    ColumnHandle handle;
    handle.column_name = std::string(column_name);
    handle.type_and_cardinality = type_and_cardinality;
    handle.range = *range.value();
    return std::optional<ColumnHandle>(std::move(handle));
}

core::Result<std::vector<uint8_t>> SegmentReader::readColumnBytes(const ColumnHandle& column) const {
    if (!column.range.isValid() || column.range.end > payload_bytes_) {
        return corrupted(fmt::format("column '{}' range {} outside payload of {} bytes",
                                     column.column_name, column.range.toString(), payload_bytes_));
    }
    return source_->readAt(column.range.start, static_cast<size_t>(column.range.length()));
}

}} // namespace colstore::segment

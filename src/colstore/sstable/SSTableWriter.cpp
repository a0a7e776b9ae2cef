#include "colstore/sstable/SSTableWriter.hpp"
#include "colstore/core/Exception.hpp"
#include "colstore/io/BinaryUtils.hpp"
#include "colstore/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <exception>

namespace colstore {
namespace sstable {

namespace {

size_t sharedPrefixLength(std::string_view a, std::string_view b) {
    size_t limit = std::min(a.size(), b.size());
    size_t i = 0;
    while (i < limit && a[i] == b[i]) {
        ++i;
    }
    return i;
}

} // namespace

SSTableWriter::SSTableWriter(size_t block_size, size_t initial_capacity)
    : block_size_(block_size == 0 ? core::Constants::kDefaultIndexBlockSize : block_size) {
    output_.reserve(initial_capacity);
    block_.reserve(block_size_ + 64);
}

bool SSTableWriter::acceptsKey(std::string_view key) const noexcept {
    return num_terms_ == 0 || std::string_view(last_key_) < key;
}

void SSTableWriter::insert(std::string_view key, const ByteRange& value) {
    COLSTORE_THROW_IF(finished_, core::OperationException,
                      "SSTable writer already finished", "insert");
    if (!acceptsKey(key)) {
        throw core::OperationException("Keys must be inserted in strictly increasing order",
                                       "insert", __FILE__, __LINE__,
                                       core::ErrorCode::KeyOrderViolation);
    }
    COLSTORE_THROW_IF(!value.isValid(), core::OperationException,
                      "Invalid byte range " + value.toString(), "insert");
    append(key, value);
}

void SSTableWriter::insertCannotFail(std::string_view key, const ByteRange& value) noexcept {
    if (finished_ || !acceptsKey(key) || !value.isValid()) {
        SSTABLE_CRITICAL("Broken insertion contract: key of {} bytes after {} terms, range {}, finished={}",
                         key.size(), num_terms_, value.toString(), finished_);
        std::terminate();
    }
    append(key, value);
}

void SSTableWriter::append(std::string_view key, const ByteRange& value) {
    size_t shared = block_entries_ == 0 ? 0 : sharedPrefixLength(last_key_, key);
    size_t suffix_len = key.size() - shared;

    io::appendVarint(block_, shared);
    io::appendVarint(block_, suffix_len);
    block_.insert(block_.end(), key.begin() + shared, key.end());
    io::appendVarint(block_, value.start);
    io::appendVarint(block_, value.length());

    last_key_.assign(key.data(), key.size());
    ++num_terms_;
    ++block_entries_;

    if (block_.size() >= block_size_) {
        flushBlock();
    }
}

void SSTableWriter::flushBlock() {
    if (block_entries_ == 0) {
        return;
    }
    BlockMeta meta;
    meta.last_key = last_key_;
    meta.offset = output_.size();
    meta.length = block_.size();
    meta.first_ordinal = block_first_ordinal_;
    meta.num_entries = block_entries_;
    blocks_.push_back(std::move(meta));

    output_.insert(output_.end(), block_.begin(), block_.end());
    block_.clear();
    block_first_ordinal_ = num_terms_;
    block_entries_ = 0;
}

core::Result<std::vector<uint8_t>> SSTableWriter::finish() {
    COLSTORE_THROW_IF(finished_, core::OperationException,
                      "SSTable writer already finished", "finish");
    flushBlock();

    uint64_t index_offset = output_.size();
    io::appendVarint(output_, blocks_.size());
    for (const auto& block : blocks_) {
        io::appendVarint(output_, block.last_key.size());
        output_.insert(output_.end(), block.last_key.begin(), block.last_key.end());
        io::appendVarint(output_, block.offset);
        io::appendVarint(output_, block.length);
        io::appendVarint(output_, block.first_ordinal);
        io::appendVarint(output_, block.num_entries);
    }

    io::appendU64LE(output_, index_offset);
    io::appendU64LE(output_, num_terms_);
    io::appendU64LE(output_, core::Constants::kSSTableMagic);

    finished_ = true;
    SSTABLE_DEBUG("Finished SSTable: {} terms in {} blocks, {} bytes",
                  num_terms_, blocks_.size(), output_.size());
    blocks_.clear();
    return std::move(output_);
}

}} // namespace colstore::sstable

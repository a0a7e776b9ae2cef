#include "colstore/sstable/SSTableReader.hpp"
#include "colstore/core/Constants.hpp"
#include "colstore/io/BinaryUtils.hpp"
#include "colstore/utils/ModuleLoggers.hpp"
#include <algorithm>

namespace colstore {
namespace sstable {

namespace {

core::Error corrupted(const std::string& what) {
    SSTABLE_ERROR("Corrupted SSTable: {}", what);
    return core::makeError(core::ErrorCode::CorruptedData, "corrupted sstable: " + what);
}

// 前缀的字典序后继；全为0xFF时没有后继
std::optional<std::string> prefixSuccessor(std::string_view prefix) {
    std::string upper(prefix);
    while (!upper.empty()) {
        unsigned char last = static_cast<unsigned char>(upper.back());
        if (last != 0xFF) {
            upper.back() = static_cast<char>(last + 1);
            return upper;
        }
        upper.pop_back();
    }
    return std::nullopt;
}

} // namespace

core::Result<SSTableReader> SSTableReader::open(std::vector<uint8_t> data) {
    constexpr size_t footer_size = core::Constants::kSSTableFooterSize;
    if (data.size() < footer_size) {
        return corrupted("shorter than footer");
    }
    const uint8_t* footer = data.data() + data.size() - footer_size;
    uint64_t index_offset = io::readU64LE(footer);
    uint64_t num_terms = io::readU64LE(footer + 8);
    uint64_t magic = io::readU64LE(footer + 16);
    if (magic != core::Constants::kSSTableMagic) {
        return corrupted("bad magic");
    }
    uint64_t index_end = data.size() - footer_size;
    if (index_offset > index_end) {
        return corrupted("index offset past footer");
    }

    SSTableReader reader;
    const uint8_t* pos = data.data() + index_offset;
    const uint8_t* end = data.data() + index_end;

    uint64_t num_blocks = 0;
    if (!io::readVarint(pos, end, num_blocks)) {
        return corrupted("truncated block count");
    }
    uint64_t expected_offset = 0;
    uint64_t expected_ordinal = 0;
    for (uint64_t i = 0; i < num_blocks; ++i) {
        BlockMeta meta;
        uint64_t key_len = 0;
        if (!io::readVarint(pos, end, key_len) || key_len > static_cast<uint64_t>(end - pos)) {
            return corrupted("truncated block key");
        }
        meta.last_key.assign(reinterpret_cast<const char*>(pos), static_cast<size_t>(key_len));
        pos += key_len;
        if (!io::readVarint(pos, end, meta.offset) ||
            !io::readVarint(pos, end, meta.length) ||
            !io::readVarint(pos, end, meta.first_ordinal) ||
            !io::readVarint(pos, end, meta.num_entries)) {
            return corrupted("truncated block metadata");
        }
        // 块必须首尾相接、序号连续、键递增
        if (meta.offset != expected_offset || meta.length > index_offset - meta.offset ||
            meta.first_ordinal != expected_ordinal || meta.num_entries == 0) {
            return corrupted("inconsistent block layout");
        }
        if (!reader.blocks_.empty() && !(reader.blocks_.back().last_key < meta.last_key)) {
            return corrupted("block keys out of order");
        }
        expected_offset = meta.offset + meta.length;
        expected_ordinal = meta.first_ordinal + meta.num_entries;
        reader.blocks_.push_back(std::move(meta));
    }
    if (pos != end || expected_offset != index_offset || expected_ordinal != num_terms) {
        return corrupted("index does not cover data");
    }

    reader.num_terms_ = num_terms;
    reader.data_ = std::move(data);
    return reader;
}

size_t SSTableReader::firstCandidateBlock(std::string_view key) const {
    auto it = std::lower_bound(blocks_.begin(), blocks_.end(), key,
        [](const BlockMeta& block, std::string_view k) {
            return std::string_view(block.last_key) < k;
        });
    return static_cast<size_t>(it - blocks_.begin());
}

core::Result<std::vector<SSTableReader::Entry>> SSTableReader::decodeBlock(size_t block_index) const {
    const BlockMeta& meta = blocks_[block_index];
    const uint8_t* pos = data_.data() + meta.offset;
    const uint8_t* end = pos + meta.length;

    std::vector<Entry> entries;
    entries.reserve(static_cast<size_t>(meta.num_entries));
    std::string key;
    while (pos < end) {
        uint64_t shared = 0;
        uint64_t suffix_len = 0;
        if (!io::readVarint(pos, end, shared) || !io::readVarint(pos, end, suffix_len)) {
            return corrupted("truncated entry header");
        }
        if (shared > key.size() || suffix_len > static_cast<uint64_t>(end - pos)) {
            return corrupted("entry key out of bounds");
        }
        key.resize(static_cast<size_t>(shared));
        key.append(reinterpret_cast<const char*>(pos), static_cast<size_t>(suffix_len));
        pos += suffix_len;

        uint64_t start = 0;
        uint64_t length = 0;
        if (!io::readVarint(pos, end, start) || !io::readVarint(pos, end, length)) {
            return corrupted("truncated entry value");
        }
        if (length > UINT64_MAX - start) {
            return corrupted("range overflow");
        }
        if (!entries.empty() && !(entries.back().key < key)) {
            return corrupted("keys out of order");
        }
        entries.push_back(Entry{key, ByteRange(start, start + length)});
    }
    if (entries.size() != meta.num_entries || entries.back().key != meta.last_key) {
        return corrupted("block contents disagree with index");
    }
    return entries;
}

core::Result<std::optional<ByteRange>> SSTableReader::get(std::string_view key) const {
    size_t block_index = firstCandidateBlock(key);
    if (block_index == blocks_.size()) {
        return std::optional<ByteRange>();
    }
    auto entries = decodeBlock(block_index);
    if (!entries) {
        return std::move(entries).error();
    }
    for (const auto& entry : entries.value()) {
        if (entry.key == key) {
            return std::optional<ByteRange>(entry.value);
        }
    }
    return std::optional<ByteRange>();
}

core::Result<std::vector<SSTableReader::Entry>> SSTableReader::range(
        std::string_view lower, std::optional<std::string_view> upper) const {
    std::vector<Entry> result;
    for (size_t i = firstCandidateBlock(lower); i < blocks_.size(); ++i) {
        auto entries = decodeBlock(i);
        if (!entries) {
            return std::move(entries).error();
        }
        for (auto& entry : entries.value()) {
            if (std::string_view(entry.key) < lower) {
                continue;
            }
            if (upper && !(std::string_view(entry.key) < *upper)) {
                return result;
            }
            result.push_back(std::move(entry));
        }
    }
    return result;
}

core::Result<std::vector<SSTableReader::Entry>> SSTableReader::prefix(std::string_view prefix) const {
    std::optional<std::string> upper = prefixSuccessor(prefix);
    if (upper) {
        return range(prefix, std::string_view(*upper));
    }
    return range(prefix, std::nullopt);
}

}} // namespace colstore::sstable

#pragma once

#include "colstore/core/Expected.hpp"
#include "colstore/sstable/ByteRange.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace colstore {
namespace sstable {

/**
 * @brief SSTableWriter输出的只读视图
 *
 * open() 只解析尾部和块索引；数据块在查询时按需解码。
 */
class SSTableReader {
public:
    struct Entry {
        std::string key;
        ByteRange value;
    };

    /**
     * @brief 解析字典字节
     * @return 尾部、magic或块索引不合法时返回CorruptedData
     */
    static core::Result<SSTableReader> open(std::vector<uint8_t> data);

    /**
     * @brief 精确查找
     */
    core::Result<std::optional<ByteRange>> get(std::string_view key) const;

    /**
     * @brief 键在 [lower, upper) 内的全部条目，upper为空表示无上界
     */
    core::Result<std::vector<Entry>> range(std::string_view lower,
                                           std::optional<std::string_view> upper) const;

    /**
     * @brief 以prefix开头的全部条目
     */
    core::Result<std::vector<Entry>> prefix(std::string_view prefix) const;

    core::Result<std::vector<Entry>> entries() const { return range({}, std::nullopt); }

    uint64_t numTerms() const noexcept { return num_terms_; }
    size_t numBlocks() const noexcept { return blocks_.size(); }

private:
    struct BlockMeta {
        std::string last_key;
        uint64_t offset = 0;
        uint64_t length = 0;
        uint64_t first_ordinal = 0;
        uint64_t num_entries = 0;
    };

    SSTableReader() = default;

    size_t firstCandidateBlock(std::string_view key) const;
    core::Result<std::vector<Entry>> decodeBlock(size_t block_index) const;

    std::vector<uint8_t> data_;
    std::vector<BlockMeta> blocks_;
    uint64_t num_terms_ = 0;
};

}} // namespace colstore::sstable

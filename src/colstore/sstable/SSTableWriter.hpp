#pragma once

#include "colstore/core/Expected.hpp"
#include "colstore/core/Constants.hpp"
#include "colstore/sstable/ByteRange.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace colstore {
namespace sstable {

/**
 * @brief 有序字典构建器（键 -> ByteRange）
 *
 * 只接受严格递增的键（按字节字典序），一次遍历写出：
 * - 数据块：条目与前一键共享前缀，块内前缀压缩，每块重新开始
 * - 块索引：每块的最后一个键、偏移、长度、首序号、条目数
 * - 尾部：index_offset(u64 LE) + num_terms(u64 LE) + magic(u64 LE)
 *
 * finish() 之后构建器不可再用。
 */
class SSTableWriter {
public:
    explicit SSTableWriter(size_t block_size = core::Constants::kDefaultIndexBlockSize,
                           size_t initial_capacity = core::Constants::kDefaultIndexCapacity);

    SSTableWriter(const SSTableWriter&) = delete;
    SSTableWriter& operator=(const SSTableWriter&) = delete;
    SSTableWriter(SSTableWriter&&) = default;
    SSTableWriter& operator=(SSTableWriter&&) = default;

    /**
     * @brief 插入一个条目
     * @throws OperationException 键不大于上一个键、区间非法或已finish
     */
    void insert(std::string_view key, const ByteRange& value);

    /**
     * @brief 插入一个条目，调用方保证键严格递增
     *
     * 违反约定时记录CRITICAL日志并终止进程，不会返回错误。
     */
    void insertCannotFail(std::string_view key, const ByteRange& value) noexcept;

    /**
     * @brief 该键能否作为下一个插入的键
     */
    bool acceptsKey(std::string_view key) const noexcept;

    /**
     * @brief 写出剩余块、块索引与尾部，返回完整字节
     * @throws OperationException 重复调用时
     */
    core::Result<std::vector<uint8_t>> finish();

    uint64_t numTerms() const noexcept { return num_terms_; }
    bool isFinished() const noexcept { return finished_; }
    const std::string& lastKey() const noexcept { return last_key_; }

private:
    struct BlockMeta {
        std::string last_key;
        uint64_t offset = 0;
        uint64_t length = 0;
        uint64_t first_ordinal = 0;
        uint64_t num_entries = 0;
    };

    void append(std::string_view key, const ByteRange& value);
    void flushBlock();

    size_t block_size_;
    std::vector<uint8_t> output_;
    std::vector<uint8_t> block_;
    std::string last_key_;
    std::vector<BlockMeta> blocks_;
    uint64_t num_terms_ = 0;
    uint64_t block_first_ordinal_ = 0;
    uint64_t block_entries_ = 0;
    bool finished_ = false;
};

}} // namespace colstore::sstable

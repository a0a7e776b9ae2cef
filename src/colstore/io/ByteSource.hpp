#pragma once

#include "colstore/core/Expected.hpp"
#include "colstore/utils/FileWrapper.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace colstore {
namespace io {

/**
 * @brief 该偏移能否用于文件定位（受平台off_t宽度限制）
 */
bool isSeekableOffset(uint64_t offset) noexcept;

/**
 * @brief 随机访问的只读字节源
 */
class IByteSource {
public:
    virtual ~IByteSource() = default;

    virtual uint64_t size() const = 0;

    /**
     * @brief 读取 [offset, offset + length)
     * @return 恰好length字节，越界或读取失败返回错误
     */
    virtual core::Result<std::vector<uint8_t>> readAt(uint64_t offset, size_t length) = 0;
};

/**
 * @brief 内存字节源
 */
class MemorySource : public IByteSource {
public:
    explicit MemorySource(std::vector<uint8_t> data) : data_(std::move(data)) {}

    uint64_t size() const override { return data_.size(); }
    core::Result<std::vector<uint8_t>> readAt(uint64_t offset, size_t length) override;

private:
    std::vector<uint8_t> data_;
};

/**
 * @brief 文件字节源，按需定位读取
 */
class FileSource : public IByteSource {
public:
    /**
     * @throws FileException 文件无法打开时
     */
    explicit FileSource(const std::string& path);

    uint64_t size() const override { return size_; }
    core::Result<std::vector<uint8_t>> readAt(uint64_t offset, size_t length) override;

private:
    std::string path_;
    utils::FileWrapper file_;
    uint64_t size_ = 0;
};

}} // namespace colstore::io

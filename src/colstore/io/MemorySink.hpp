#pragma once

#include "colstore/io/ByteSink.hpp"
#include <vector>

namespace colstore {
namespace io {

/**
 * @brief 内存字节流，数据追加到内部缓冲
 */
class MemorySink : public IByteSink {
public:
    MemorySink() = default;
    explicit MemorySink(size_t reserve) { buffer_.reserve(reserve); }

    core::Result<size_t> write(const uint8_t* data, size_t size) override;
    core::VoidResult flush() override { return {}; }
    std::string getTypeName() const override { return "MemorySink"; }

    const std::vector<uint8_t>& data() const { return buffer_; }
    size_t size() const { return buffer_.size(); }

    /**
     * @brief 取走缓冲内容，之后缓冲为空
     */
    std::vector<uint8_t> take() { return std::move(buffer_); }

private:
    std::vector<uint8_t> buffer_;
};

}} // namespace colstore::io

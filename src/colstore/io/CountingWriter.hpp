#pragma once

#include "colstore/io/ByteSink.hpp"
#include <memory>

namespace colstore {
namespace io {

/**
 * @brief 带字节计数的写入包装器
 *
 * 拥有底层字节流，只累计底层确认写入的字节数。
 * writtenBytes() 即当前绝对写入偏移。
 */
class CountingWriter : public IByteSink {
public:
    explicit CountingWriter(std::unique_ptr<IByteSink> inner);

    core::Result<size_t> write(const uint8_t* data, size_t size) override;
    core::VoidResult flush() override;
    std::string getTypeName() const override;

    uint64_t writtenBytes() const noexcept { return written_bytes_; }

    IByteSink& inner() { return *inner_; }
    const IByteSink& inner() const { return *inner_; }

private:
    std::unique_ptr<IByteSink> inner_;
    uint64_t written_bytes_ = 0;
};

}} // namespace colstore::io

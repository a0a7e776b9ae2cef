#pragma once

#include "colstore/core/Expected.hpp"
#include <cstdint>
#include <cstddef>
#include <string>

namespace colstore {
namespace io {

/**
 * @brief 可写字节流接口
 *
 * 段写入器只依赖这个接口，底层可以是内存缓冲、文件或网络连接。
 * write 可以只写入部分数据，返回实际写入的字节数；writeAll 循环直到写完。
 */
class IByteSink {
public:
    virtual ~IByteSink() = default;

    /**
     * @brief 写入数据
     * @return 实际写入的字节数，或I/O错误
     */
    virtual core::Result<size_t> write(const uint8_t* data, size_t size) = 0;

    /**
     * @brief 刷新底层缓冲
     */
    virtual core::VoidResult flush() = 0;

    /**
     * @brief 获取写入器类型名称（用于日志）
     */
    virtual std::string getTypeName() const = 0;

    /**
     * @brief 写入全部数据；底层返回0字节视为I/O错误
     */
    core::VoidResult writeAll(const uint8_t* data, size_t size);
};

}} // namespace colstore::io

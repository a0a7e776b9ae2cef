#pragma once

#include "colstore/io/ByteSink.hpp"
#include "colstore/utils/FileWrapper.hpp"
#include <string>

namespace colstore {
namespace io {

/**
 * @brief 文件字节流
 *
 * 构造时以"wb"打开（失败抛出FileException），析构时关闭。
 * 需要确认落盘结果时显式调用close()。
 */
class FileSink : public IByteSink {
public:
    explicit FileSink(const std::string& path);
    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    core::Result<size_t> write(const uint8_t* data, size_t size) override;
    core::VoidResult flush() override;
    std::string getTypeName() const override { return "FileSink"; }

    /**
     * @brief 刷新并关闭文件
     */
    core::VoidResult close();

    bool isOpen() const { return static_cast<bool>(file_); }
    const std::string& path() const { return path_; }

private:
    std::string path_;
    utils::FileWrapper file_;
};

}} // namespace colstore::io

/**
 * @file FileWrapper.hpp
 * @brief RAII文件句柄包装器
 */

#pragma once

#include <memory>
#include <cstdio>
#include <string>
#include "colstore/core/Exception.hpp"

namespace colstore {
namespace utils {

/**
 * @brief RAII文件句柄包装器，析构时自动关闭
 */
class FileWrapper {
public:
    /**
     * @brief 打开文件
     * @param filename 文件名
     * @param mode fopen模式（"rb" / "wb" / "ab"）
     * @throws FileException 文件打开失败时
     */
    FileWrapper(const std::string& filename, const char* mode)
        : file_(std::fopen(filename.c_str(), mode), &std::fclose) {
        if (!file_) {
            throw core::FileException(
                "Failed to open file",
                filename,
                (mode && mode[0] == 'r') ? core::ErrorCode::FileNotFound
                                         : core::ErrorCode::FileWriteError,
                __FILE__, __LINE__
            );
        }
    }

    FileWrapper(FileWrapper&& other) noexcept = default;
    FileWrapper& operator=(FileWrapper&& other) noexcept = default;

    FileWrapper(const FileWrapper&) = delete;
    FileWrapper& operator=(const FileWrapper&) = delete;

    FILE* get() const noexcept {
        return file_.get();
    }

    explicit operator bool() const noexcept {
        return file_ != nullptr;
    }

    /**
     * @brief 关闭文件并返回fclose结果（0表示成功）
     */
    int close() noexcept {
        if (!file_) {
            return 0;
        }
        return std::fclose(file_.release());
    }

private:
    std::unique_ptr<FILE, int(*)(FILE*)> file_;
};

} // namespace utils
} // namespace colstore

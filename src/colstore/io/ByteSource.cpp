#include "colstore/io/ByteSource.hpp"
#include "colstore/utils/ModuleLoggers.hpp"
#include <cstdio>
#include <filesystem>
#include <limits>
#include <fmt/format.h>
#include <sys/types.h>

namespace colstore {
namespace io {

namespace {

core::Error outOfBounds(uint64_t offset, size_t length, uint64_t size) {
    return core::makeError(core::ErrorCode::InvalidArgument,
                           fmt::format("read [{}, +{}) out of bounds (size {})", offset, length, size));
}

#ifdef _WIN32
using SeekOffset = __int64;
#else
using SeekOffset = off_t;
#endif

int seekTo(FILE* file, uint64_t offset) {
#ifdef _WIN32
    return _fseeki64(file, static_cast<SeekOffset>(offset), SEEK_SET);
#else
    return fseeko(file, static_cast<SeekOffset>(offset), SEEK_SET);
#endif
}

} // namespace

bool isSeekableOffset(uint64_t offset) noexcept {
    return offset <= static_cast<uint64_t>(std::numeric_limits<SeekOffset>::max());
}

core::Result<std::vector<uint8_t>> MemorySource::readAt(uint64_t offset, size_t length) {
    if (offset > data_.size() || length > data_.size() - offset) {
        return outOfBounds(offset, length, data_.size());
    }
    auto begin = data_.begin() + static_cast<std::ptrdiff_t>(offset);
    return std::vector<uint8_t>(begin, begin + static_cast<std::ptrdiff_t>(length));
}

FileSource::FileSource(const std::string& path)
    : path_(path), file_(path, "rb") {
    std::error_code ec;
    size_ = std::filesystem::file_size(path_, ec);
    if (ec) {
        throw core::FileException("Failed to stat file: " + ec.message(), path_,
                                  core::ErrorCode::FileReadError, __FILE__, __LINE__);
    }
    IO_DEBUG("Opened file source: {} ({} bytes)", path_, size_);
}

core::Result<std::vector<uint8_t>> FileSource::readAt(uint64_t offset, size_t length) {
    if (offset > size_ || length > size_ - offset) {
        return outOfBounds(offset, length, size_);
    }
    std::vector<uint8_t> buffer(length);
    if (length == 0) {
        return buffer;
    }
    if (!isSeekableOffset(offset)) {
        IO_ERROR("Offset {} in {} exceeds the platform seek range", offset, path_);
        return core::makeError(core::ErrorCode::FileReadError, "offset exceeds seek range", path_);
    }
    if (seekTo(file_.get(), offset) != 0) {
        IO_ERROR("Seek to {} in {} failed", offset, path_);
        return core::makeError(core::ErrorCode::FileReadError, "seek failed", path_);
    }
    size_t read = std::fread(buffer.data(), 1, length, file_.get());
    if (read != length) {
        IO_ERROR("Short read from {}: {} of {} bytes at offset {}", path_, read, length, offset);
        return core::makeError(core::ErrorCode::FileReadError, "short read", path_);
    }
    return buffer;
}

}} // namespace colstore::io

#include "colstore/io/FileSink.hpp"
#include "colstore/utils/ModuleLoggers.hpp"
#include <cerrno>
#include <cstring>

namespace colstore {
namespace io {

FileSink::FileSink(const std::string& path)
    : path_(path), file_(path, "wb") {
    IO_DEBUG("Opened file sink: {}", path_);
}

FileSink::~FileSink() {
    if (file_ && file_.close() != 0) {
        IO_WARN("Failed to close file sink {} on destruction", path_);
    }
}

core::Result<size_t> FileSink::write(const uint8_t* data, size_t size) {
    if (!file_) {
        return core::makeError(core::ErrorCode::IoError, "file sink is closed", path_);
    }
    if (size == 0) {
        return size_t{0};
    }
    size_t written = std::fwrite(data, 1, size, file_.get());
    if (written < size && std::ferror(file_.get())) {
        std::string reason = std::strerror(errno);
        IO_ERROR("Write to {} failed after {} of {} bytes: {}", path_, written, size, reason);
        return core::makeError(core::ErrorCode::IoError,
                               "write failed: " + reason, path_);
    }
    return written;
}

core::VoidResult FileSink::flush() {
    if (!file_) {
        return core::makeError(core::ErrorCode::IoError, "file sink is closed", path_);
    }
    if (std::fflush(file_.get()) != 0) {
        std::string reason = std::strerror(errno);
        IO_ERROR("Flush of {} failed: {}", path_, reason);
        return core::makeError(core::ErrorCode::IoError, "flush failed: " + reason, path_);
    }
    return {};
}

core::VoidResult FileSink::close() {
    if (!file_) {
        return {};
    }
    if (file_.close() != 0) {
        std::string reason = std::strerror(errno);
        IO_ERROR("Close of {} failed: {}", path_, reason);
        return core::makeError(core::ErrorCode::IoError, "close failed: " + reason, path_);
    }
    IO_DEBUG("Closed file sink: {}", path_);
    return {};
}

}} // namespace colstore::io

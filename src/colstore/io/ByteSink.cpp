#include "colstore/io/ByteSink.hpp"

namespace colstore {
namespace io {

core::VoidResult IByteSink::writeAll(const uint8_t* data, size_t size) {
    size_t written = 0;
    while (written < size) {
        auto result = write(data + written, size - written);
        if (!result) {
            return std::move(result).error();
        }
        if (result.value() == 0) {
            return core::makeError(core::ErrorCode::IoError,
                                   "failed to write whole buffer", getTypeName());
        }
        written += result.value();
    }
    return {};
}

}} // namespace colstore::io

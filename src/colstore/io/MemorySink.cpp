#include "colstore/io/MemorySink.hpp"

namespace colstore {
namespace io {

core::Result<size_t> MemorySink::write(const uint8_t* data, size_t size) {
    if (size > 0) {
        buffer_.insert(buffer_.end(), data, data + size);
    }
    return size;
}

}} // namespace colstore::io

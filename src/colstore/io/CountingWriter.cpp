#include "colstore/io/CountingWriter.hpp"
#include "colstore/core/Exception.hpp"

namespace colstore {
namespace io {

CountingWriter::CountingWriter(std::unique_ptr<IByteSink> inner)
    : inner_(std::move(inner)) {
    COLSTORE_THROW_IF(!inner_, core::ParameterException, "Byte sink cannot be null", "inner");
}

core::Result<size_t> CountingWriter::write(const uint8_t* data, size_t size) {
    auto result = inner_->write(data, size);
    if (result) {
        written_bytes_ += result.value();
    }
    return result;
}

core::VoidResult CountingWriter::flush() {
    return inner_->flush();
}

std::string CountingWriter::getTypeName() const {
    return "CountingWriter<" + inner_->getTypeName() + ">";
}

}} // namespace colstore::io

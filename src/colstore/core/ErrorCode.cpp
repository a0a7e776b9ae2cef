#include "colstore/core/ErrorCode.hpp"

namespace colstore {
namespace core {

Error::Error(ErrorCode c) : code(c), message(toString(c)) {}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:
            return "Success";

        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::InvalidState:
            return "Invalid state";
        case ErrorCode::InternalError:
            return "Internal error";

        case ErrorCode::IoError:
            return "I/O error";
        case ErrorCode::FileNotFound:
            return "File not found";
        case ErrorCode::FileWriteError:
            return "File write error";
        case ErrorCode::FileReadError:
            return "File read error";

        case ErrorCode::CorruptedData:
            return "Corrupted data";
        case ErrorCode::KeyOrderViolation:
            return "Key order violation";

        case ErrorCode::NotImplemented:
            return "Feature not implemented";

        default:
            return "Unknown error";
    }
}

}} // namespace colstore::core

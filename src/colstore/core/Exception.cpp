/**
 * @file Exception.cpp
 * @brief colstore异常类实现
 */

#include "Exception.hpp"
#include "colstore/utils/ModuleLoggers.hpp"
#include <sstream>
#include <fmt/format.h>

namespace colstore {
namespace core {

// ColstoreException 实现
ColstoreException::ColstoreException(const std::string& message,
                                     ErrorCode code,
                                     const char* file,
                                     int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string ColstoreException::getErrorCodeString() const {
    switch (error_code_) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::InternalError: return "InternalError";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::FileNotFound: return "FileNotFound";
        case ErrorCode::FileWriteError: return "FileWriteError";
        case ErrorCode::FileReadError: return "FileReadError";
        case ErrorCode::CorruptedData: return "CorruptedData";
        case ErrorCode::KeyOrderViolation: return "KeyOrderViolation";
        case ErrorCode::NotImplemented: return "NotImplemented";
        default: return "Unknown";
    }
}

std::string ColstoreException::getDetailedMessage() const {
    std::ostringstream oss;
    oss << "[" << getErrorCodeString() << "] " << what();

    if (file_ && line_ > 0) {
        oss << " (at " << file_ << ":" << line_ << ")";
    }

    if (!context_.empty()) {
        oss << "\nContext:";
        for (const auto& ctx : context_) {
            oss << "\n  - " << ctx;
        }
    }

    return oss.str();
}

void ColstoreException::addContext(const std::string& context) {
    context_.push_back(context);
}

// FileException 实现
FileException::FileException(const std::string& message, const std::string& filename,
                             ErrorCode code, const char* file, int line)
    : ColstoreException(fmt::format("{} (file: {})", message, filename), code, file, line)
    , filename_(filename) {
}

// FormatException 实现
FormatException::FormatException(const std::string& message, ErrorCode code,
                                 const char* file, int line)
    : ColstoreException(message, code, file, line) {
}

// ParameterException 实现
ParameterException::ParameterException(const std::string& message,
                                       const std::string& parameter_name,
                                       const char* file, int line)
    : ColstoreException(parameter_name.empty()
                            ? message
                            : fmt::format("{} (parameter: {})", message, parameter_name),
                        ErrorCode::InvalidArgument, file, line)
    , parameter_name_(parameter_name) {
}

// OperationException 实现
OperationException::OperationException(const std::string& message,
                                       const std::string& operation,
                                       const char* file, int line,
                                       ErrorCode code)
    : ColstoreException(operation.empty()
                            ? message
                            : fmt::format("{} (operation: {})", message, operation),
                        code, file, line)
    , operation_(operation) {
}

void throwError(const Error& error) {
    CORE_DEBUG("Raising {} as exception: {}", toString(error.code), error.fullMessage());
    switch (error.code) {
        case ErrorCode::InvalidArgument:
            throw ParameterException(error.fullMessage());
        case ErrorCode::InvalidState:
        case ErrorCode::KeyOrderViolation:
            throw OperationException(error.fullMessage(), "", nullptr, 0, error.code);
        case ErrorCode::FileNotFound:
        case ErrorCode::FileWriteError:
        case ErrorCode::FileReadError:
            throw FileException(error.message, error.context, error.code);
        case ErrorCode::CorruptedData:
            throw FormatException(error.fullMessage(), error.code);
        default:
            throw ColstoreException(error.fullMessage(), error.code);
    }
}

}} // namespace colstore::core

#pragma once

#include <cstdint>
#include <string>
#include <fmt/format.h>

namespace colstore {
namespace core {

/**
 * @brief colstore统一错误码
 *
 * 底层I/O与解码路径使用错误码返回（Expected/Result），
 * 调用方的编程错误使用异常（见Exception.hpp）。
 */
enum class ErrorCode : uint8_t {
    Ok = 0,

    // 通用错误 (1-19)
    InvalidArgument = 1,
    InvalidState = 2,
    InternalError = 3,

    // I/O错误 (20-39)
    IoError = 20,
    FileNotFound = 21,
    FileWriteError = 22,
    FileReadError = 23,

    // 格式错误 (40-59)
    CorruptedData = 40,
    KeyOrderViolation = 41,

    NotImplemented = 80
};

/**
 * @brief 错误信息结构
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;

    Error() : code(ErrorCode::Ok) {}

    explicit Error(ErrorCode c);

    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}

    Error(ErrorCode c, const std::string& msg, const std::string& ctx)
        : code(c), message(msg), context(ctx) {}

    bool isOk() const noexcept { return code == ErrorCode::Ok; }
    bool isError() const noexcept { return code != ErrorCode::Ok; }

    operator bool() const noexcept { return isError(); }

    std::string fullMessage() const {
        if (context.empty()) {
            return message;
        }
        return fmt::format("{} (Context: {})", message, context);
    }
};

const char* toString(ErrorCode code) noexcept;

inline Error makeError(ErrorCode code) {
    return Error(code);
}

inline Error makeError(ErrorCode code, const std::string& message) {
    return Error(code, message);
}

inline Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    return Error(code, message, context);
}

inline Error success() {
    return Error(ErrorCode::Ok);
}

/**
 * @brief 将Error转换为对应的异常并抛出（实现在Exception.cpp）
 */
[[noreturn]] void throwError(const Error& error);

}} // namespace colstore::core

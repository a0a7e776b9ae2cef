/**
 * @file Exception.hpp
 * @brief colstore异常类定义
 *
 * 异常只用于调用方的编程错误（参数非法、状态误用、键顺序错误），
 * 可恢复的I/O错误通过Result/VoidResult返回。
 */

#ifndef COLSTORE_EXCEPTION_HPP
#define COLSTORE_EXCEPTION_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include "ErrorCode.hpp"

namespace colstore {
namespace core {

/**
 * @brief colstore基础异常类
 */
class ColstoreException : public std::runtime_error {
public:
    /**
     * @brief 构造函数
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的文件名
     * @param line 发生错误的行号
     */
    ColstoreException(const std::string& message,
                      ErrorCode code = ErrorCode::InternalError,
                      const char* file = nullptr,
                      int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }

    std::string getErrorCodeString() const;

    /**
     * @brief 获取详细错误信息（错误码、位置、上下文）
     */
    std::string getDetailedMessage() const;

    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

    void addContext(const std::string& context);
    const std::vector<std::string>& getContext() const { return context_; }

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
    std::vector<std::string> context_;
};

/**
 * @brief 文件相关异常
 */
class FileException : public ColstoreException {
public:
    FileException(const std::string& message, const std::string& filename,
                  ErrorCode code = ErrorCode::FileNotFound,
                  const char* file = nullptr, int line = 0);

    const std::string& getFilename() const { return filename_; }

private:
    std::string filename_;
};

/**
 * @brief 数据格式相关异常
 */
class FormatException : public ColstoreException {
public:
    FormatException(const std::string& message,
                    ErrorCode code = ErrorCode::CorruptedData,
                    const char* file = nullptr, int line = 0);
};

/**
 * @brief 参数相关异常
 */
class ParameterException : public ColstoreException {
public:
    ParameterException(const std::string& message,
                       const std::string& parameter_name = "",
                       const char* file = nullptr, int line = 0);

    const std::string& getParameterName() const { return parameter_name_; }

private:
    std::string parameter_name_;
};

/**
 * @brief 操作相关异常（对象状态不允许该操作）
 */
class OperationException : public ColstoreException {
public:
    OperationException(const std::string& message,
                       const std::string& operation = "",
                       const char* file = nullptr, int line = 0,
                       ErrorCode code = ErrorCode::InvalidState);

    const std::string& getOperation() const { return operation_; }

private:
    std::string operation_;
};

} // namespace core
} // namespace colstore

// 便捷宏定义
// subject: ParameterException的参数名 / OperationException的操作名
#define COLSTORE_THROW(ExceptionType, message, subject) \
    throw ExceptionType(message, subject, __FILE__, __LINE__)

#define COLSTORE_THROW_IF(condition, ExceptionType, message, subject) \
    do { if (condition) { COLSTORE_THROW(ExceptionType, message, subject); } } while(0)

#endif // COLSTORE_EXCEPTION_HPP

#pragma once

#include <cstdint>
#include <string>
#include <fmt/format.h>

namespace fastdocx {
namespace core {

/**
 * @brief FastDocx统一错误码
 *
 * 底层查找使用错误码返回（Expected），面向调用者的语义错误使用异常。
 */
enum class ErrorCode : uint8_t {
    // 成功
    Ok = 0,

    // 通用错误 (1-19)
    InvalidArgument = 1,
    InternalError = 3,

    // 文件操作错误 (20-39)
    FileNotFound = 20,
    FileWriteError = 23,
    FileReadError = 24,

    // 包结构错误 (40-59)
    InvalidPackage = 40,
    PartNotFound = 41,
    RelationshipNotFound = 42,
    InvalidPartName = 43,

    // 样式错误 (60-69)
    StyleNotFound = 60,
    WrongStyleType = 61,

    // ZIP/XML处理错误 (70-89)
    ZipError = 70,
    XmlParseError = 71,
    XmlMissingElement = 72,

    // 功能实现状态
    NotImplemented = 90
};

/**
 * @brief 错误信息结构
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;  // 额外上下文信息

    Error() : code(ErrorCode::Ok) {}

    explicit Error(ErrorCode c);

    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}

    Error(ErrorCode c, const std::string& msg, const std::string& ctx)
        : code(c), message(msg), context(ctx) {}

    bool isOk() const noexcept { return code == ErrorCode::Ok; }
    bool isError() const noexcept { return code != ErrorCode::Ok; }

    std::string fullMessage() const {
        if (context.empty()) {
            return message;
        }
        return fmt::format("{} (Context: {})", message, context);
    }
};

/**
 * @brief 错误码转字符串
 */
const char* toString(ErrorCode code) noexcept;

inline Error makeError(ErrorCode code, const std::string& message) {
    return Error(code, message);
}

inline Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    return Error(code, message, context);
}

/**
 * @brief 将 Error 转为对应的异常抛出（定义见 Exception.cpp）
 */
[[noreturn]] void throwError(const Error& error);

}} // namespace fastdocx::core

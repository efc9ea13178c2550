/**
 * @file Exception.hpp
 * @brief FastDocx异常类定义
 */

#ifndef FASTDOCX_EXCEPTION_HPP
#define FASTDOCX_EXCEPTION_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include "ErrorCode.hpp"

namespace fastdocx {
namespace core {

/**
 * @brief FastDocx基础异常类
 */
class FastDocxException : public std::runtime_error {
public:
    /**
     * @brief 构造函数
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的文件名
     * @param line 发生错误的行号
     */
    FastDocxException(const std::string& message,
                      ErrorCode code = ErrorCode::InternalError,
                      const char* file = nullptr,
                      int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }

    std::string getErrorCodeString() const { return toString(error_code_); }

    /**
     * @brief 获取详细错误信息（含位置与上下文）
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
class FileException : public FastDocxException {
public:
    FileException(const std::string& message, const std::string& filename,
                  ErrorCode code = ErrorCode::FileNotFound,
                  const char* file = nullptr, int line = 0);

    const std::string& getFilename() const { return filename_; }

private:
    std::string filename_;
};

/**
 * @brief 参数相关异常
 */
class ParameterException : public FastDocxException {
public:
    ParameterException(const std::string& message,
                       const std::string& parameter_name = "",
                       const char* file = nullptr, int line = 0);

    const std::string& getParameterName() const { return parameter_name_; }

private:
    std::string parameter_name_;
};

/**
 * @brief 操作相关异常
 */
class OperationException : public FastDocxException {
public:
    OperationException(const std::string& message,
                       const std::string& operation = "",
                       ErrorCode code = ErrorCode::InvalidArgument,
                       const char* file = nullptr, int line = 0);

    const std::string& getOperation() const { return operation_; }

private:
    std::string operation_;
};

/**
 * @brief XML解析异常
 */
class XMLException : public FastDocxException {
public:
    XMLException(const std::string& message,
                 const std::string& xml_path = "",
                 int xml_line = -1,
                 const char* file = nullptr, int line = 0);

    const std::string& getXMLPath() const { return xml_path_; }
    int getXMLLine() const { return xml_line_; }

private:
    std::string xml_path_;
    int xml_line_;
};

/**
 * @brief 包结构异常（部件缺失、关系不一致等）
 */
class PackageException : public FastDocxException {
public:
    PackageException(const std::string& message,
                     const std::string& partname = "",
                     ErrorCode code = ErrorCode::InvalidPackage,
                     const char* file = nullptr, int line = 0);

    const std::string& getPartname() const { return partname_; }

private:
    std::string partname_;
};

/**
 * @brief 样式解析异常基类
 */
class StyleException : public FastDocxException {
public:
    StyleException(const std::string& message,
                   const std::string& style_ref,
                   ErrorCode code,
                   const char* file = nullptr, int line = 0);

    const std::string& getStyleRef() const { return style_ref_; }

private:
    std::string style_ref_;
};

/**
 * @brief 文档中不存在该样式
 */
class StyleNotFoundException : public StyleException {
public:
    explicit StyleNotFoundException(const std::string& style_ref,
                                    const char* file = nullptr, int line = 0);
};

/**
 * @brief 样式存在，但类型与请求不符
 */
class WrongStyleTypeException : public StyleException {
public:
    WrongStyleTypeException(const std::string& style_ref,
                            const std::string& expected_type,
                            const std::string& actual_type,
                            const char* file = nullptr, int line = 0);

    const std::string& getExpectedType() const { return expected_type_; }
    const std::string& getActualType() const { return actual_type_; }

private:
    std::string expected_type_;
    std::string actual_type_;
};

} // namespace core
} // namespace fastdocx

// 便捷宏定义
// 异常构造参数在前，自动追加 __FILE__/__LINE__
#define FASTDOCX_THROW(ExceptionType, ...) \
    throw ExceptionType(__VA_ARGS__, __FILE__, __LINE__)

#define FASTDOCX_THROW_IF(condition, ExceptionType, ...) \
    do { if (condition) { FASTDOCX_THROW(ExceptionType, __VA_ARGS__); } } while(0)

#endif // FASTDOCX_EXCEPTION_HPP

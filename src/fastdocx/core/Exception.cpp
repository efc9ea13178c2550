/**
 * @file Exception.cpp
 * @brief FastDocx异常类实现
 */

#include "Exception.hpp"
#include <fmt/format.h>

namespace fastdocx {
namespace core {

FastDocxException::FastDocxException(const std::string& message,
                                     ErrorCode code,
                                     const char* file,
                                     int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string FastDocxException::getDetailedMessage() const {
    std::string result = fmt::format("[{}] {}", getErrorCodeString(), what());

    if (file_ && line_ > 0) {
        result += fmt::format(" (at {}:{})", file_, line_);
    }

    if (!context_.empty()) {
        result += "\nContext:";
        for (const auto& ctx : context_) {
            result += fmt::format("\n  - {}", ctx);
        }
    }

    return result;
}

void FastDocxException::addContext(const std::string& context) {
    context_.push_back(context);
}

FileException::FileException(const std::string& message, const std::string& filename,
                             ErrorCode code, const char* file, int line)
    : FastDocxException(fmt::format("{} (file: {})", message, filename), code, file, line)
    , filename_(filename) {
}

ParameterException::ParameterException(const std::string& message,
                                       const std::string& parameter_name,
                                       const char* file, int line)
    : FastDocxException(fmt::format("{} (parameter: {})", message, parameter_name),
                        ErrorCode::InvalidArgument, file, line)
    , parameter_name_(parameter_name) {
}

OperationException::OperationException(const std::string& message,
                                       const std::string& operation,
                                       ErrorCode code, const char* file, int line)
    : FastDocxException(fmt::format("{} (operation: {})", message, operation), code, file, line)
    , operation_(operation) {
}

XMLException::XMLException(const std::string& message,
                           const std::string& xml_path,
                           int xml_line,
                           const char* file, int line)
    : FastDocxException(xml_line >= 0
                            ? fmt::format("{} (xml: {}, line {})", message, xml_path, xml_line)
                            : fmt::format("{} (xml: {})", message, xml_path),
                        ErrorCode::XmlParseError, file, line)
    , xml_path_(xml_path)
    , xml_line_(xml_line) {
}

PackageException::PackageException(const std::string& message,
                                   const std::string& partname,
                                   ErrorCode code, const char* file, int line)
    : FastDocxException(partname.empty() ? message : fmt::format("{} (part: {})", message, partname),
                        code, file, line)
    , partname_(partname) {
}

StyleException::StyleException(const std::string& message,
                               const std::string& style_ref,
                               ErrorCode code,
                               const char* file, int line)
    : FastDocxException(message, code, file, line)
    , style_ref_(style_ref) {
}

StyleNotFoundException::StyleNotFoundException(const std::string& style_ref,
                                               const char* file, int line)
    : StyleException(fmt::format("no style with name '{}'", style_ref),
                     style_ref, ErrorCode::StyleNotFound, file, line) {
}

WrongStyleTypeException::WrongStyleTypeException(const std::string& style_ref,
                                                 const std::string& expected_type,
                                                 const std::string& actual_type,
                                                 const char* file, int line)
    : StyleException(fmt::format("style '{}' is of type '{}', expected '{}'",
                                 style_ref, actual_type, expected_type),
                     style_ref, ErrorCode::WrongStyleType, file, line)
    , expected_type_(expected_type)
    , actual_type_(actual_type) {
}

void throwError(const Error& error) {
    switch (error.code) {
        case ErrorCode::FileNotFound:
        case ErrorCode::FileReadError:
        case ErrorCode::FileWriteError:
            throw FileException(error.message, error.context, error.code);
        case ErrorCode::InvalidArgument:
            throw ParameterException(error.message, error.context);
        case ErrorCode::InvalidPackage:
        case ErrorCode::PartNotFound:
        case ErrorCode::RelationshipNotFound:
        case ErrorCode::InvalidPartName:
            throw PackageException(error.message, error.context, error.code);
        case ErrorCode::StyleNotFound:
            throw StyleNotFoundException(error.context.empty() ? error.message : error.context);
        default:
            throw FastDocxException(error.fullMessage(), error.code);
    }
}

}} // namespace fastdocx::core

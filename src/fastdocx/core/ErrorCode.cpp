#include "fastdocx/core/ErrorCode.hpp"

namespace fastdocx {
namespace core {

Error::Error(ErrorCode c) : code(c), message(toString(c)) {}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:                   return "Success";
        case ErrorCode::InvalidArgument:      return "Invalid argument";
        case ErrorCode::InternalError:        return "Internal error";
        case ErrorCode::FileNotFound:         return "File not found";
        case ErrorCode::FileWriteError:       return "File write error";
        case ErrorCode::FileReadError:        return "File read error";
        case ErrorCode::InvalidPackage:       return "Invalid package";
        case ErrorCode::PartNotFound:         return "Part not found";
        case ErrorCode::RelationshipNotFound: return "Relationship not found";
        case ErrorCode::InvalidPartName:      return "Invalid part name";
        case ErrorCode::StyleNotFound:        return "Style not found";
        case ErrorCode::WrongStyleType:       return "Wrong style type";
        case ErrorCode::ZipError:             return "ZIP error";
        case ErrorCode::XmlParseError:        return "XML parse error";
        case ErrorCode::XmlMissingElement:    return "Missing XML element";
        case ErrorCode::NotImplemented:       return "Feature not implemented";
        default:                              return "Unknown error";
    }
}

}} // namespace fastdocx::core

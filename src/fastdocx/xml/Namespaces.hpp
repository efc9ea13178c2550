#pragma once

namespace fastdocx {
namespace xml {
namespace ns {

// WordprocessingML
constexpr const char* kW = "http://schemas.openxmlformats.org/wordprocessingml/2006/main";
constexpr const char* kR = "http://schemas.openxmlformats.org/officeDocument/2006/relationships";
constexpr const char* kWp = "http://schemas.openxmlformats.org/drawingml/2006/wordprocessingDrawing";
constexpr const char* kA = "http://schemas.openxmlformats.org/drawingml/2006/main";
constexpr const char* kPic = "http://schemas.openxmlformats.org/drawingml/2006/picture";
constexpr const char* kMc = "http://schemas.openxmlformats.org/markup-compatibility/2006";
constexpr const char* kW14 = "http://schemas.microsoft.com/office/word/2010/wordml";

// 核心属性
constexpr const char* kCp = "http://schemas.openxmlformats.org/package/2006/metadata/core-properties";
constexpr const char* kDc = "http://purl.org/dc/elements/1.1/";
constexpr const char* kDcTerms = "http://purl.org/dc/terms/";
constexpr const char* kDcmiType = "http://purl.org/dc/dcmitype/";
constexpr const char* kXsi = "http://www.w3.org/2001/XMLSchema-instance";

// 包结构
constexpr const char* kPackageRelationships = "http://schemas.openxmlformats.org/package/2006/relationships";
constexpr const char* kContentTypes = "http://schemas.openxmlformats.org/package/2006/content-types";

}}} // namespace fastdocx::xml::ns

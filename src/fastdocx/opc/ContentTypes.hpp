#pragma once

#include <string>
#include <vector>

namespace fastdocx {
namespace opc {

class Part;

namespace ct {

constexpr const char* kRelationships = "application/vnd.openxmlformats-package.relationships+xml";
constexpr const char* kXml = "application/xml";
constexpr const char* kCoreProperties = "application/vnd.openxmlformats-package.core-properties+xml";
constexpr const char* kWmlDocumentMain = "application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml";
constexpr const char* kWmlFooter = "application/vnd.openxmlformats-officedocument.wordprocessingml.footer+xml";
constexpr const char* kWmlHeader = "application/vnd.openxmlformats-officedocument.wordprocessingml.header+xml";
constexpr const char* kWmlStyles = "application/vnd.openxmlformats-officedocument.wordprocessingml.styles+xml";
constexpr const char* kWmlNumbering = "application/vnd.openxmlformats-officedocument.wordprocessingml.numbering+xml";
constexpr const char* kWmlSettings = "application/vnd.openxmlformats-officedocument.wordprocessingml.settings+xml";
constexpr const char* kPng = "image/png";
constexpr const char* kJpeg = "image/jpeg";
constexpr const char* kGif = "image/gif";
constexpr const char* kOctetStream = "application/octet-stream";

} // namespace ct

/**
 * @brief [Content_Types].xml 生成器
 *
 * 部件的内容类型与其扩展名的默认类型一致时归入 Default，否则单独写 Override。
 */
class ContentTypes {
public:
    ContentTypes() = default;

    static ContentTypes fromParts(const std::vector<const Part*>& parts);

    void addDefault(const std::string& extension, const std::string& content_type);
    void addOverride(const std::string& part_name, const std::string& content_type);

    std::string toXML() const;

    size_t defaultCount() const { return default_types_.size(); }
    size_t overrideCount() const { return override_types_.size(); }

private:
    struct DefaultType {
        std::string extension;
        std::string content_type;
    };

    struct OverrideType {
        std::string part_name;
        std::string content_type;
    };

    static const char* defaultContentTypeFor(const std::string& extension);

    std::vector<DefaultType> default_types_;
    std::vector<OverrideType> override_types_;
};

}} // namespace fastdocx::opc

#include "fastdocx/opc/RelationshipType.hpp"

namespace fastdocx {
namespace opc {

namespace {

struct TypeEntry {
    RelationshipType type;
    const char* uri;
    const char* name;
};

constexpr TypeEntry kTypeTable[] = {
    {RelationshipType::OfficeDocument, "http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument", "officeDocument"},
    {RelationshipType::Styles, "http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles", "styles"},
    {RelationshipType::Numbering, "http://schemas.openxmlformats.org/officeDocument/2006/relationships/numbering", "numbering"},
    {RelationshipType::Settings, "http://schemas.openxmlformats.org/officeDocument/2006/relationships/settings", "settings"},
    {RelationshipType::CoreProperties, "http://schemas.openxmlformats.org/package/2006/relationships/metadata/core-properties", "coreProperties"},
    {RelationshipType::ExtendedProperties, "http://schemas.openxmlformats.org/officeDocument/2006/relationships/extended-properties", "extendedProperties"},
    {RelationshipType::Footer, "http://schemas.openxmlformats.org/officeDocument/2006/relationships/footer", "footer"},
    {RelationshipType::Header, "http://schemas.openxmlformats.org/officeDocument/2006/relationships/header", "header"},
    {RelationshipType::Image, "http://schemas.openxmlformats.org/officeDocument/2006/relationships/image", "image"},
    {RelationshipType::Hyperlink, "http://schemas.openxmlformats.org/officeDocument/2006/relationships/hyperlink", "hyperlink"},
    {RelationshipType::Theme, "http://schemas.openxmlformats.org/officeDocument/2006/relationships/theme", "theme"},
    {RelationshipType::FontTable, "http://schemas.openxmlformats.org/officeDocument/2006/relationships/fontTable", "fontTable"},
    {RelationshipType::WebSettings, "http://schemas.openxmlformats.org/officeDocument/2006/relationships/webSettings", "webSettings"},
};

} // anonymous namespace

const char* toUri(RelationshipType type) noexcept {
    for (const auto& entry : kTypeTable) {
        if (entry.type == type) return entry.uri;
    }
    return "";
}

RelationshipType relationshipTypeFromUri(const std::string& uri) noexcept {
    for (const auto& entry : kTypeTable) {
        if (uri == entry.uri) return entry.type;
    }
    return RelationshipType::Unknown;
}

const char* toString(RelationshipType type) noexcept {
    for (const auto& entry : kTypeTable) {
        if (entry.type == type) return entry.name;
    }
    return "unknown";
}

}} // namespace fastdocx::opc

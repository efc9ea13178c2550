#include "fastdocx/reader/ContentTypesParser.hpp"
#include <algorithm>
#include <cctype>

namespace fastdocx {
namespace reader {

void ContentTypesParser::onStartElement(std::string_view name, core::span<const xml::XMLAttribute> attributes, int /*depth*/) {
    if (name == "Default") {
        auto extension = findAttribute(attributes, "Extension");
        auto content_type = findAttribute(attributes, "ContentType");

        if (extension && content_type && !extension->empty() && !content_type->empty()) {
            default_index_[toLower(*extension)] = *content_type;
            defaults_.push_back({std::move(*extension), std::move(*content_type)});
        } else {
            READER_WARN("Skipping incomplete default type: extension='{}', contentType='{}'",
                        extension ? *extension : "", content_type ? *content_type : "");
        }
    } else if (name == "Override") {
        auto part_name = findAttribute(attributes, "PartName");
        auto content_type = findAttribute(attributes, "ContentType");

        if (part_name && content_type && !part_name->empty() && !content_type->empty()) {
            override_index_[toLower(*part_name)] = *content_type;
            overrides_.push_back({std::move(*part_name), std::move(*content_type)});
        } else {
            READER_WARN("Skipping incomplete override type: partName='{}', contentType='{}'",
                        part_name ? *part_name : "", content_type ? *content_type : "");
        }
    }
}

void ContentTypesParser::onEndElement(std::string_view /*name*/, int /*depth*/) {
}

std::string ContentTypesParser::findDefaultType(const std::string& extension) const {
    auto it = default_index_.find(toLower(extension));
    return it != default_index_.end() ? it->second : std::string();
}

std::string ContentTypesParser::findOverrideType(const std::string& part_name) const {
    auto it = override_index_.find(toLower(part_name));
    return it != override_index_.end() ? it->second : std::string();
}

std::string ContentTypesParser::getContentType(const std::string& part_name) const {
    std::string content_type = findOverrideType(part_name);
    if (!content_type.empty()) {
        return content_type;
    }

    size_t last_dot = part_name.find_last_of('.');
    size_t last_slash = part_name.find_last_of('/');
    if (last_dot != std::string::npos && (last_slash == std::string::npos || last_dot > last_slash)) {
        return findDefaultType(part_name.substr(last_dot + 1));
    }
    return std::string();
}

void ContentTypesParser::clear() {
    defaults_.clear();
    overrides_.clear();
    default_index_.clear();
    override_index_.clear();
}

std::string ContentTypesParser::toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

}} // namespace fastdocx::reader

/**
 * @file CorePropertiesParser.cpp
 * @brief docProps/core.xml 解析实现
 */

#include "fastdocx/reader/CorePropertiesParser.hpp"

namespace fastdocx {
namespace reader {

std::string* CorePropertiesParser::fieldFor(std::string_view local_name) {
    if (local_name == "title") return &props_.title;
    if (local_name == "subject") return &props_.subject;
    if (local_name == "creator") return &props_.creator;
    if (local_name == "keywords") return &props_.keywords;
    if (local_name == "description") return &props_.description;
    if (local_name == "lastModifiedBy") return &props_.last_modified_by;
    if (local_name == "category") return &props_.category;
    if (local_name == "contentStatus") return &props_.content_status;
    if (local_name == "identifier") return &props_.identifier;
    if (local_name == "language") return &props_.language;
    if (local_name == "version") return &props_.version;
    if (local_name == "revision") return &props_.revision;
    if (local_name == "created") return &props_.created;
    if (local_name == "modified") return &props_.modified;
    if (local_name == "lastPrinted") return &props_.last_printed;
    return nullptr;
}

void CorePropertiesParser::onStartElement(std::string_view name, core::span<const xml::XMLAttribute> /*attributes*/, int depth) {
    if (depth != 1) {
        current_field_ = nullptr;
        return;
    }

    size_t colon = name.find(':');
    std::string_view local_name = colon == std::string_view::npos ? name : name.substr(colon + 1);
    current_field_ = fieldFor(local_name);

    if (!current_field_) {
        READER_DEBUG("Ignoring unknown core property element: {}", std::string(name));
    }
}

void CorePropertiesParser::onEndElement(std::string_view /*name*/, int depth) {
    if (depth == 1) {
        current_field_ = nullptr;
    }
}

void CorePropertiesParser::onText(std::string_view text, int depth) {
    if (depth == 1 && current_field_) {
        current_field_->append(text.data(), text.size());
    }
}

}} // namespace fastdocx::reader

#include "fastdocx/xml/XMLStreamWriter.hpp"
#include "fastdocx/core/Constants.hpp"
#include "fastdocx/core/Exception.hpp"
#include "fastdocx/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace fastdocx {
namespace xml {

XMLStreamWriter::XMLStreamWriter() {
    buffer_.reserve(core::Constants::kIOBufferSize);
    pending_attributes_.reserve(8);
}

void XMLStreamWriter::startDocument(const std::string& encoding, bool standalone) {
    buffer_.append(fmt::format("<?xml version=\"1.0\" encoding=\"{}\"{}?>\n",
                               encoding, standalone ? " standalone=\"yes\"" : ""));
}

void XMLStreamWriter::endDocument() {
    while (!element_stack_.empty()) {
        XML_WARN("Auto-closing unclosed element: {}", element_stack_.top());
        endElement();
    }
}

void XMLStreamWriter::startElement(const std::string& name) {
    if (name.empty()) {
        FASTDOCX_THROW(core::ParameterException, "Element name cannot be empty", "name");
    }

    ensureElementClosed();

    buffer_.push_back('<');
    buffer_.append(name);

    element_stack_.push(name);
    in_element_ = true;
}

void XMLStreamWriter::endElement() {
    if (element_stack_.empty()) {
        FASTDOCX_THROW(core::OperationException, "No element to close", "endElement",
                       core::ErrorCode::InvalidArgument);
    }

    std::string element_name = std::move(element_stack_.top());
    element_stack_.pop();

    if (in_element_) {
        writeAttributesToBuffer();
        buffer_.append("/>");
        in_element_ = false;
    } else {
        buffer_.append("</");
        buffer_.append(element_name);
        buffer_.push_back('>');
    }
}

void XMLStreamWriter::writeAttribute(const std::string& name, std::string_view value) {
    if (!in_element_) {
        FASTDOCX_THROW(core::OperationException, "Cannot write attribute outside of element",
                       "writeAttribute", core::ErrorCode::InvalidArgument);
    }
    if (name.empty()) {
        FASTDOCX_THROW(core::ParameterException, "Attribute name cannot be empty", "name");
    }

    for (auto& attr : pending_attributes_) {
        if (attr.key == name) {
            attr.value = std::string(value);
            return;
        }
    }
    pending_attributes_.push_back({name, std::string(value)});
}

void XMLStreamWriter::writeAttribute(const std::string& name, const char* value) {
    writeAttribute(name, std::string_view(value ? value : ""));
}

void XMLStreamWriter::writeAttribute(const std::string& name, int64_t value) {
    writeAttribute(name, std::string_view(fmt::format("{}", value)));
}

void XMLStreamWriter::writeText(std::string_view text) {
    if (text.empty()) {
        return;
    }
    ensureElementClosed();
    buffer_.append(escapeText(text));
}

std::string XMLStreamWriter::takeResult() {
    endDocument();
    std::string result = std::move(buffer_);
    clear();
    return result;
}

void XMLStreamWriter::clear() {
    buffer_.clear();
    pending_attributes_.clear();
    while (!element_stack_.empty()) {
        element_stack_.pop();
    }
    in_element_ = false;
}

void XMLStreamWriter::ensureElementClosed() {
    if (in_element_) {
        writeAttributesToBuffer();
        buffer_.push_back('>');
        in_element_ = false;
    }
}

void XMLStreamWriter::writeAttributesToBuffer() {
    for (const auto& attr : pending_attributes_) {
        buffer_.push_back(' ');
        buffer_.append(attr.key);
        buffer_.append("=\"");
        buffer_.append(escapeAttribute(attr.value));
        buffer_.push_back('"');
    }
    pending_attributes_.clear();
}

std::string XMLStreamWriter::escapeText(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': result.append("&amp;"); break;
            case '<': result.append("&lt;"); break;
            case '>': result.append("&gt;"); break;
            default: result.push_back(c); break;
        }
    }
    return result;
}

std::string XMLStreamWriter::escapeAttribute(std::string_view value) {
    std::string result;
    result.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '&': result.append("&amp;"); break;
            case '<': result.append("&lt;"); break;
            case '>': result.append("&gt;"); break;
            case '"': result.append("&quot;"); break;
            case '\n': result.append("&#10;"); break;
            case '\t': result.append("&#9;"); break;
            case '\r': result.append("&#13;"); break;
            default: result.push_back(c); break;
        }
    }
    return result;
}

}} // namespace fastdocx::xml

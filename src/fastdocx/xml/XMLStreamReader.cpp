#include "fastdocx/xml/XMLStreamReader.hpp"
#include "fastdocx/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <cstring>
#include <stack>
#include <fmt/format.h>

namespace fastdocx {
namespace xml {

XMLStreamReader::XMLStreamReader() {
    attribute_pool_.reserve(32);
    resetState();
}

XMLStreamReader::~XMLStreamReader() {
    cleanupParser();
}

bool XMLStreamReader::initializeParser() {
    cleanupParser();

    parser_ = XML_ParserCreate("UTF-8");
    if (!parser_) {
        handleError(XMLParseError::ParserCreateFailed, "Failed to create XML parser");
        return false;
    }

    XML_SetUserData(parser_, this);
    XML_SetElementHandler(parser_, startElementHandler, endElementHandler);
    XML_SetCharacterDataHandler(parser_, characterDataHandler);
    return true;
}

void XMLStreamReader::cleanupParser() {
    if (parser_) {
        XML_ParserFree(parser_);
        parser_ = nullptr;
    }
}

void XMLStreamReader::resetState() {
    current_depth_ = 0;
    last_error_ = XMLParseError::Ok;
    last_error_message_.clear();
    attribute_pool_.clear();
    current_text_.clear();
    elements_parsed_ = 0;
}

void XMLStreamReader::setStartElementCallback(StartElementCallback callback) {
    start_element_callback_ = std::move(callback);
}

void XMLStreamReader::setEndElementCallback(EndElementCallback callback) {
    end_element_callback_ = std::move(callback);
}

void XMLStreamReader::setTextCallback(TextCallback callback) {
    text_callback_ = std::move(callback);
}

XMLParseError XMLStreamReader::parseFromString(const std::string& xml_content) {
    return parseFromBuffer(xml_content.data(), xml_content.size());
}

XMLParseError XMLStreamReader::parseFromBuffer(const char* buffer, size_t size) {
    if (!buffer || size == 0) {
        resetState();
        handleError(XMLParseError::InvalidInput, "Invalid buffer or size");
        return XMLParseError::InvalidInput;
    }

    XMLParseError status = beginParsing();
    if (status != XMLParseError::Ok) {
        return status;
    }

    // 按块送入，避免超大部件一次性申请 expat 缓冲
    const size_t chunk_size = core::Constants::kIOBufferSize;
    size_t offset = 0;
    while (offset < size) {
        size_t len = std::min(chunk_size, size - offset);
        bool is_final = offset + len >= size;
        status = parseChunk(buffer + offset, len, is_final);
        if (status != XMLParseError::Ok) {
            return status;
        }
        offset += len;
    }

    XML_DEBUG("Parsed {} bytes, {} elements", size, elements_parsed_);
    return XMLParseError::Ok;
}

XMLParseError XMLStreamReader::beginParsing() {
    resetState();
    if (!initializeParser()) {
        return last_error_;
    }
    return XMLParseError::Ok;
}

XMLParseError XMLStreamReader::feedData(const char* data, size_t size) {
    return parseChunk(data, size, false);
}

XMLParseError XMLStreamReader::endParsing() {
    return parseChunk(nullptr, 0, true);
}

XMLParseError XMLStreamReader::parseChunk(const char* chunk, size_t size, bool is_final) {
    if (!parser_) {
        handleError(XMLParseError::ParserCreateFailed, "Parser not initialized");
        return XMLParseError::ParserCreateFailed;
    }

    if (XML_Parse(parser_, chunk, static_cast<int>(size), is_final ? 1 : 0) == XML_STATUS_ERROR) {
        return reportExpatError();
    }

    // 回调抛出异常时会在这里停下
    if (last_error_ != XMLParseError::Ok) {
        return last_error_;
    }
    return XMLParseError::Ok;
}

XMLParseError XMLStreamReader::reportExpatError() {
    if (last_error_ == XMLParseError::CallbackError) {
        return last_error_;
    }
    std::string error_msg = fmt::format("Parse error at line {}, column {}: {}",
        XML_GetCurrentLineNumber(parser_),
        XML_GetCurrentColumnNumber(parser_),
        XML_ErrorString(XML_GetErrorCode(parser_)));
    handleError(XMLParseError::ParseFailed, error_msg);
    return XMLParseError::ParseFailed;
}

void XMLCALL XMLStreamReader::startElementHandler(void* user_data, const XML_Char* name, const XML_Char** attrs) {
    auto* reader = static_cast<XMLStreamReader*>(user_data);

    std::string_view element_name{name, std::strlen(name)};
    reader->elements_parsed_++;

    // 超深嵌套视为损坏的文档
    if (reader->current_depth_ >= static_cast<int>(core::Constants::kMaxXMLDepth)) {
        reader->handleError(XMLParseError::ParseFailed,
                            fmt::format("Element nesting exceeds {} levels", core::Constants::kMaxXMLDepth));
        XML_StopParser(reader->parser_, XML_FALSE);
        return;
    }

    // 子元素之前的文本属于父元素，先交出去，否则会被下面的 clear 丢掉
    if (reader->current_depth_ > 0 && !reader->flushText(reader->current_depth_ - 1)) {
        return;
    }

    auto attributes = reader->parseAttributes(attrs);

    if (reader->start_element_callback_) {
        try {
            reader->start_element_callback_(element_name, attributes, reader->current_depth_);
        } catch (const std::exception& e) {
            reader->handleCallbackError("start element", e);
            return;
        }
    }

    reader->current_depth_++;
    reader->current_text_.clear();
}

void XMLCALL XMLStreamReader::endElementHandler(void* user_data, const XML_Char* name) {
    auto* reader = static_cast<XMLStreamReader*>(user_data);

    reader->current_depth_--;
    std::string_view element_name{name, std::strlen(name)};

    if (!reader->flushText(reader->current_depth_)) {
        return;
    }

    if (reader->end_element_callback_) {
        try {
            reader->end_element_callback_(element_name, reader->current_depth_);
        } catch (const std::exception& e) {
            reader->handleCallbackError("end element", e);
            return;
        }
    }

    reader->current_text_.clear();
}

bool XMLStreamReader::flushText(int depth) {
    if (current_text_.empty() || !text_callback_) {
        current_text_.clear();
        return true;
    }

    std::string_view text_content = trim_whitespace_
        ? trimStringView(current_text_)
        : std::string_view{current_text_};

    if (!text_content.empty()) {
        try {
            text_callback_(text_content, depth);
        } catch (const std::exception& e) {
            handleCallbackError("text", e);
            return false;
        }
    }
    current_text_.clear();
    return true;
}

void XMLCALL XMLStreamReader::characterDataHandler(void* user_data, const XML_Char* data, int len) {
    auto* reader = static_cast<XMLStreamReader*>(user_data);
    if (len > 0) {
        reader->current_text_.append(data, static_cast<size_t>(len));
    }
}

core::span<const XMLAttribute> XMLStreamReader::parseAttributes(const XML_Char** attrs) {
    // 属性只在当前回调期间有效，复用同一个池
    attribute_pool_.clear();

    if (attrs) {
        for (int i = 0; attrs[i]; i += 2) {
            if (attrs[i + 1]) {
                attribute_pool_.emplace_back(
                    std::string_view{attrs[i], std::strlen(attrs[i])},
                    std::string_view{attrs[i + 1], std::strlen(attrs[i + 1])});
            }
        }
    }

    return core::span<const XMLAttribute>{attribute_pool_.data(), attribute_pool_.size()};
}

std::string_view XMLStreamReader::trimStringView(std::string_view str) {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) {
        return std::string_view{};
    }
    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

void XMLStreamReader::handleError(XMLParseError error, const std::string& message) {
    last_error_ = error;
    last_error_message_ = message;
    XML_ERROR("XML parse error: {}", message);
}

void XMLStreamReader::handleCallbackError(const char* stage, const std::exception& e) {
    handleError(XMLParseError::CallbackError, fmt::format("{} callback error: {}", stage, e.what()));
    XML_StopParser(parser_, XML_FALSE);
}

std::unique_ptr<XMLElement> XMLStreamReader::parseToDOM(const std::string& xml_content) {
    std::unique_ptr<XMLElement> root;
    std::stack<XMLElement*> element_stack;

    setTrimWhitespace(false);

    setStartElementCallback([&](std::string_view element_name, core::span<const XMLAttribute> attributes, int) {
        auto element = std::make_unique<XMLElement>(std::string(element_name));
        for (const auto& attr : attributes) {
            element->setAttribute(std::string(attr.name), std::string(attr.value));
        }

        XMLElement* element_ptr = element.get();
        if (element_stack.empty()) {
            root = std::move(element);
        } else {
            element_stack.top()->appendChild(std::move(element));
        }
        element_stack.push(element_ptr);
    });

    setEndElementCallback([&](std::string_view, int) {
        if (!element_stack.empty()) {
            element_stack.pop();
        }
    });

    setTextCallback([&](std::string_view text, int) {
        if (element_stack.empty()) {
            return;
        }
        XMLElement* current = element_stack.top();
        bool preserve = current->getAttribute("xml:space") == "preserve";
        if (!preserve && trimStringView(text).empty()) {
            return;
        }
        current->setText(current->text() + std::string(text));
    });

    XMLParseError result = parseFromString(xml_content);

    start_element_callback_ = nullptr;
    end_element_callback_ = nullptr;
    text_callback_ = nullptr;
    trim_whitespace_ = true;

    if (result != XMLParseError::Ok) {
        XML_ERROR("Failed to parse XML to DOM: {}", last_error_message_);
        return nullptr;
    }
    if (!root) {
        handleError(XMLParseError::InvalidInput, "Document has no root element");
        return nullptr;
    }
    return root;
}

}} // namespace fastdocx::xml

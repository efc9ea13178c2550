#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <functional>
#include <expat.h>
#include "fastdocx/core/Constants.hpp"
#include "fastdocx/core/span.hpp"
#include "fastdocx/xml/XMLElement.hpp"

namespace fastdocx {
namespace xml {

/**
 * @brief 基于libexpat的流式XML解析器
 *
 * 事件驱动：开始标签、结束标签、文本三类回调。属性和名称以 string_view
 * 传给回调，只在回调期间有效。不做命名空间展开，名称保留原始前缀。
 * 小文档可以直接用 parseToDOM 得到一棵 XMLElement 树。
 *
 * 文本回调在遇到子元素开始标签或本元素结束标签时触发，所以混合内容
 * 中的一段文本会拆成多次回调，depth 都是所属元素的深度。
 */

enum class XMLParseError {
    Ok,
    InvalidInput,
    ParserCreateFailed,
    ParseFailed,
    CallbackError
};

constexpr bool isSuccess(XMLParseError error) noexcept {
    return error == XMLParseError::Ok;
}

struct XMLAttribute {
    std::string_view name;
    std::string_view value;

    XMLAttribute(std::string_view n, std::string_view v) : name(n), value(v) {}
};

class XMLStreamReader {
public:
    using StartElementCallback = std::function<void(std::string_view name, core::span<const XMLAttribute> attributes, int depth)>;
    using EndElementCallback = std::function<void(std::string_view name, int depth)>;
    using TextCallback = std::function<void(std::string_view text, int depth)>;

    XMLStreamReader();
    ~XMLStreamReader();

    XMLStreamReader(const XMLStreamReader&) = delete;
    XMLStreamReader& operator=(const XMLStreamReader&) = delete;

    void setStartElementCallback(StartElementCallback callback);
    void setEndElementCallback(EndElementCallback callback);
    void setTextCallback(TextCallback callback);

    // 默认去除文本首尾空白
    void setTrimWhitespace(bool trim) { trim_whitespace_ = trim; }

    XMLParseError parseFromString(const std::string& xml_content);
    XMLParseError parseFromBuffer(const char* buffer, size_t size);

    // 分块解析
    XMLParseError beginParsing();
    XMLParseError feedData(const char* data, size_t size);
    XMLParseError endParsing();

    XMLParseError getLastError() const { return last_error_; }
    const std::string& getLastErrorMessage() const { return last_error_message_; }
    int getCurrentDepth() const { return current_depth_; }
    size_t getElementsParsed() const { return elements_parsed_; }

    /**
     * @brief 整体解析为DOM树
     *
     * 纯空白文本节点被丢弃，带 xml:space="preserve" 的元素保留原文。
     * @return 根元素；解析失败返回 nullptr，原因见 getLastErrorMessage()
     */
    std::unique_ptr<XMLElement> parseToDOM(const std::string& xml_content);

private:
    static void XMLCALL startElementHandler(void* user_data, const XML_Char* name, const XML_Char** attrs);
    static void XMLCALL endElementHandler(void* user_data, const XML_Char* name);
    static void XMLCALL characterDataHandler(void* user_data, const XML_Char* data, int len);

    bool initializeParser();
    void cleanupParser();
    void resetState();
    XMLParseError parseChunk(const char* chunk, size_t size, bool is_final);
    XMLParseError reportExpatError();
    core::span<const XMLAttribute> parseAttributes(const XML_Char** attrs);
    static std::string_view trimStringView(std::string_view str);
    // 把累积的文本交给文本回调（depth 为所属元素深度），回调抛异常时返回 false
    bool flushText(int depth);
    void handleError(XMLParseError error, const std::string& message);
    void handleCallbackError(const char* stage, const std::exception& e);

    XML_Parser parser_ = nullptr;

    int current_depth_ = 0;
    XMLParseError last_error_ = XMLParseError::Ok;
    std::string last_error_message_;

    std::vector<XMLAttribute> attribute_pool_;
    std::string current_text_;

    StartElementCallback start_element_callback_;
    EndElementCallback end_element_callback_;
    TextCallback text_callback_;

    bool trim_whitespace_ = true;
    size_t elements_parsed_ = 0;
};

}} // namespace fastdocx::xml

#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <stack>
#include <cstdint>

namespace fastdocx {
namespace xml {

/**
 * @brief 内存模式的XML流式写入器
 *
 * 属性先缓存，遇到子元素、文本或结束标签时一次性写出；
 * 没有内容的元素输出为自闭合标签。文本与属性值自动转义。
 */
class XMLStreamWriter {
public:
    XMLStreamWriter();
    ~XMLStreamWriter() = default;

    XMLStreamWriter(const XMLStreamWriter&) = delete;
    XMLStreamWriter& operator=(const XMLStreamWriter&) = delete;

    // ========== 文档 ==========

    void startDocument(const std::string& encoding = "UTF-8", bool standalone = false);
    void endDocument();

    // ========== 元素 ==========

    void startElement(const std::string& name);
    void endElement();

    // ========== 属性 ==========

    void writeAttribute(const std::string& name, std::string_view value);
    void writeAttribute(const std::string& name, const char* value);
    void writeAttribute(const std::string& name, int64_t value);

    // ========== 内容 ==========

    void writeText(std::string_view text);

    // ========== 输出 ==========

    const std::string& toString() const { return buffer_; }
    std::string takeResult();
    size_t openElementCount() const { return element_stack_.size(); }
    void clear();

    static std::string escapeText(std::string_view text);
    static std::string escapeAttribute(std::string_view value);

private:
    void ensureElementClosed();
    void writeAttributesToBuffer();

    struct PendingAttribute {
        std::string key;
        std::string value;
    };

    std::string buffer_;
    std::stack<std::string> element_stack_;
    std::vector<PendingAttribute> pending_attributes_;
    bool in_element_ = false;
};

}} // namespace fastdocx::xml

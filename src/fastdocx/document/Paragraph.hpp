#pragma once

#include "fastdocx/xml/XMLElement.hpp"
#include <optional>
#include <string>

namespace fastdocx {
namespace document {

/**
 * @brief w:p 的轻量视图，不拥有元素
 */
class Paragraph {
public:
    explicit Paragraph(xml::XMLElement& element) : element_(&element) {}

    /**
     * @brief 段落纯文本，w:tab 记为 '\t'，w:br/w:cr 记为 '\n'
     */
    std::string text() const;

    /**
     * @brief 追加一个只含文本的 w:r
     */
    void addRun(const std::string& text);

    size_t runCount() const;

    /**
     * @brief w:pPr/w:pStyle 的值，未设置时返回 std::nullopt
     */
    std::optional<std::string> styleId() const;

    /**
     * @brief 设置段落样式，传入 std::nullopt 时删除 w:pStyle
     */
    void setStyleId(const std::optional<std::string>& style_id);

    xml::XMLElement& element() { return *element_; }
    const xml::XMLElement& element() const { return *element_; }

private:
    xml::XMLElement* element_;
};

}} // namespace fastdocx::document

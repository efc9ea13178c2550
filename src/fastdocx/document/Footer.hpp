#pragma once

#include "fastdocx/document/Paragraph.hpp"
#include "fastdocx/xml/XMLElement.hpp"
#include <optional>
#include <string>
#include <vector>

namespace fastdocx {
namespace parts {
class FooterPart;
}

namespace document {

/**
 * @brief 页脚内容（w:ftr）的视图
 *
 * 每次由 FooterPart::footer() 新建，只持有元素和部件的引用。
 */
class Footer {
public:
    Footer(xml::XMLElement& element, parts::FooterPart& part);

    std::vector<Paragraph> paragraphs() const;

    /**
     * @brief 追加段落
     * @param style 样式名或样式 id，经部件解析；解析为默认段落样式时不写 w:pStyle
     * @throws core::StyleNotFoundException / core::WrongStyleTypeException
     */
    Paragraph addParagraph(const std::string& text = "",
                           const std::optional<std::string>& style = std::nullopt);

    /**
     * @brief 各段落文本以 '\n' 连接
     */
    std::string text() const;

    xml::XMLElement& element() { return element_; }
    parts::FooterPart& part() { return part_; }

private:
    xml::XMLElement& element_;
    parts::FooterPart& part_;
};

}} // namespace fastdocx::document

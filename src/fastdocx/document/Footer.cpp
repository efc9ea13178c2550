#include "fastdocx/document/Footer.hpp"
#include "fastdocx/parts/FooterPart.hpp"

namespace fastdocx {
namespace document {

Footer::Footer(xml::XMLElement& element, parts::FooterPart& part)
    : element_(element), part_(part) {
}

std::vector<Paragraph> Footer::paragraphs() const {
    std::vector<Paragraph> result;
    for (xml::XMLElement* p : element_.findChildren("w:p")) {
        result.emplace_back(*p);
    }
    return result;
}

Paragraph Footer::addParagraph(const std::string& text, const std::optional<std::string>& style) {
    // 先解析样式，失败时不留下半成品段落
    std::optional<std::string> style_id = part_.getStyleId(style, styles::StyleType::Paragraph);

    Paragraph paragraph(element_.appendChild("w:p"));
    paragraph.setStyleId(style_id);
    if (!text.empty()) {
        paragraph.addRun(text);
    }
    return paragraph;
}

std::string Footer::text() const {
    std::string result;
    bool first = true;
    for (const Paragraph& paragraph : paragraphs()) {
        if (!first) {
            result += '\n';
        }
        result += paragraph.text();
        first = false;
    }
    return result;
}

}} // namespace fastdocx::document

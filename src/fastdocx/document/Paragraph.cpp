#include "fastdocx/document/Paragraph.hpp"

namespace fastdocx {
namespace document {

std::string Paragraph::text() const {
    std::string result;
    element_->forEachRecursive([&result](const xml::XMLElement& node, int /*depth*/) {
        const std::string& name = node.name();
        if (name == "w:t") {
            result += node.text();
        } else if (name == "w:tab") {
            result += '\t';
        } else if (name == "w:br" || name == "w:cr") {
            result += '\n';
        }
    });
    return result;
}

void Paragraph::addRun(const std::string& text) {
    xml::XMLElement& run = element_->appendChild("w:r");
    if (text.empty()) {
        return;
    }
    xml::XMLElement& t = run.appendChild("w:t");
    t.setText(text);
    if (text.front() == ' ' || text.back() == ' ' || text.front() == '\t' || text.back() == '\t') {
        t.setAttribute("xml:space", "preserve");
    }
}

size_t Paragraph::runCount() const {
    return element_->findChildren("w:r").size();
}

std::optional<std::string> Paragraph::styleId() const {
    xml::XMLElement* style = element_->findChildByPath("w:pPr/w:pStyle");
    if (!style) {
        return std::nullopt;
    }
    return style->attribute("w:val");
}

void Paragraph::setStyleId(const std::optional<std::string>& style_id) {
    xml::XMLElement* ppr = element_->findChild("w:pPr");
    if (!style_id) {
        if (ppr) {
            if (xml::XMLElement* style = ppr->findChild("w:pStyle")) {
                ppr->removeChild(style);
            }
        }
        return;
    }

    // w:pPr 是 w:p 的第一个子元素，w:pStyle 是 w:pPr 的第一个子元素
    if (!ppr) {
        ppr = &element_->insertChild(0, "w:pPr");
    }
    xml::XMLElement* style = ppr->findChild("w:pStyle");
    if (!style) {
        style = &ppr->insertChild(0, "w:pStyle");
    }
    style->setAttribute("w:val", *style_id);
}

}} // namespace fastdocx::document

#pragma once

#include "fastdocx/xml/XMLElement.hpp"

namespace fastdocx {
namespace settings {

/**
 * @brief 文档设置（w:settings）
 */
class Settings {
public:
    explicit Settings(xml::XMLElement& root) : root_(root) {}

    /**
     * @brief 奇偶页使用不同页眉页脚（w:evenAndOddHeaders）
     */
    bool oddAndEvenPagesHeaderFooter() const;
    void setOddAndEvenPagesHeaderFooter(bool value);

    xml::XMLElement& element() { return root_; }

private:
    xml::XMLElement& root_;
};

}} // namespace fastdocx::settings

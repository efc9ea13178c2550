#pragma once

#include "fastdocx/xml/XMLElement.hpp"
#include <optional>
#include <string>

namespace fastdocx {
namespace styles {

enum class StyleType {
    Paragraph,
    Character,
    Table,
    Numbering
};

// "paragraph" / "character" / "table" / "numbering"
const char* toString(StyleType type) noexcept;
std::optional<StyleType> styleTypeFromString(const std::string& value) noexcept;

/**
 * @brief 内置样式的界面名与存储名互转
 *
 * Word 在 w:name 中以小写保存部分内置样式（"heading 1"、"caption"），
 * 界面上显示为首字母大写。不在表中的名称原样返回。
 */
std::string uiToInternalName(const std::string& ui_name);
std::string internalToUiName(const std::string& internal_name);

/**
 * @brief w:style 元素的只读视图（写操作直接作用于底层元素）
 */
class Style {
public:
    explicit Style(xml::XMLElement& element) : element_(&element) {}

    std::string styleId() const;

    /**
     * @brief 界面名（内置样式已转换），没有 w:name 时返回空串
     */
    std::string name() const;

    // w:name 中保存的原始名称
    std::string internalName() const;

    /**
     * @brief 缺省 w:type 时视为段落样式
     */
    StyleType type() const;

    bool isDefault() const;
    bool hidden() const;
    bool builtin() const;

    /**
     * @brief w:basedOn 指向的样式 id
     */
    std::optional<std::string> baseStyleId() const;

    void setName(const std::string& ui_name);

    xml::XMLElement& element() const { return *element_; }

    bool operator==(const Style& other) const { return element_ == other.element_; }
    bool operator!=(const Style& other) const { return element_ != other.element_; }

private:
    xml::XMLElement* element_;
};

}} // namespace fastdocx::styles

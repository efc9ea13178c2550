#include "fastdocx/styles/Style.hpp"
#include "fastdocx/utils/ModuleLoggers.hpp"

namespace fastdocx {
namespace styles {

namespace {

struct NameAlias {
    const char* ui;
    const char* internal;
};

constexpr NameAlias kNameAliases[] = {
    {"Caption", "caption"},
    {"Footer", "footer"},
    {"Header", "header"},
    {"Heading 1", "heading 1"},
    {"Heading 2", "heading 2"},
    {"Heading 3", "heading 3"},
    {"Heading 4", "heading 4"},
    {"Heading 5", "heading 5"},
    {"Heading 6", "heading 6"},
    {"Heading 7", "heading 7"},
    {"Heading 8", "heading 8"},
    {"Heading 9", "heading 9"},
};

bool isOn(const std::string& value) {
    return value.empty() || value == "1" || value == "true" || value == "on";
}

} // anonymous namespace

const char* toString(StyleType type) noexcept {
    switch (type) {
        case StyleType::Paragraph: return "paragraph";
        case StyleType::Character: return "character";
        case StyleType::Table: return "table";
        case StyleType::Numbering: return "numbering";
    }
    return "paragraph";
}

std::optional<StyleType> styleTypeFromString(const std::string& value) noexcept {
    if (value == "paragraph") return StyleType::Paragraph;
    if (value == "character") return StyleType::Character;
    if (value == "table") return StyleType::Table;
    if (value == "numbering") return StyleType::Numbering;
    return std::nullopt;
}

std::string uiToInternalName(const std::string& ui_name) {
    for (const auto& alias : kNameAliases) {
        if (ui_name == alias.ui) return alias.internal;
    }
    return ui_name;
}

std::string internalToUiName(const std::string& internal_name) {
    for (const auto& alias : kNameAliases) {
        if (internal_name == alias.internal) return alias.ui;
    }
    return internal_name;
}

std::string Style::styleId() const {
    return element_->getAttribute("w:styleId");
}

std::string Style::name() const {
    xml::XMLElement* name = element_->findChild("w:name");
    return name ? internalToUiName(name->getAttribute("w:val")) : std::string();
}

StyleType Style::type() const {
    auto value = element_->attribute("w:type");
    if (!value) {
        return StyleType::Paragraph;
    }
    auto type = styleTypeFromString(*value);
    if (!type) {
        STYLE_WARN("Style '{}' has unrecognized type '{}', treating as paragraph", styleId(), *value);
        return StyleType::Paragraph;
    }
    return *type;
}

bool Style::isDefault() const {
    auto value = element_->attribute("w:default");
    return value && (*value == "1" || *value == "true" || *value == "on");
}

bool Style::hidden() const {
    xml::XMLElement* vanish = element_->findChild("w:semiHidden");
    return vanish && isOn(vanish->getAttribute("w:val"));
}

bool Style::builtin() const {
    auto value = element_->attribute("w:customStyle");
    return !(value && (*value == "1" || *value == "true" || *value == "on"));
}

std::optional<std::string> Style::baseStyleId() const {
    xml::XMLElement* based_on = element_->findChild("w:basedOn");
    if (!based_on) {
        return std::nullopt;
    }
    return based_on->getAttribute("w:val");
}

std::string Style::internalName() const {
    xml::XMLElement* name = element_->findChild("w:name");
    return name ? name->getAttribute("w:val") : std::string();
}

void Style::setName(const std::string& ui_name) {
    // w:name 必须是第一个子元素
    xml::XMLElement* name = element_->findChild("w:name");
    if (!name) {
        name = &element_->insertChild(0, "w:name");
    }
    name->setAttribute("w:val", uiToInternalName(ui_name));
}

}} // namespace fastdocx::styles

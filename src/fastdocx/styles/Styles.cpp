#include "fastdocx/styles/Styles.hpp"
#include "fastdocx/core/Exception.hpp"
#include "fastdocx/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace fastdocx {
namespace styles {

Styles::Styles(xml::XMLElement& root) : root_(root) {
    for (xml::XMLElement* element : root_.findChildren("w:style")) {
        styles_.push_back(std::make_unique<Style>(*element));
    }
    STYLE_DEBUG("Loaded {} styles", styles_.size());
}

bool Styles::contains(const std::string& name) const {
    return findByName(name) != nullptr;
}

const Style& Styles::operator[](const std::string& name) const {
    const Style* style = findByName(name);
    if (!style) {
        FASTDOCX_THROW(core::StyleNotFoundException, name);
    }
    return *style;
}

const Style* Styles::findByName(const std::string& name) const {
    const std::string internal = uiToInternalName(name);
    for (const auto& style : styles_) {
        if (style->internalName() == internal) {
            return style.get();
        }
    }
    return nullptr;
}

const Style* Styles::findById(const std::string& style_id) const {
    for (const auto& style : styles_) {
        if (style->styleId() == style_id) {
            return style.get();
        }
    }
    return nullptr;
}

const Style* Styles::defaultStyle(StyleType type) const {
    const Style* result = nullptr;
    for (const auto& style : styles_) {
        if (style->type() == type && style->isDefault()) {
            result = style.get();
        }
    }
    return result;
}

const Style* Styles::getById(const std::optional<std::string>& style_id, StyleType type) const {
    if (!style_id) {
        return defaultStyle(type);
    }

    const Style* style = findById(*style_id);
    if (!style || style->type() != type) {
        STYLE_DEBUG("Style id '{}' not found as {} style, using default", *style_id, toString(type));
        return defaultStyle(type);
    }
    return style;
}

std::optional<std::string> Styles::getStyleId(const std::optional<std::string>& style_or_name, StyleType type) const {
    if (!style_or_name) {
        return std::nullopt;
    }

    const Style* style = findByName(*style_or_name);
    if (!style) {
        style = findById(*style_or_name);
    }
    if (!style) {
        FASTDOCX_THROW(core::StyleNotFoundException, *style_or_name);
    }
    return getStyleId(*style, type);
}

std::optional<std::string> Styles::getStyleId(const Style& style, StyleType type) const {
    if (style.type() != type) {
        std::string ref = style.name().empty() ? style.styleId() : style.name();
        FASTDOCX_THROW(core::WrongStyleTypeException, ref, toString(type), toString(style.type()));
    }

    const Style* default_style = defaultStyle(type);
    if (default_style && *default_style == style) {
        return std::nullopt;
    }
    return style.styleId();
}

const Style& Styles::addStyle(const std::string& name, StyleType type, bool builtin) {
    if (contains(name)) {
        FASTDOCX_THROW(core::ParameterException,
                       fmt::format("document already contains style '{}'", name), "name");
    }

    std::string style_id;
    for (char c : name) {
        if (c != ' ') style_id.push_back(c);
    }

    xml::XMLElement& element = root_.appendChild("w:style");
    element.setAttribute("w:type", toString(type));
    if (!builtin) {
        element.setAttribute("w:customStyle", "1");
    }
    element.setAttribute("w:styleId", style_id);

    styles_.push_back(std::make_unique<Style>(element));
    Style& style = *styles_.back();
    style.setName(name);

    STYLE_INFO("Added {} style '{}' (id {})", toString(type), name, style_id);
    return style;
}

std::vector<const Style*> Styles::styles() const {
    std::vector<const Style*> result;
    result.reserve(styles_.size());
    for (const auto& style : styles_) {
        result.push_back(style.get());
    }
    return result;
}

}} // namespace fastdocx::styles

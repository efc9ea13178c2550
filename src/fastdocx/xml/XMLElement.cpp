#include "fastdocx/xml/XMLElement.hpp"
#include "fastdocx/xml/XMLStreamWriter.hpp"
#include <algorithm>

namespace fastdocx {
namespace xml {

XMLElement::XMLElement(std::string name) : name_(std::move(name)) {}

std::string XMLElement::localName() const {
    size_t colon = name_.find(':');
    return colon == std::string::npos ? name_ : name_.substr(colon + 1);
}

std::string XMLElement::prefix() const {
    size_t colon = name_.find(':');
    return colon == std::string::npos ? std::string() : name_.substr(0, colon);
}

std::optional<std::string> XMLElement::attribute(const std::string& attr_name) const {
    for (const auto& [key, value] : attributes_) {
        if (key == attr_name) {
            return value;
        }
    }
    return std::nullopt;
}

std::string XMLElement::getAttribute(const std::string& attr_name, const std::string& default_value) const {
    auto value = attribute(attr_name);
    return value ? *value : default_value;
}

bool XMLElement::hasAttribute(const std::string& attr_name) const {
    return attribute(attr_name).has_value();
}

void XMLElement::setAttribute(const std::string& attr_name, const std::string& value) {
    for (auto& attr : attributes_) {
        if (attr.first == attr_name) {
            attr.second = value;
            return;
        }
    }
    attributes_.emplace_back(attr_name, value);
}

bool XMLElement::removeAttribute(const std::string& attr_name) {
    auto it = std::find_if(attributes_.begin(), attributes_.end(),
                           [&attr_name](const Attribute& attr) { return attr.first == attr_name; });
    if (it == attributes_.end()) {
        return false;
    }
    attributes_.erase(it);
    return true;
}

std::string XMLElement::innerText() const {
    std::string result = text_;
    for (const auto& child : children_) {
        result += child->innerText();
    }
    return result;
}

XMLElement* XMLElement::findChild(const std::string& element_name) const {
    for (const auto& child : children_) {
        if (child->name_ == element_name) {
            return child.get();
        }
    }
    return nullptr;
}

std::vector<XMLElement*> XMLElement::findChildren(const std::string& element_name) const {
    std::vector<XMLElement*> result;
    for (const auto& child : children_) {
        if (child->name_ == element_name) {
            result.push_back(child.get());
        }
    }
    return result;
}

XMLElement* XMLElement::findChildByPath(const std::string& path) const {
    if (path.empty()) return nullptr;

    size_t pos = path.find('/');
    if (pos == std::string::npos) {
        return findChild(path);
    }

    XMLElement* child = findChild(path.substr(0, pos));
    return child ? child->findChildByPath(path.substr(pos + 1)) : nullptr;
}

XMLElement& XMLElement::appendChild(const std::string& element_name) {
    return appendChild(std::make_unique<XMLElement>(element_name));
}

XMLElement& XMLElement::appendChild(std::unique_ptr<XMLElement> child) {
    child->parent_ = this;
    children_.push_back(std::move(child));
    return *children_.back();
}

XMLElement& XMLElement::insertChild(size_t index, const std::string& element_name) {
    auto child = std::make_unique<XMLElement>(element_name);
    child->parent_ = this;
    index = std::min(index, children_.size());
    auto it = children_.insert(children_.begin() + static_cast<std::ptrdiff_t>(index), std::move(child));
    return **it;
}

bool XMLElement::removeChild(const XMLElement* child) {
    auto it = std::find_if(children_.begin(), children_.end(),
                           [child](const std::unique_ptr<XMLElement>& ptr) { return ptr.get() == child; });
    if (it == children_.end()) {
        return false;
    }
    children_.erase(it);
    return true;
}

XMLElement& XMLElement::getOrAddChild(const std::string& element_name) {
    if (XMLElement* existing = findChild(element_name)) {
        return *existing;
    }
    return appendChild(element_name);
}

void XMLElement::forEachRecursive(const std::function<void(const XMLElement&, int)>& callback, int depth) const {
    callback(*this, depth);
    for (const auto& child : children_) {
        child->forEachRecursive(callback, depth + 1);
    }
}

std::vector<XMLElement*> XMLElement::findDescendants(const std::string& element_name) const {
    std::vector<XMLElement*> result;
    for (const auto& child : children_) {
        if (child->name_ == element_name) {
            result.push_back(child.get());
        }
        auto nested = child->findDescendants(element_name);
        result.insert(result.end(), nested.begin(), nested.end());
    }
    return result;
}

std::vector<std::string> XMLElement::collectAttributeValues(const std::string& attr_name) const {
    std::vector<std::string> values;
    forEachRecursive([&](const XMLElement& element, int) {
        if (auto value = element.attribute(attr_name)) {
            values.push_back(std::move(*value));
        }
    });
    return values;
}

void XMLElement::writeTo(XMLStreamWriter& writer) const {
    writer.startElement(name_);
    for (const auto& [key, value] : attributes_) {
        writer.writeAttribute(key, value);
    }
    writer.writeText(text_);
    for (const auto& child : children_) {
        child->writeTo(writer);
    }
    writer.endElement();
}

std::string XMLElement::toXML(bool with_declaration) const {
    XMLStreamWriter writer;
    if (with_declaration) {
        writer.startDocument("UTF-8", true);
    }
    writeTo(writer);
    writer.endDocument();
    return writer.toString();
}

}} // namespace fastdocx::xml

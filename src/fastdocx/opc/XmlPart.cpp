#include "fastdocx/opc/XmlPart.hpp"
#include "fastdocx/xml/XMLStreamReader.hpp"
#include "fastdocx/core/Exception.hpp"
#include <limits>
#include <fmt/format.h>

namespace fastdocx {
namespace opc {

namespace {

// 纯数字且不超出 int64 范围
bool parseDigits(const std::string& text, int64_t& out) {
    if (text.empty()) {
        return false;
    }
    int64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
        int digit = c - '0';
        if (value > (std::numeric_limits<int64_t>::max() - digit) / 10) {
            return false;
        }
        value = value * 10 + digit;
    }
    out = value;
    return true;
}

} // anonymous namespace

XmlPart::XmlPart(PackURI partname, std::string content_type,
                 std::unique_ptr<xml::XMLElement> element, Package* package)
    : Part(std::move(partname), std::move(content_type), {}, package),
      element_(std::move(element)) {
    if (!element_) {
        FASTDOCX_THROW(core::ParameterException, "XmlPart requires a root element", "element");
    }
}

std::unique_ptr<Part> XmlPart::load(const PackURI& partname, const std::string& content_type,
                                    const std::string& blob, Package* package) {
    return std::make_unique<XmlPart>(partname, content_type, parseXml(blob, partname.str()), package);
}

std::unique_ptr<xml::XMLElement> XmlPart::parseXml(const std::string& xml_content, const std::string& source) {
    xml::XMLStreamReader reader;
    auto root = reader.parseToDOM(xml_content);
    if (!root) {
        FASTDOCX_THROW(core::XMLException,
                       fmt::format("Failed to parse {}: {}", source, reader.getLastErrorMessage()),
                       source, -1);
    }
    return root;
}

std::string XmlPart::blob() const {
    return element_->toXML(true);
}

int64_t XmlPart::nextId() const {
    int64_t max_id = 0;
    bool found = false;

    for (const auto& value : element_->collectAttributeValues("id")) {
        int64_t id = 0;
        if (!parseDigits(value, id)) {
            continue;
        }
        if (!found || id > max_id) {
            max_id = id;
            found = true;
        }
    }

    if (!found) {
        return 1;
    }
    if (max_id == std::numeric_limits<int64_t>::max()) {
        FASTDOCX_THROW(core::OperationException,
                       fmt::format("Identifier space exhausted in {}", partname().str()),
                       "nextId", core::ErrorCode::InternalError);
    }
    return max_id + 1;
}

}} // namespace fastdocx::opc

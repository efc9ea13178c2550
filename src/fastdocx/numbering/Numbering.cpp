#include "fastdocx/numbering/Numbering.hpp"
#include "fastdocx/core/Exception.hpp"
#include "fastdocx/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <charconv>
#include <limits>

namespace fastdocx {
namespace numbering {

namespace {

std::optional<int> parseInt(const std::string& text) {
    int value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || first == last) {
        return std::nullopt;
    }
    return value;
}

} // anonymous namespace

size_t Numbering::numCount() const {
    return root_.findChildren("w:num").size();
}

std::vector<int> Numbering::numIds() const {
    std::vector<int> ids;
    for (xml::XMLElement* num : root_.findChildren("w:num")) {
        if (auto id = parseInt(num->getAttribute("w:numId"))) {
            ids.push_back(*id);
        }
    }
    return ids;
}

int Numbering::addNum(int abstract_num_id) {
    if (abstract_num_id < 0) {
        FASTDOCX_THROW(core::ParameterException, "abstractNumId must not be negative", "abstract_num_id");
    }

    std::vector<int> ids = numIds();
    int num_id = 1;
    if (!ids.empty()) {
        int max_id = *std::max_element(ids.begin(), ids.end());
        if (max_id == std::numeric_limits<int>::max()) {
            FASTDOCX_THROW(core::OperationException, "No numId left after INT_MAX",
                           "addNum", core::ErrorCode::InternalError);
        }
        num_id = max_id + 1;
    }

    // w:num 排在 w:abstractNum 之后、w:numIdMacAtCleanup 之前
    const auto& children = root_.children();
    size_t index = children.size();
    for (size_t i = 0; i < children.size(); ++i) {
        if (children[i]->name() == "w:numIdMacAtCleanup") {
            index = i;
            break;
        }
    }
    xml::XMLElement& num = root_.insertChild(index, "w:num");
    num.setAttribute("w:numId", std::to_string(num_id));
    num.appendChild("w:abstractNumId").setAttribute("w:val", std::to_string(abstract_num_id));

    PARTS_DEBUG("Added w:num {} -> abstractNum {}", num_id, abstract_num_id);
    return num_id;
}

bool Numbering::hasNum(int num_id) const {
    return findNum(num_id) != nullptr;
}

std::optional<int> Numbering::abstractNumIdOf(int num_id) const {
    xml::XMLElement* num = findNum(num_id);
    if (!num) {
        return std::nullopt;
    }
    xml::XMLElement* abstract_ref = num->findChild("w:abstractNumId");
    if (!abstract_ref) {
        return std::nullopt;
    }
    return parseInt(abstract_ref->getAttribute("w:val"));
}

xml::XMLElement* Numbering::findNum(int num_id) const {
    const std::string key = std::to_string(num_id);
    for (xml::XMLElement* num : root_.findChildren("w:num")) {
        if (num->getAttribute("w:numId") == key) {
            return num;
        }
    }
    return nullptr;
}

}} // namespace fastdocx::numbering

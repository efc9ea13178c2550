#include "fastdocx/opc/CoreProperties.hpp"
#include "fastdocx/core/Exception.hpp"
#include "fastdocx/utils/TimeUtils.hpp"
#include "fastdocx/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace fastdocx {
namespace opc {

void CoreProperties::setRevision(int value) {
    if (value <= 0) {
        FASTDOCX_THROW(core::ParameterException,
                       fmt::format("revision must be positive int, got {}", value), "revision");
    }
    revision_ = value;
}

void CoreProperties::setRevisionText(const std::string& text) {
    revision_ = 0;
    if (text.empty() || text.size() > 9) {
        return;
    }
    int value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            OPC_WARN("Ignoring malformed revision '{}'", text);
            return;
        }
        value = value * 10 + (c - '0');
    }
    revision_ = value;
}

void CoreProperties::validateDate(const std::string& value, const char* field) {
    if (!value.empty() && !utils::TimeUtils::isValidW3CDTF(value)) {
        FASTDOCX_THROW(core::ParameterException,
                       fmt::format("'{}' is not a W3CDTF date", value), field);
    }
}

void CoreProperties::setCreated(const std::string& w3cdtf) {
    validateDate(w3cdtf, "created");
    created_ = w3cdtf;
}

void CoreProperties::setModified(const std::string& w3cdtf) {
    validateDate(w3cdtf, "modified");
    modified_ = w3cdtf;
}

void CoreProperties::setLastPrinted(const std::string& w3cdtf) {
    validateDate(w3cdtf, "lastPrinted");
    last_printed_ = w3cdtf;
}

void CoreProperties::touchModified() {
    modified_ = utils::TimeUtils::nowW3CDTF();
}

}} // namespace fastdocx::opc

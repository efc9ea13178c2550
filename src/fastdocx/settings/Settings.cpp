#include "fastdocx/settings/Settings.hpp"
#include "fastdocx/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <iterator>

namespace fastdocx {
namespace settings {

namespace {

// CT_Settings 中排在 w:evenAndOddHeaders 之后的元素，按 schema 顺序
const char* const kEvenAndOddHeadersSuccessors[] = {
    "w:bookFoldRevPrinting", "w:bookFoldPrinting", "w:bookFoldPrintingSheets",
    "w:drawingGridHorizontalSpacing", "w:drawingGridVerticalSpacing",
    "w:displayHorizontalDrawingGridEvery", "w:displayVerticalDrawingGridEvery",
    "w:doNotUseMarginsForDrawingGridOrigin", "w:drawingGridHorizontalOrigin",
    "w:drawingGridVerticalOrigin", "w:doNotShadeFormData", "w:noPunctuationKerning",
    "w:characterSpacingControl", "w:printTwoOnOne", "w:strictFirstAndLastChars",
    "w:noLineBreaksAfter", "w:noLineBreaksBefore", "w:savePreviewPicture",
    "w:doNotValidateAgainstSchema", "w:saveInvalidXml", "w:ignoreMixedContent",
    "w:alwaysShowPlaceholderText", "w:doNotDemarcateInvalidXml", "w:saveXmlDataOnly",
    "w:useXSLTWhenSaving", "w:saveThroughXslt", "w:showXMLTags",
    "w:alwaysMergeEmptyNamespace", "w:updateFields", "w:hdrShapeDefaults",
    "w:footnotePr", "w:endnotePr", "w:compat", "w:docVars", "w:rsids",
    "m:mathPr", "w:attachedSchema", "w:themeFontLang", "w:clrSchemeMapping",
    "w:doNotIncludeSubdocsInStats", "w:doNotAutoCompressPictures",
    "w:forceUpgrade", "w:captions", "w:readModeInkLockDown", "w:smartTagType",
    "sl:schemaLibrary", "w:shapeDefaults", "w:doNotEmbedSmartTags",
    "w:decimalSymbol", "w:listSeparator",
};

bool isSuccessor(const std::string& name) {
    return std::find_if(std::begin(kEvenAndOddHeadersSuccessors), std::end(kEvenAndOddHeadersSuccessors),
                        [&name](const char* candidate) { return name == candidate; })
           != std::end(kEvenAndOddHeadersSuccessors);
}

bool isOn(const std::string& val) {
    return val.empty() || val == "1" || val == "true" || val == "on";
}

} // anonymous namespace

bool Settings::oddAndEvenPagesHeaderFooter() const {
    xml::XMLElement* flag = root_.findChild("w:evenAndOddHeaders");
    if (!flag) {
        return false;
    }
    return isOn(flag->getAttribute("w:val"));
}

void Settings::setOddAndEvenPagesHeaderFooter(bool value) {
    xml::XMLElement* existing = root_.findChild("w:evenAndOddHeaders");
    if (!value) {
        if (existing) {
            root_.removeChild(existing);
        }
        return;
    }
    if (existing) {
        existing->removeAttribute("w:val");
        return;
    }

    size_t index = root_.childCount();
    const auto& children = root_.children();
    for (size_t i = 0; i < children.size(); ++i) {
        if (isSuccessor(children[i]->name())) {
            index = i;
            break;
        }
    }
    root_.insertChild(index, "w:evenAndOddHeaders");
    PARTS_DEBUG("Enabled w:evenAndOddHeaders at child index {}", index);
}

}} // namespace fastdocx::settings

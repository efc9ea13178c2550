#include "fastdocx/parts/SettingsPart.hpp"
#include "fastdocx/opc/ContentTypes.hpp"

namespace fastdocx {
namespace parts {

namespace {

constexpr const char* kDefaultSettingsXml = R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>
<w:settings xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main" xmlns:m="http://schemas.openxmlformats.org/officeDocument/2006/math">
  <w:zoom w:percent="100"/>
  <w:defaultTabStop w:val="720"/>
  <w:characterSpacingControl w:val="doNotCompress"/>
  <w:compat>
    <w:compatSetting w:name="compatibilityMode" w:uri="http://schemas.microsoft.com/office/word" w:val="15"/>
  </w:compat>
  <m:mathPr>
    <m:mathFont m:val="Cambria Math"/>
  </m:mathPr>
  <w:themeFontLang w:val="en-US" w:eastAsia="zh-CN"/>
  <w:decimalSymbol w:val="."/>
  <w:listSeparator w:val=","/>
</w:settings>
)";

} // anonymous namespace

SettingsPart::SettingsPart(opc::PackURI partname, std::string content_type,
                           std::unique_ptr<xml::XMLElement> element, opc::Package* package)
    : XmlPart(std::move(partname), std::move(content_type), std::move(element), package) {
}

SettingsPart::~SettingsPart() = default;

std::unique_ptr<opc::Part> SettingsPart::load(const opc::PackURI& partname, const std::string& content_type,
                                              const std::string& blob, opc::Package* package) {
    return std::make_unique<SettingsPart>(partname, content_type, parseXml(blob, partname.str()), package);
}

std::unique_ptr<SettingsPart> SettingsPart::defaultPart(opc::Package& package) {
    return std::make_unique<SettingsPart>(opc::PackURI("/word/settings.xml"), opc::ct::kWmlSettings,
                                          parseXml(kDefaultSettingsXml, "default settings template"), &package);
}

settings::Settings& SettingsPart::settings() {
    if (!settings_) {
        settings_ = std::make_unique<settings::Settings>(element());
    }
    return *settings_;
}

}} // namespace fastdocx::parts

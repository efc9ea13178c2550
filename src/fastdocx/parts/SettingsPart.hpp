#pragma once

#include "fastdocx/opc/XmlPart.hpp"
#include "fastdocx/settings/Settings.hpp"
#include <memory>

namespace fastdocx {
namespace opc {
class Package;
}

namespace parts {

/**
 * @brief 文档设置部件（/word/settings.xml）
 */
class SettingsPart : public opc::XmlPart {
public:
    SettingsPart(opc::PackURI partname, std::string content_type,
                 std::unique_ptr<xml::XMLElement> element, opc::Package* package = nullptr);
    ~SettingsPart() override;

    static std::unique_ptr<opc::Part> load(const opc::PackURI& partname, const std::string& content_type,
                                           const std::string& blob, opc::Package* package);

    static std::unique_ptr<SettingsPart> defaultPart(opc::Package& package);

    settings::Settings& settings();

private:
    std::unique_ptr<settings::Settings> settings_;
};

}} // namespace fastdocx::parts

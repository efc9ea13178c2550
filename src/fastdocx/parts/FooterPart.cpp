#include "fastdocx/parts/FooterPart.hpp"
#include "fastdocx/parts/NumberingPart.hpp"
#include "fastdocx/parts/SettingsPart.hpp"
#include "fastdocx/parts/StylesPart.hpp"
#include "fastdocx/opc/ContentTypes.hpp"
#include "fastdocx/opc/Package.hpp"
#include "fastdocx/xml/Namespaces.hpp"
#include "fastdocx/core/Exception.hpp"
#include "fastdocx/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace fastdocx {
namespace parts {

namespace {

template<typename T>
T& expectKind(opc::Part& part, opc::RelationshipType type) {
    auto* typed = dynamic_cast<T*>(&part);
    if (!typed) {
        FASTDOCX_THROW(core::PackageException,
                       fmt::format("{} relationship targets a part of content type '{}'",
                                   opc::toString(type), part.contentType()),
                       part.partname().str(), core::ErrorCode::InvalidPackage);
    }
    return *typed;
}

// "/word/styles.xml" -> "/word/styles%d.xml"
std::string partnameTemplate(const opc::PackURI& partname) {
    std::string filename = partname.filename();
    std::string ext = partname.ext();
    std::string stem = ext.empty() ? filename : filename.substr(0, filename.size() - ext.size() - 1);
    std::string base = partname.baseURI();
    if (base != "/") {
        base += '/';
    }
    return ext.empty() ? base + stem + "%d" : base + stem + "%d." + ext;
}

// 默认部件名已被同类型部件占用时共用该部件，被其他类型占用时改用下一个空闲编号
opc::Part& adoptOrShare(opc::Package& package, std::unique_ptr<opc::Part> created) {
    opc::Part* existing = package.partByName(created->partname());
    if (existing) {
        if (existing->contentType() == created->contentType()) {
            PARTS_DEBUG("Sharing existing part {}", existing->partname().str());
            return *existing;
        }
        created->setPartname(package.nextPartname(partnameTemplate(created->partname())));
    }
    return package.adoptPart(std::move(created));
}

} // anonymous namespace

FooterPart::FooterPart(opc::PackURI partname, std::string content_type,
                       std::unique_ptr<xml::XMLElement> element, opc::Package* package)
    : XmlPart(std::move(partname), std::move(content_type), std::move(element), package) {
}

FooterPart::~FooterPart() = default;

std::unique_ptr<opc::Part> FooterPart::load(const opc::PackURI& partname, const std::string& content_type,
                                            const std::string& blob, opc::Package* package) {
    return std::make_unique<FooterPart>(partname, content_type, parseXml(blob, partname.str()), package);
}

FooterPart& FooterPart::newPart(opc::Package& package) {
    auto root = std::make_unique<xml::XMLElement>("w:ftr");
    root->setAttribute("xmlns:w", xml::ns::kW);
    root->setAttribute("xmlns:r", xml::ns::kR);
    root->appendChild("w:p").appendChild("w:pPr").appendChild("w:pStyle").setAttribute("w:val", "Footer");

    auto part = std::make_unique<FooterPart>(package.nextPartname("/word/footer%d.xml"),
                                             opc::ct::kWmlFooter, std::move(root), &package);
    auto& adopted = static_cast<FooterPart&>(package.adoptPart(std::move(part)));
    PARTS_INFO("Created footer part {}", adopted.partname().str());
    return adopted;
}

opc::CoreProperties& FooterPart::coreProperties() {
    return requirePackage().coreProperties();
}

void FooterPart::save(const std::string& path) {
    requirePackage().save(path);
}

document::Footer FooterPart::footer() {
    return document::Footer(element(), *this);
}

styles::Styles& FooterPart::styles() {
    return stylesPart().styles();
}

NumberingPart& FooterPart::numberingPart() {
    if (!numbering_part_) {
        numbering_part_ = &expectKind<NumberingPart>(resolvePart(opc::RelationshipType::Numbering),
                                                     opc::RelationshipType::Numbering);
    }
    return *numbering_part_;
}

settings::Settings& FooterPart::settings() {
    return settingsPart().settings();
}

const styles::Style* FooterPart::getStyle(const std::optional<std::string>& style_id, styles::StyleType type) {
    return styles().getById(style_id, type);
}

std::optional<std::string> FooterPart::getStyleId(const std::optional<std::string>& style_or_name,
                                                  styles::StyleType type) {
    return styles().getStyleId(style_or_name, type);
}

std::optional<std::string> FooterPart::getStyleId(const styles::Style& style, styles::StyleType type) {
    return styles().getStyleId(style, type);
}

StylesPart& FooterPart::stylesPart() {
    if (!styles_part_) {
        styles_part_ = &expectKind<StylesPart>(resolvePart(opc::RelationshipType::Styles),
                                               opc::RelationshipType::Styles);
    }
    return *styles_part_;
}

SettingsPart& FooterPart::settingsPart() {
    if (!settings_part_) {
        settings_part_ = &expectKind<SettingsPart>(resolvePart(opc::RelationshipType::Settings),
                                                   opc::RelationshipType::Settings);
    }
    return *settings_part_;
}

opc::Part& FooterPart::resolvePart(opc::RelationshipType type) {
    auto related = partRelatedBy(type);
    if (related) {
        PARTS_DEBUG("{}: {} relationship resolved to {}", partname().str(), opc::toString(type),
                    (*related)->partname().str());
        return **related;
    }
    if (related.error().code != core::ErrorCode::RelationshipNotFound) {
        core::throwError(related.error());
    }

    opc::Package& package = requirePackage();
    std::unique_ptr<opc::Part> created;
    switch (type) {
        case opc::RelationshipType::Styles:
            created = StylesPart::defaultPart(package);
            break;
        case opc::RelationshipType::Numbering:
            created = NumberingPart::newPart();
            break;
        case opc::RelationshipType::Settings:
            created = SettingsPart::defaultPart(package);
            break;
        default:
            FASTDOCX_THROW(core::ParameterException,
                           fmt::format("No default part for {} relationship", opc::toString(type)), "type");
    }

    opc::Part& target = adoptOrShare(package, std::move(created));
    std::string rId = relateTo(target, type);
    PARTS_INFO("{}: created {} relationship {} -> {}", partname().str(), opc::toString(type), rId,
               target.partname().str());
    return target;
}

}} // namespace fastdocx::parts

#include "fastdocx/parts/CorePropertiesPart.hpp"
#include "fastdocx/opc/ContentTypes.hpp"
#include "fastdocx/reader/CorePropertiesParser.hpp"
#include "fastdocx/xml/XMLStreamWriter.hpp"
#include "fastdocx/xml/Namespaces.hpp"
#include "fastdocx/core/Exception.hpp"
#include "fastdocx/utils/ModuleLoggers.hpp"
#include "fastdocx/utils/TimeUtils.hpp"
#include <fmt/format.h>

namespace fastdocx {
namespace parts {

namespace {

constexpr const char* kCorePropsPartname = "/docProps/core.xml";

void writeTextElement(xml::XMLStreamWriter& writer, const char* name, const std::string& value) {
    if (value.empty()) {
        return;
    }
    writer.startElement(name);
    writer.writeText(value);
    writer.endElement();
}

void writeDateElement(xml::XMLStreamWriter& writer, const char* name, const std::string& value) {
    if (value.empty()) {
        return;
    }
    writer.startElement(name);
    writer.writeAttribute("xsi:type", "dcterms:W3CDTF");
    writer.writeText(value);
    writer.endElement();
}

// 文件中的日期不合法时丢弃该字段，不让整个包加载失败
void applyDate(const std::string& value, const char* field, const std::string& partname,
               void (opc::CoreProperties::*setter)(const std::string&), opc::CoreProperties& props) {
    if (value.empty()) {
        return;
    }
    if (!utils::TimeUtils::isValidW3CDTF(value)) {
        PARTS_WARN("Dropping malformed {} '{}' in {}", field, value, partname);
        return;
    }
    (props.*setter)(value);
}

} // anonymous namespace

CorePropertiesPart::CorePropertiesPart(opc::PackURI partname, std::string content_type,
                                       opc::CoreProperties properties, opc::Package* package)
    : Part(std::move(partname), std::move(content_type), {}, package),
      properties_(std::move(properties)) {
}

std::unique_ptr<opc::Part> CorePropertiesPart::load(const opc::PackURI& partname, const std::string& content_type,
                                                    const std::string& blob, opc::Package* package) {
    reader::CorePropertiesParser parser;
    if (!parser.parse(blob)) {
        FASTDOCX_THROW(core::XMLException,
                       fmt::format("Failed to parse {}: {}", partname.str(), parser.getErrorMessage()),
                       partname.str(), -1);
    }

    reader::CorePropsInfo info = parser.takeCoreProps();
    opc::CoreProperties props;
    props.setTitle(info.title);
    props.setSubject(info.subject);
    props.setAuthor(info.creator);
    props.setKeywords(info.keywords);
    props.setComments(info.description);
    props.setLastModifiedBy(info.last_modified_by);
    props.setCategory(info.category);
    props.setContentStatus(info.content_status);
    props.setIdentifier(info.identifier);
    props.setLanguage(info.language);
    props.setVersion(info.version);
    props.setRevisionText(info.revision);
    applyDate(info.created, "created", partname.str(), &opc::CoreProperties::setCreated, props);
    applyDate(info.modified, "modified", partname.str(), &opc::CoreProperties::setModified, props);
    applyDate(info.last_printed, "lastPrinted", partname.str(), &opc::CoreProperties::setLastPrinted, props);

    PARTS_DEBUG("Loaded core properties from {}", partname.str());
    return std::make_unique<CorePropertiesPart>(partname, content_type, std::move(props), package);
}

std::unique_ptr<CorePropertiesPart> CorePropertiesPart::defaultPart(opc::Package& package) {
    opc::CoreProperties props;
    props.setTitle("Word Document");
    props.setLastModifiedBy("fastdocx");
    props.setRevision(1);
    props.touchModified();
    return std::make_unique<CorePropertiesPart>(opc::PackURI(kCorePropsPartname), opc::ct::kCoreProperties,
                                                std::move(props), &package);
}

std::string CorePropertiesPart::blob() const {
    const opc::CoreProperties& props = properties_;

    xml::XMLStreamWriter writer;
    writer.startDocument("UTF-8", true);

    writer.startElement("cp:coreProperties");
    writer.writeAttribute("xmlns:cp", xml::ns::kCp);
    writer.writeAttribute("xmlns:dc", xml::ns::kDc);
    writer.writeAttribute("xmlns:dcterms", xml::ns::kDcTerms);
    writer.writeAttribute("xmlns:dcmitype", xml::ns::kDcmiType);
    writer.writeAttribute("xmlns:xsi", xml::ns::kXsi);

    writeTextElement(writer, "dc:title", props.title());
    writeTextElement(writer, "dc:subject", props.subject());
    writeTextElement(writer, "dc:creator", props.author());
    writeTextElement(writer, "cp:keywords", props.keywords());
    writeTextElement(writer, "dc:description", props.comments());
    writeTextElement(writer, "cp:lastModifiedBy", props.lastModifiedBy());
    if (props.revision() > 0) {
        writeTextElement(writer, "cp:revision", std::to_string(props.revision()));
    }
    writeDateElement(writer, "dcterms:created", props.created());
    writeDateElement(writer, "dcterms:modified", props.modified());
    // cp:lastPrinted 不带 xsi:type
    writeTextElement(writer, "cp:lastPrinted", props.lastPrinted());
    writeTextElement(writer, "cp:category", props.category());
    writeTextElement(writer, "cp:contentStatus", props.contentStatus());
    writeTextElement(writer, "dc:identifier", props.identifier());
    writeTextElement(writer, "dc:language", props.language());
    writeTextElement(writer, "cp:version", props.version());

    writer.endElement(); // cp:coreProperties
    return writer.takeResult();
}

}} // namespace fastdocx::parts

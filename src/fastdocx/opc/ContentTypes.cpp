#include "fastdocx/opc/ContentTypes.hpp"
#include "fastdocx/opc/Part.hpp"
#include "fastdocx/xml/Namespaces.hpp"
#include "fastdocx/xml/XMLStreamWriter.hpp"
#include <algorithm>
#include <cctype>

namespace fastdocx {
namespace opc {

const char* ContentTypes::defaultContentTypeFor(const std::string& extension) {
    std::string ext = extension;
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == "rels") return ct::kRelationships;
    if (ext == "xml") return ct::kXml;
    if (ext == "png") return ct::kPng;
    if (ext == "jpeg" || ext == "jpg") return ct::kJpeg;
    if (ext == "gif") return ct::kGif;
    return nullptr;
}

ContentTypes ContentTypes::fromParts(const std::vector<const Part*>& parts) {
    ContentTypes types;
    types.addDefault("rels", ct::kRelationships);
    types.addDefault("xml", ct::kXml);

    for (const Part* part : parts) {
        const std::string ext = part->partname().ext();
        const char* default_type = defaultContentTypeFor(ext);

        if (default_type && part->contentType() == default_type) {
            types.addDefault(ext, default_type);
        } else {
            types.addOverride(part->partname().str(), part->contentType());
        }
    }
    return types;
}

void ContentTypes::addDefault(const std::string& extension, const std::string& content_type) {
    for (const auto& def : default_types_) {
        if (def.extension == extension) return;
    }
    default_types_.push_back({extension, content_type});
}

void ContentTypes::addOverride(const std::string& part_name, const std::string& content_type) {
    for (auto& over : override_types_) {
        if (over.part_name == part_name) {
            over.content_type = content_type;
            return;
        }
    }
    override_types_.push_back({part_name, content_type});
}

std::string ContentTypes::toXML() const {
    xml::XMLStreamWriter writer;
    writer.startDocument("UTF-8", true);
    writer.startElement("Types");
    writer.writeAttribute("xmlns", xml::ns::kContentTypes);

    for (const auto& def : default_types_) {
        writer.startElement("Default");
        writer.writeAttribute("Extension", def.extension);
        writer.writeAttribute("ContentType", def.content_type);
        writer.endElement();
    }

    for (const auto& over : override_types_) {
        writer.startElement("Override");
        writer.writeAttribute("PartName", over.part_name);
        writer.writeAttribute("ContentType", over.content_type);
        writer.endElement();
    }

    writer.endElement();
    return writer.takeResult();
}

}} // namespace fastdocx::opc

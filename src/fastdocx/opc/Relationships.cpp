#include "fastdocx/opc/Relationships.hpp"
#include "fastdocx/opc/Part.hpp"
#include "fastdocx/core/Exception.hpp"
#include "fastdocx/xml/Namespaces.hpp"
#include "fastdocx/xml/XMLStreamWriter.hpp"
#include "fastdocx/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace fastdocx {
namespace opc {

std::string Relationship::targetRef(const std::string& base_uri) const {
    if (is_external || !target_part) {
        return target_ref;
    }
    return target_part->partname().relativeRef(base_uri);
}

const Relationship& Relationships::add(const std::string& rId, const std::string& type_uri, Part& target) {
    if (find(rId)) {
        FASTDOCX_THROW(core::PackageException, fmt::format("Duplicate relationship id '{}'", rId),
                       target.partname().str(), core::ErrorCode::InvalidPackage);
    }

    Relationship rel;
    rel.rId = rId;
    rel.type = relationshipTypeFromUri(type_uri);
    rel.type_uri = type_uri;
    rel.target_part = &target;
    relationships_.push_back(std::move(rel));
    return relationships_.back();
}

const Relationship& Relationships::addExternal(const std::string& rId, const std::string& type_uri, const std::string& url) {
    if (find(rId)) {
        FASTDOCX_THROW(core::PackageException, fmt::format("Duplicate relationship id '{}'", rId),
                       url, core::ErrorCode::InvalidPackage);
    }

    Relationship rel;
    rel.rId = rId;
    rel.type = relationshipTypeFromUri(type_uri);
    rel.type_uri = type_uri;
    rel.target_ref = url;
    rel.is_external = true;
    relationships_.push_back(std::move(rel));
    return relationships_.back();
}

std::string Relationships::getOrAdd(RelationshipType type, Part& target) {
    for (const auto& rel : relationships_) {
        if (!rel.is_external && rel.type == type && rel.target_part == &target) {
            return rel.rId;
        }
    }

    std::string rId = nextRId();
    add(rId, toUri(type), target);
    OPC_DEBUG("Added relationship {} ({}) -> {}", rId, toString(type), target.partname().str());
    return rId;
}

std::string Relationships::getOrAddExternal(RelationshipType type, const std::string& url) {
    for (const auto& rel : relationships_) {
        if (rel.is_external && rel.type == type && rel.target_ref == url) {
            return rel.rId;
        }
    }

    std::string rId = nextRId();
    addExternal(rId, toUri(type), url);
    return rId;
}

core::Result<Part*> Relationships::partWithType(RelationshipType type) const {
    Part* found = nullptr;
    size_t count = 0;
    for (const auto& rel : relationships_) {
        if (!rel.is_external && rel.type == type) {
            found = rel.target_part;
            ++count;
        }
    }

    if (count == 0) {
        return core::makeError(core::ErrorCode::RelationshipNotFound,
                               fmt::format("no relationship of type '{}'", toString(type)));
    }
    if (count > 1) {
        return core::makeError(core::ErrorCode::InvalidPackage,
                               fmt::format("multiple relationships of type '{}'", toString(type)));
    }
    return found;
}

const Relationship* Relationships::find(const std::string& rId) const {
    for (const auto& rel : relationships_) {
        if (rel.rId == rId) return &rel;
    }
    return nullptr;
}

std::vector<const Relationship*> Relationships::byType(RelationshipType type) const {
    std::vector<const Relationship*> result;
    for (const auto& rel : relationships_) {
        if (rel.type == type) result.push_back(&rel);
    }
    return result;
}

std::string Relationships::nextRId() const {
    for (size_t n = 1; n <= relationships_.size() + 1; ++n) {
        std::string candidate = fmt::format("rId{}", n);
        if (!find(candidate)) {
            return candidate;
        }
    }
    // 上面的循环必然命中：n 个关系最多占用 n 个编号
    return fmt::format("rId{}", relationships_.size() + 1);
}

std::string Relationships::toXML(const std::string& base_uri) const {
    xml::XMLStreamWriter writer;
    writer.startDocument("UTF-8", true);
    writer.startElement("Relationships");
    writer.writeAttribute("xmlns", xml::ns::kPackageRelationships);

    for (const auto& rel : relationships_) {
        writer.startElement("Relationship");
        writer.writeAttribute("Id", rel.rId);
        writer.writeAttribute("Type", rel.type_uri);
        writer.writeAttribute("Target", rel.targetRef(base_uri));
        if (rel.is_external) {
            writer.writeAttribute("TargetMode", "External");
        }
        writer.endElement();
    }

    writer.endElement();
    return writer.takeResult();
}

}} // namespace fastdocx::opc

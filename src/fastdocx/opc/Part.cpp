#include "fastdocx/opc/Part.hpp"
#include "fastdocx/core/Exception.hpp"
#include <fmt/format.h>

namespace fastdocx {
namespace opc {

Part::Part(PackURI partname, std::string content_type, std::string blob, Package* package)
    : partname_(std::move(partname)),
      content_type_(std::move(content_type)),
      blob_(std::move(blob)),
      package_(package) {}

std::string Part::relateTo(Part& target, RelationshipType type) {
    return rels_.getOrAdd(type, target);
}

std::string Part::relateToExternal(const std::string& url, RelationshipType type) {
    return rels_.getOrAddExternal(type, url);
}

core::Result<Part*> Part::partRelatedBy(RelationshipType type) const {
    return rels_.partWithType(type);
}

Part* Part::relatedPart(const std::string& rId) const {
    const Relationship* rel = rels_.find(rId);
    return rel && !rel->is_external ? rel->target_part : nullptr;
}

std::string Part::targetRef(const std::string& rId) const {
    const Relationship* rel = rels_.find(rId);
    if (!rel) {
        FASTDOCX_THROW(core::PackageException, fmt::format("No relationship with id '{}'", rId),
                       partname_.str(), core::ErrorCode::RelationshipNotFound);
    }
    return rel->targetRef(partname_.baseURI());
}

Package& Part::requirePackage() const {
    if (!package_) {
        FASTDOCX_THROW(core::OperationException,
                       fmt::format("Part {} does not belong to a package", partname_.str()),
                       "requirePackage", core::ErrorCode::InvalidPackage);
    }
    return *package_;
}

}} // namespace fastdocx::opc

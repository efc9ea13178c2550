#include "fastdocx/reader/RelationshipsParser.hpp"

namespace fastdocx {
namespace reader {

void RelationshipsParser::onStartElement(std::string_view name, core::span<const xml::XMLAttribute> attributes, int /*depth*/) {
    if (name != "Relationship") {
        return;
    }

    auto id = findAttribute(attributes, "Id");
    auto type = findAttribute(attributes, "Type");
    auto target = findAttribute(attributes, "Target");
    auto target_mode = findAttribute(attributes, "TargetMode");

    if (!id || !type || !target || id->empty() || type->empty() || target->empty()) {
        READER_WARN("Skipping incomplete relationship: id='{}', type='{}', target='{}'",
                    id ? *id : "", type ? *type : "", target ? *target : "");
        return;
    }

    if (id_index_.count(*id) != 0) {
        setError("Duplicate relationship id: " + *id);
        return;
    }

    Relationship rel;
    rel.id = std::move(*id);
    rel.type = std::move(*type);
    rel.target = std::move(*target);
    if (target_mode) {
        rel.target_mode = std::move(*target_mode);
    }

    READER_DEBUG("Parsed relationship: {} -> {} ({})", rel.id, rel.target, rel.type);
    id_index_[rel.id] = relationships_.size();
    relationships_.push_back(std::move(rel));
}

void RelationshipsParser::onEndElement(std::string_view /*name*/, int /*depth*/) {
}

const RelationshipsParser::Relationship* RelationshipsParser::findById(const std::string& id) const {
    auto it = id_index_.find(id);
    return it != id_index_.end() ? &relationships_[it->second] : nullptr;
}

std::vector<const RelationshipsParser::Relationship*> RelationshipsParser::findByType(const std::string& type) const {
    std::vector<const Relationship*> result;
    for (const auto& rel : relationships_) {
        if (rel.type == type) {
            result.push_back(&rel);
        }
    }
    return result;
}

}} // namespace fastdocx::reader

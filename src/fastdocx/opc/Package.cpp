#include "fastdocx/opc/Package.hpp"
#include "fastdocx/opc/ContentTypes.hpp"
#include "fastdocx/opc/PartFactory.hpp"
#include "fastdocx/parts/CorePropertiesPart.hpp"
#include "fastdocx/archive/ZipReader.hpp"
#include "fastdocx/archive/ZipWriter.hpp"
#include "fastdocx/reader/ContentTypesParser.hpp"
#include "fastdocx/reader/RelationshipsParser.hpp"
#include "fastdocx/core/Exception.hpp"
#include "fastdocx/utils/ModuleLoggers.hpp"
#include <deque>
#include <unordered_set>
#include <fmt/format.h>

namespace fastdocx {
namespace opc {

namespace {

constexpr const char* kContentTypesMember = "[Content_Types].xml";
constexpr const char* kPackageRelsMember = "_rels/.rels";

std::string readMember(archive::ZipReader& zip, const std::string& member) {
    std::string content;
    archive::ZipError err = zip.extractFile(member, content);
    if (err != archive::ZipError::Ok) {
        FASTDOCX_THROW(core::FileException,
                       fmt::format("Failed to read '{}' from package: {}", member, archive::toString(err)),
                       zip.path(), core::ErrorCode::FileReadError);
    }
    return content;
}

} // anonymous namespace

Package::Package() = default;
Package::~Package() = default;

std::unique_ptr<Package> Package::open(const std::string& path) {
    auto package = std::make_unique<Package>();
    package->loadFromZip(path);
    OPC_INFO("Opened package {} ({} parts)", path, package->parts_.size());
    return package;
}

std::unique_ptr<Package> Package::create() {
    return std::make_unique<Package>();
}

void Package::loadFromZip(const std::string& path) {
    archive::ZipReader zip(path);
    if (!zip.open()) {
        FASTDOCX_THROW(core::FileException, fmt::format("Cannot open package '{}'", path),
                       path, core::ErrorCode::FileNotFound);
    }

    if (zip.fileExists(kContentTypesMember) != archive::ZipError::Ok) {
        FASTDOCX_THROW(core::PackageException, fmt::format("'{}' has no [Content_Types].xml", path),
                       kContentTypesMember, core::ErrorCode::InvalidPackage);
    }
    if (zip.fileExists(kPackageRelsMember) != archive::ZipError::Ok) {
        FASTDOCX_THROW(core::PackageException, fmt::format("'{}' has no package relationships", path),
                       kPackageRelsMember, core::ErrorCode::InvalidPackage);
    }

    reader::ContentTypesParser content_types;
    if (!content_types.parse(readMember(zip, kContentTypesMember))) {
        FASTDOCX_THROW(core::XMLException, "Malformed [Content_Types].xml: " + content_types.getErrorMessage(),
                       kContentTypesMember, -1);
    }

    struct PendingRels {
        Part* source;          // nullptr 表示包本身
        std::string base_uri;
        std::string member;
    };

    std::deque<PendingRels> queue;
    queue.push_back({nullptr, "/", kPackageRelsMember});

    while (!queue.empty()) {
        PendingRels pending = std::move(queue.front());
        queue.pop_front();

        if (zip.fileExists(pending.member) != archive::ZipError::Ok) {
            continue;
        }

        reader::RelationshipsParser parser;
        if (!parser.parse(readMember(zip, pending.member))) {
            FASTDOCX_THROW(core::XMLException,
                           fmt::format("Malformed relationships '{}': {}", pending.member, parser.getErrorMessage()),
                           pending.member, -1);
        }

        Relationships& source_rels = pending.source ? pending.source->rels() : rels_;

        for (const auto& rel : parser.getRelationships()) {
            if (rel.isExternal()) {
                source_rels.addExternal(rel.id, rel.type, rel.target);
                continue;
            }

            PackURI target_uri = PackURI::fromRelRef(pending.base_uri, rel.target);
            Part* target = partByName(target_uri);

            if (!target) {
                const std::string member = target_uri.membername();
                if (zip.fileExists(member) != archive::ZipError::Ok) {
                    OPC_WARN("Dropping relationship {} in {}: target '{}' is missing",
                             rel.id, pending.member, target_uri.str());
                    continue;
                }

                std::string content_type = content_types.getContentType(target_uri.str());
                if (content_type.empty()) {
                    FASTDOCX_THROW(core::PackageException,
                                   fmt::format("No content type for part '{}'", target_uri.str()),
                                   target_uri.str(), core::ErrorCode::InvalidPackage);
                }

                target = &adoptPart(PartFactory::create(target_uri, content_type, readMember(zip, member), this));
                OPC_DEBUG("Loaded part {} ({})", target_uri.str(), content_type);

                queue.push_back({target, target_uri.baseURI(), target_uri.relsUri().membername()});
            }

            source_rels.add(rel.id, rel.type, *target);
        }
    }
}

void Package::save(const std::string& path) const {
    std::vector<Part*> parts = reachableParts();
    std::vector<const Part*> const_parts(parts.begin(), parts.end());
    ContentTypes content_types = ContentTypes::fromParts(const_parts);

    archive::ZipWriter zip(path);
    if (!zip.open()) {
        FASTDOCX_THROW(core::FileException, fmt::format("Cannot create package file '{}'", path),
                       path, core::ErrorCode::FileWriteError);
    }

    auto write = [&zip, &path](const std::string& member, const std::string& data) {
        archive::ZipError err = zip.addFile(member, data);
        if (err != archive::ZipError::Ok) {
            FASTDOCX_THROW(core::FileException,
                           fmt::format("Failed to write '{}' to {}: {}", member, path, archive::toString(err)),
                           path, core::ErrorCode::FileWriteError);
        }
    };

    write(kContentTypesMember, content_types.toXML());
    write(kPackageRelsMember, rels_.toXML("/"));

    for (const Part* part : parts) {
        write(part->partname().membername(), part->blob());
        if (!part->rels().empty()) {
            write(part->partname().relsUri().membername(), part->rels().toXML(part->partname().baseURI()));
        }
    }

    if (!zip.close()) {
        FASTDOCX_THROW(core::FileException, fmt::format("Failed to finalize package '{}'", path),
                       path, core::ErrorCode::FileWriteError);
    }

    if (parts.size() != parts_.size()) {
        OPC_DEBUG("Skipped {} unreachable part(s)", parts_.size() - parts.size());
    }
    OPC_INFO("Saved package {} ({} parts)", path, parts.size());
}

Part& Package::adoptPart(std::unique_ptr<Part> part) {
    if (!part) {
        FASTDOCX_THROW(core::ParameterException, "Cannot adopt a null part", "part");
    }

    Part* existing = partByName(part->partname());
    if (existing) {
        if (existing == part.get()) {
            return *existing;
        }
        FASTDOCX_THROW(core::PackageException,
                       fmt::format("Partname '{}' is already in use", part->partname().str()),
                       part->partname().str(), core::ErrorCode::InvalidPartName);
    }

    part->setPackage(this);
    parts_.push_back(std::move(part));
    return *parts_.back();
}

std::vector<Part*> Package::parts() const {
    std::vector<Part*> result;
    result.reserve(parts_.size());
    for (const auto& part : parts_) {
        result.push_back(part.get());
    }
    return result;
}

std::vector<Part*> Package::reachableParts() const {
    std::vector<Part*> result;
    std::unordered_set<const Part*> visited;
    std::deque<const Relationships*> queue{&rels_};

    while (!queue.empty()) {
        const Relationships* rels = queue.front();
        queue.pop_front();

        for (const auto& rel : *rels) {
            if (rel.is_external || !rel.target_part) {
                continue;
            }
            if (!visited.insert(rel.target_part).second) {
                continue;
            }
            result.push_back(rel.target_part);
            queue.push_back(&rel.target_part->rels());
        }
    }
    return result;
}

Part* Package::partByName(const PackURI& partname) const {
    for (const auto& part : parts_) {
        if (part->partname() == partname) {
            return part.get();
        }
    }
    return nullptr;
}

PackURI Package::nextPartname(const std::string& tmpl) const {
    size_t placeholder = tmpl.find("%d");
    if (placeholder == std::string::npos) {
        FASTDOCX_THROW(core::ParameterException,
                       fmt::format("Partname template '{}' has no %d placeholder", tmpl), "tmpl");
    }

    for (size_t n = 1; n <= parts_.size() + 1; ++n) {
        std::string candidate = tmpl;
        candidate.replace(placeholder, 2, std::to_string(n));
        PackURI uri(candidate);
        if (!partByName(uri)) {
            return uri;
        }
    }
    // n 个部件最多占用 n 个编号，不会走到这里
    FASTDOCX_THROW(core::OperationException, "No free partname", "nextPartname", core::ErrorCode::InternalError);
}

std::string Package::relateTo(Part& target, RelationshipType type) {
    return rels_.getOrAdd(type, target);
}

core::Result<Part*> Package::partRelatedBy(RelationshipType type) const {
    return rels_.partWithType(type);
}

Part* Package::mainDocumentPart() const {
    auto related = rels_.partWithType(RelationshipType::OfficeDocument);
    return related ? *related : nullptr;
}

CoreProperties& Package::coreProperties() {
    auto related = partRelatedBy(RelationshipType::CoreProperties);

    if (related) {
        auto* core_part = dynamic_cast<parts::CorePropertiesPart*>(*related);
        if (!core_part) {
            FASTDOCX_THROW(core::PackageException,
                           "core-properties relationship does not target a core-properties part",
                           (*related)->partname().str(), core::ErrorCode::InvalidPackage);
        }
        return core_part->coreProperties();
    }

    if (related.error().code != core::ErrorCode::RelationshipNotFound) {
        core::throwError(related.error());
    }

    auto created = parts::CorePropertiesPart::defaultPart(*this);
    auto& core_part = static_cast<parts::CorePropertiesPart&>(adoptPart(std::move(created)));
    relateTo(core_part, RelationshipType::CoreProperties);
    OPC_INFO("Created default core properties part {}", core_part.partname().str());
    return core_part.coreProperties();
}

}} // namespace fastdocx::opc

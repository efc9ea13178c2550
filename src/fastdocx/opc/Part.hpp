#pragma once

#include "fastdocx/opc/PackURI.hpp"
#include "fastdocx/opc/Relationships.hpp"
#include "fastdocx/core/Expected.hpp"
#include <string>

namespace fastdocx {
namespace opc {

class Package;

/**
 * @brief 包中的一个部件
 *
 * 基类直接保存二进制内容（图片等）；XML 部件见 XmlPart。
 * 部件由 Package 拥有，package_ 是不拥有的回指针，
 * 未被任何包收养的部件为 nullptr。
 */
class Part {
public:
    Part(PackURI partname, std::string content_type, std::string blob = {}, Package* package = nullptr);
    virtual ~Part() = default;

    Part(const Part&) = delete;
    Part& operator=(const Part&) = delete;

    const PackURI& partname() const { return partname_; }
    void setPartname(PackURI partname) { partname_ = std::move(partname); }

    const std::string& contentType() const { return content_type_; }

    /**
     * @brief 写入包时的字节内容
     */
    virtual std::string blob() const { return blob_; }

    Package* package() const { return package_; }
    void setPackage(Package* package) { package_ = package; }

    Relationships& rels() { return rels_; }
    const Relationships& rels() const { return rels_; }

    /**
     * @brief 建立到 target 的内部关系，已存在相同关系时返回原 rId
     */
    std::string relateTo(Part& target, RelationshipType type);

    std::string relateToExternal(const std::string& url, RelationshipType type);

    /**
     * @brief 唯一一条 type 关系的目标部件
     * @return RelationshipNotFound / InvalidPackage 错误，或目标部件
     */
    core::Result<Part*> partRelatedBy(RelationshipType type) const;

    /**
     * @brief 按 rId 取内部关系的目标，不存在或为外部关系时返回 nullptr
     */
    Part* relatedPart(const std::string& rId) const;

    std::string targetRef(const std::string& rId) const;

protected:
    /**
     * @brief 取所属包，部件尚未被收养时抛出 OperationException
     */
    Package& requirePackage() const;

private:
    PackURI partname_;
    std::string content_type_;
    std::string blob_;
    Package* package_;
    Relationships rels_;
};

}} // namespace fastdocx::opc

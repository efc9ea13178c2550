#pragma once

#include "fastdocx/opc/Part.hpp"
#include "fastdocx/opc/PackURI.hpp"
#include "fastdocx/opc/Relationships.hpp"
#include "fastdocx/opc/CoreProperties.hpp"
#include "fastdocx/core/Expected.hpp"
#include <memory>
#include <string>
#include <vector>

namespace fastdocx {
namespace opc {

/**
 * @brief OPC 包：拥有全部部件，维护包级关系，负责读写 ZIP 容器
 *
 * 部件以 unique_ptr 保存，地址在包的生命周期内稳定，
 * 关系与部件之间用裸指针互相引用。
 */
class Package {
public:
    Package();
    ~Package();

    Package(const Package&) = delete;
    Package& operator=(const Package&) = delete;

    /**
     * @brief 打开 .docx 等 OPC 包
     *
     * 从 _rels/.rels 开始按广度优先加载所有内部目标，每个部件只加载一次，
     * 关系保留原始 rId。指向不存在成员的关系会被丢弃并记录警告。
     * @throws core::FileException 文件无法打开
     * @throws core::PackageException 缺少 [Content_Types].xml / _rels/.rels 等结构错误
     * @throws core::XMLException 部件XML不合法
     */
    static std::unique_ptr<Package> open(const std::string& path);

    static std::unique_ptr<Package> create();

    /**
     * @brief 写出从包关系可达的全部部件
     * @throws core::FileException 写入失败
     */
    void save(const std::string& path) const;

    // ========== 部件管理 ==========

    /**
     * @brief 收养部件，设置其 package 回指针
     * @throws core::PackageException 部件名已被占用
     */
    Part& adoptPart(std::unique_ptr<Part> part);

    /**
     * @brief 按收养顺序返回全部部件
     */
    std::vector<Part*> parts() const;

    /**
     * @brief 从包关系出发可达的部件（广度优先，去重）
     */
    std::vector<Part*> reachableParts() const;

    Part* partByName(const PackURI& partname) const;

    /**
     * @brief 第一个未被占用的部件名
     * @param tmpl 含一个 "%d" 的模板，如 "/word/footer%d.xml"
     */
    PackURI nextPartname(const std::string& tmpl) const;

    // ========== 包级关系 ==========

    Relationships& rels() { return rels_; }
    const Relationships& rels() const { return rels_; }

    std::string relateTo(Part& target, RelationshipType type);
    core::Result<Part*> partRelatedBy(RelationshipType type) const;

    /**
     * @brief officeDocument 关系指向的主文档部件，没有时返回 nullptr
     */
    Part* mainDocumentPart() const;

    /**
     * @brief 核心属性，包内没有时创建默认核心属性部件并建立关系
     */
    CoreProperties& coreProperties();

private:
    void loadFromZip(const std::string& path);

    std::vector<std::unique_ptr<Part>> parts_;
    Relationships rels_;
};

}} // namespace fastdocx::opc

#pragma once

#include "fastdocx/opc/RelationshipType.hpp"
#include "fastdocx/core/Expected.hpp"
#include <string>
#include <vector>

namespace fastdocx {
namespace opc {

class Part;

/**
 * @brief 一条有向关系边
 *
 * 内部关系指向包内部件（不拥有），外部关系只保存目标URL。
 */
struct Relationship {
    std::string rId;
    RelationshipType type = RelationshipType::Unknown;
    std::string type_uri;          // 原始类型URI，Unknown 类型写回时使用
    Part* target_part = nullptr;   // 内部目标
    std::string target_ref;        // 外部目标URL
    bool is_external = false;

    /**
     * @brief 写入 .rels 的 Target：内部目标按 base_uri 计算相对引用
     */
    std::string targetRef(const std::string& base_uri) const;
};

/**
 * @brief 一个部件（或包本身）的出边集合，保持插入顺序
 */
class Relationships {
public:
    Relationships() = default;

    Relationships(const Relationships&) = delete;
    Relationships& operator=(const Relationships&) = delete;

    /**
     * @brief 以给定 rId 添加内部关系（加载时使用）
     * @throws core::PackageException rId 重复时
     */
    const Relationship& add(const std::string& rId, const std::string& type_uri, Part& target);

    const Relationship& addExternal(const std::string& rId, const std::string& type_uri, const std::string& url);

    /**
     * @brief 已有同类型、同目标的内部关系则复用，否则以最小可用 rId 新建
     * @return 关系的 rId
     */
    std::string getOrAdd(RelationshipType type, Part& target);

    std::string getOrAddExternal(RelationshipType type, const std::string& url);

    /**
     * @brief 唯一一条该类型内部关系的目标
     *
     * 没有时返回 RelationshipNotFound，多于一条时返回 InvalidPackage。
     */
    core::Result<Part*> partWithType(RelationshipType type) const;

    const Relationship* find(const std::string& rId) const;
    std::vector<const Relationship*> byType(RelationshipType type) const;

    // "rIdN"，N 为最小的未使用正整数
    std::string nextRId() const;

    size_t size() const { return relationships_.size(); }
    bool empty() const { return relationships_.empty(); }

    std::vector<Relationship>::const_iterator begin() const { return relationships_.begin(); }
    std::vector<Relationship>::const_iterator end() const { return relationships_.end(); }

    /**
     * @brief 序列化为 .rels 文件内容
     * @param base_uri 源部件目录，用于计算相对 Target
     */
    std::string toXML(const std::string& base_uri) const;

private:
    std::vector<Relationship> relationships_;
};

}} // namespace fastdocx::opc

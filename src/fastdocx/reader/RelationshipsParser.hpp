#pragma once

#include "BaseSAXParser.hpp"
#include <string>
#include <vector>
#include <unordered_map>

namespace fastdocx {
namespace reader {

/**
 * @brief .rels 关系文件解析器
 *
 * 只收集 Relationship 元素，缺少 Id/Type/Target 的条目跳过并记录警告。
 */
class RelationshipsParser : public BaseSAXParser {
public:
    struct Relationship {
        std::string id;          // 如 "rId1"
        std::string type;        // 关系类型URI
        std::string target;      // 相对引用或外部URL
        std::string target_mode; // "Internal" / "External"

        Relationship() : target_mode("Internal") {}
        bool isExternal() const { return target_mode == "External"; }
    };

    RelationshipsParser() = default;
    ~RelationshipsParser() override = default;

    bool parse(const std::string& xml_content) {
        clear();
        return parseXML(xml_content);
    }

    const std::vector<Relationship>& getRelationships() const { return relationships_; }
    const Relationship* findById(const std::string& id) const;
    std::vector<const Relationship*> findByType(const std::string& type) const;
    size_t getRelationshipCount() const { return relationships_.size(); }

    void clear() {
        relationships_.clear();
        id_index_.clear();
    }

private:
    void onStartElement(std::string_view name, core::span<const xml::XMLAttribute> attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;

    std::vector<Relationship> relationships_;
    std::unordered_map<std::string, size_t> id_index_;
};

}} // namespace fastdocx::reader

#pragma once

#include "BaseSAXParser.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace fastdocx {
namespace reader {

/**
 * @brief [Content_Types].xml 解析器
 *
 * 扩展名和部件名按大小写不敏感处理，索引键统一小写。
 */
class ContentTypesParser : public BaseSAXParser {
public:
    struct DefaultType {
        std::string extension;
        std::string content_type;
    };

    struct OverrideType {
        std::string part_name;
        std::string content_type;
    };

    ContentTypesParser() = default;
    ~ContentTypesParser() override = default;

    bool parse(const std::string& xml_content) {
        clear();
        return parseXML(xml_content);
    }

    const std::vector<DefaultType>& getDefaults() const { return defaults_; }
    const std::vector<OverrideType>& getOverrides() const { return overrides_; }

    std::string findDefaultType(const std::string& extension) const;
    std::string findOverrideType(const std::string& part_name) const;

    /**
     * @brief 部件的内容类型：先查 Override，再按扩展名查 Default
     * @return 都没有时返回空串
     */
    std::string getContentType(const std::string& part_name) const;

    void clear();

private:
    void onStartElement(std::string_view name, core::span<const xml::XMLAttribute> attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;

    static std::string toLower(std::string value);

    std::vector<DefaultType> defaults_;
    std::vector<OverrideType> overrides_;
    std::unordered_map<std::string, std::string> default_index_;
    std::unordered_map<std::string, std::string> override_index_;
};

}} // namespace fastdocx::reader

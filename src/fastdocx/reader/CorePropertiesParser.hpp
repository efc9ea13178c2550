/**
 * @file CorePropertiesParser.hpp
 * @brief docProps/core.xml 流式解析器
 */
#pragma once

#include "BaseSAXParser.hpp"
#include <string>

namespace fastdocx {
namespace reader {

/**
 * @brief 核心属性原始值（全部为文本，日期保持W3CDTF原样）
 */
struct CorePropsInfo {
    std::string title;
    std::string subject;
    std::string creator;
    std::string keywords;
    std::string description;
    std::string last_modified_by;
    std::string category;
    std::string content_status;
    std::string identifier;
    std::string language;
    std::string version;
    std::string revision;
    std::string created;
    std::string modified;
    std::string last_printed;
};

/**
 * @brief 只读取根元素的直接子元素，按本地名（去掉 dc:/cp:/dcterms: 前缀）匹配字段
 */
class CorePropertiesParser : public BaseSAXParser {
public:
    CorePropertiesParser() = default;
    ~CorePropertiesParser() override = default;

    bool parse(const std::string& xml_content) {
        props_ = CorePropsInfo{};
        current_field_ = nullptr;
        return parseXML(xml_content);
    }

    const CorePropsInfo& getCoreProps() const { return props_; }
    CorePropsInfo takeCoreProps() { return std::move(props_); }

private:
    void onStartElement(std::string_view name, core::span<const xml::XMLAttribute> attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;
    void onText(std::string_view text, int depth) override;

    std::string* fieldFor(std::string_view local_name);

    CorePropsInfo props_;
    std::string* current_field_ = nullptr;
};

}} // namespace fastdocx::reader

#pragma once

#include "fastdocx/styles/Style.hpp"
#include "fastdocx/xml/XMLElement.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fastdocx {
namespace styles {

/**
 * @brief 样式表（w:styles）的查询与修改接口
 *
 * 名称参数一律为界面名（"Heading 1"），内部转换为存储名再比较。
 */
class Styles {
public:
    explicit Styles(xml::XMLElement& root);

    Styles(const Styles&) = delete;
    Styles& operator=(const Styles&) = delete;

    size_t size() const { return styles_.size(); }
    bool contains(const std::string& name) const;

    /**
     * @brief 按界面名查找
     * @throws core::StyleNotFoundException 不存在时
     */
    const Style& operator[](const std::string& name) const;

    const Style* findByName(const std::string& name) const;
    const Style* findById(const std::string& style_id) const;

    /**
     * @brief 该类型的默认样式（w:default="1"），有多个时取文档中最后一个
     * @return 样式表没有定义时返回 nullptr
     */
    const Style* defaultStyle(StyleType type) const;

    /**
     * @brief 按 id 取样式，id 为空、不存在或类型不符时回退到该类型默认样式
     * @return 只有回退时样式表也没有默认样式才返回 nullptr
     */
    const Style* getById(const std::optional<std::string>& style_id, StyleType type) const;

    /**
     * @brief 将样式名（或样式 id）解析为样式 id
     *
     * 输入为空，或解析到的正是该类型的默认样式时返回 std::nullopt。
     * @throws core::StyleNotFoundException 名称和 id 都找不到
     * @throws core::WrongStyleTypeException 样式类型与 type 不符
     */
    std::optional<std::string> getStyleId(const std::optional<std::string>& style_or_name, StyleType type) const;
    std::optional<std::string> getStyleId(const Style& style, StyleType type) const;

    /**
     * @brief 新增样式，id 由名称去掉空格得到
     * @throws core::ParameterException 同名样式已存在
     */
    const Style& addStyle(const std::string& name, StyleType type, bool builtin = false);

    std::vector<const Style*> styles() const;

private:
    xml::XMLElement& root_;
    std::vector<std::unique_ptr<Style>> styles_;
};

}} // namespace fastdocx::styles

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <functional>
#include <utility>

namespace fastdocx {
namespace xml {

class XMLStreamWriter;

/**
 * @brief 可修改的轻量DOM节点
 *
 * 部件的XML内容以这棵树的形式常驻内存。元素名、属性名均保留原始前缀
 * （如 "w:p"、"w:styleId"），不做命名空间展开。属性保持文档顺序，
 * 序列化结果稳定。文本内容只挂在叶子元素上（WordprocessingML 的 w:t 等）。
 *
 * 不保存文本和子元素的相对位置：混合内容 <a>x<b/>y</a> 解析后
 * text() 为 "xy"，序列化为 <a>xy<b/></a>。
 */
class XMLElement {
public:
    using Attribute = std::pair<std::string, std::string>;

    explicit XMLElement(std::string name);
    ~XMLElement() = default;

    XMLElement(const XMLElement&) = delete;
    XMLElement& operator=(const XMLElement&) = delete;

    // ========== 名称 ==========

    const std::string& name() const { return name_; }
    std::string localName() const;
    std::string prefix() const;

    // ========== 属性 ==========

    const std::vector<Attribute>& attributes() const { return attributes_; }
    std::optional<std::string> attribute(const std::string& attr_name) const;
    std::string getAttribute(const std::string& attr_name, const std::string& default_value = "") const;
    bool hasAttribute(const std::string& attr_name) const;
    void setAttribute(const std::string& attr_name, const std::string& value);
    bool removeAttribute(const std::string& attr_name);

    // ========== 文本 ==========

    const std::string& text() const { return text_; }
    void setText(const std::string& text) { text_ = text; }

    /**
     * @brief 递归拼接本节点及所有后代的文本（文档顺序）
     */
    std::string innerText() const;

    // ========== 子元素 ==========

    const std::vector<std::unique_ptr<XMLElement>>& children() const { return children_; }
    XMLElement* parent() const { return parent_; }
    size_t childCount() const { return children_.size(); }

    XMLElement* findChild(const std::string& element_name) const;
    std::vector<XMLElement*> findChildren(const std::string& element_name) const;
    XMLElement* findChildByPath(const std::string& path) const;  // "w:rPr/w:b"

    XMLElement& appendChild(const std::string& element_name);
    XMLElement& appendChild(std::unique_ptr<XMLElement> child);
    XMLElement& insertChild(size_t index, const std::string& element_name);
    bool removeChild(const XMLElement* child);

    /**
     * @brief 找到或创建首个同名子元素
     */
    XMLElement& getOrAddChild(const std::string& element_name);

    // ========== 子树查询 ==========

    /**
     * @brief 文档顺序遍历整棵子树（含自身）
     */
    void forEachRecursive(const std::function<void(const XMLElement&, int)>& callback, int depth = 0) const;

    std::vector<XMLElement*> findDescendants(const std::string& element_name) const;

    /**
     * @brief 收集子树中（含自身）所有名为 attr_name 的属性值
     *
     * 相当于 XPath 的 .//@attr_name：按文档顺序返回，不区分元素类型。
     */
    std::vector<std::string> collectAttributeValues(const std::string& attr_name) const;

    // ========== 序列化 ==========

    void writeTo(XMLStreamWriter& writer) const;
    std::string toXML(bool with_declaration = true) const;

private:
    std::string name_;
    std::vector<Attribute> attributes_;
    std::string text_;
    std::vector<std::unique_ptr<XMLElement>> children_;
    XMLElement* parent_ = nullptr;
};

}} // namespace fastdocx::xml

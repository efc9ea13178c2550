#pragma once

#include "fastdocx/opc/Part.hpp"
#include "fastdocx/xml/XMLElement.hpp"
#include <memory>
#include <cstdint>

namespace fastdocx {
namespace opc {

/**
 * @brief 内容为XML的部件，内容以 XMLElement 树常驻内存，保存时重新序列化
 */
class XmlPart : public Part {
public:
    XmlPart(PackURI partname, std::string content_type,
            std::unique_ptr<xml::XMLElement> element, Package* package = nullptr);
    ~XmlPart() override = default;

    /**
     * @brief 从原始字节加载
     * @throws core::XMLException XML 不合法时
     */
    static std::unique_ptr<Part> load(const PackURI& partname, const std::string& content_type,
                                      const std::string& blob, Package* package);

    /**
     * @brief 解析XML文本为DOM，失败时抛出 XMLException（附带部件名）
     */
    static std::unique_ptr<xml::XMLElement> parseXml(const std::string& xml_content, const std::string& source);

    xml::XMLElement& element() { return *element_; }
    const xml::XMLElement& element() const { return *element_; }

    std::string blob() const override;

    /**
     * @brief 下一个可用的元素标识
     *
     * 扫描整棵子树中不带前缀的 id 属性，只认纯ASCII数字且在 int64 范围内的值，
     * 返回最大值加一；一个都没有时返回 1。每次调用都重新扫描，不做缓存，
     * 调用方写入带该 id 的元素之后下一次调用才会计入。
     */
    int64_t nextId() const;

private:
    std::unique_ptr<xml::XMLElement> element_;
};

}} // namespace fastdocx::opc

#pragma once

#include "fastdocx/opc/XmlPart.hpp"
#include "fastdocx/styles/Styles.hpp"
#include <memory>

namespace fastdocx {
namespace opc {
class Package;
}

namespace parts {

/**
 * @brief 样式表部件（/word/styles.xml）
 */
class StylesPart : public opc::XmlPart {
public:
    StylesPart(opc::PackURI partname, std::string content_type,
               std::unique_ptr<xml::XMLElement> element, opc::Package* package = nullptr);
    ~StylesPart() override;

    static std::unique_ptr<opc::Part> load(const opc::PackURI& partname, const std::string& content_type,
                                           const std::string& blob, opc::Package* package);

    /**
     * @brief 由内置模板生成的样式表部件
     *
     * 模板包含四种类型各自的默认样式（Normal、Default Paragraph Font、
     * Normal Table、No List）以及常用的标题、页眉页脚、强调样式。
     */
    static std::unique_ptr<StylesPart> defaultPart(opc::Package& package);

    styles::Styles& styles();

private:
    std::unique_ptr<styles::Styles> styles_;
};

}} // namespace fastdocx::parts

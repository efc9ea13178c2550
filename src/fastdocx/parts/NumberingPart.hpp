#pragma once

#include "fastdocx/opc/XmlPart.hpp"
#include "fastdocx/numbering/Numbering.hpp"
#include <memory>

namespace fastdocx {
namespace parts {

/**
 * @brief 编号定义部件（/word/numbering.xml）
 */
class NumberingPart : public opc::XmlPart {
public:
    NumberingPart(opc::PackURI partname, std::string content_type,
                  std::unique_ptr<xml::XMLElement> element, opc::Package* package = nullptr);
    ~NumberingPart() override;

    static std::unique_ptr<opc::Part> load(const opc::PackURI& partname, const std::string& content_type,
                                           const std::string& blob, opc::Package* package);

    /**
     * @brief 空的 w:numbering 部件，尚未属于任何包，由包收养后才可保存
     */
    static std::unique_ptr<NumberingPart> newPart();

    numbering::Numbering& numbering();

private:
    std::unique_ptr<numbering::Numbering> numbering_;
};

}} // namespace fastdocx::parts

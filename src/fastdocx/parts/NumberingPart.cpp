#include "fastdocx/parts/NumberingPart.hpp"
#include "fastdocx/opc/ContentTypes.hpp"
#include "fastdocx/xml/Namespaces.hpp"

namespace fastdocx {
namespace parts {

NumberingPart::NumberingPart(opc::PackURI partname, std::string content_type,
                             std::unique_ptr<xml::XMLElement> element, opc::Package* package)
    : XmlPart(std::move(partname), std::move(content_type), std::move(element), package) {
}

NumberingPart::~NumberingPart() = default;

std::unique_ptr<opc::Part> NumberingPart::load(const opc::PackURI& partname, const std::string& content_type,
                                               const std::string& blob, opc::Package* package) {
    return std::make_unique<NumberingPart>(partname, content_type, parseXml(blob, partname.str()), package);
}

std::unique_ptr<NumberingPart> NumberingPart::newPart() {
    auto root = std::make_unique<xml::XMLElement>("w:numbering");
    root->setAttribute("xmlns:w", xml::ns::kW);
    return std::make_unique<NumberingPart>(opc::PackURI("/word/numbering.xml"), opc::ct::kWmlNumbering,
                                           std::move(root));
}

numbering::Numbering& NumberingPart::numbering() {
    if (!numbering_) {
        numbering_ = std::make_unique<numbering::Numbering>(element());
    }
    return *numbering_;
}

}} // namespace fastdocx::parts

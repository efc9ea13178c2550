#include "fastdocx/FastDocx.hpp"
#include "fastdocx/opc/ContentTypes.hpp"
#include "fastdocx/opc/XmlPart.hpp"
#include "fastdocx/xml/Namespaces.hpp"
#include "fastdocx/utils/Logger.hpp"
#include <iostream>

namespace fastdocx {

bool initialize(const std::string& log_file_path, bool enable_console) {
    try {
        Logger::getInstance().initialize(log_file_path, Logger::Level::INFO, enable_console);
        FASTDOCX_LOG_INFO("FastDocx library initialized");
        FASTDOCX_LOG_INFO("Version: {}", getVersion());
        return true;
    } catch (const std::exception& e) {
        // 日志系统本身不可用，只能走标准错误
        if (enable_console) {
            std::cerr << "Failed to initialize FastDocx: " << e.what() << std::endl;
        }
        return false;
    }
}

void cleanup() {
    FASTDOCX_LOG_INFO("FastDocx library cleanup completed");
    Logger::getInstance().shutdown();
}

std::unique_ptr<opc::Package> openPackage(const std::string& path) {
    return opc::Package::open(path);
}

std::unique_ptr<opc::Package> createDocument() {
    auto package = opc::Package::create();

    auto root = std::make_unique<xml::XMLElement>("w:document");
    root->setAttribute("xmlns:w", xml::ns::kW);
    root->setAttribute("xmlns:r", xml::ns::kR);
    xml::XMLElement& body = root->appendChild("w:body");
    body.appendChild("w:p");
    body.appendChild("w:sectPr");

    auto document = std::make_unique<opc::XmlPart>(opc::PackURI("/word/document.xml"),
                                                   opc::ct::kWmlDocumentMain, std::move(root));
    opc::Part& main = package->adoptPart(std::move(document));
    package->relateTo(main, opc::RelationshipType::OfficeDocument);
    FASTDOCX_LOG_DEBUG("Created empty document package");
    return package;
}

} // namespace fastdocx

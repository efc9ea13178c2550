#pragma once

#include "fastdocx/opc/Part.hpp"
#include "fastdocx/opc/CoreProperties.hpp"
#include <memory>
#include <string>

namespace fastdocx {
namespace opc {
class Package;
}

namespace parts {

/**
 * @brief docProps/core.xml 部件
 *
 * 加载时用 CorePropertiesParser 解析为 opc::CoreProperties，
 * 保存时从字段重新生成XML，未设置的字段不输出。
 */
class CorePropertiesPart : public opc::Part {
public:
    CorePropertiesPart(opc::PackURI partname, std::string content_type,
                       opc::CoreProperties properties, opc::Package* package = nullptr);
    ~CorePropertiesPart() override = default;

    /**
     * @throws core::XMLException XML 不合法时
     */
    static std::unique_ptr<opc::Part> load(const opc::PackURI& partname, const std::string& content_type,
                                           const std::string& blob, opc::Package* package);

    /**
     * @brief 新建 /docProps/core.xml，预置标题、修改者、修订号和修改时间
     */
    static std::unique_ptr<CorePropertiesPart> defaultPart(opc::Package& package);

    opc::CoreProperties& coreProperties() { return properties_; }
    const opc::CoreProperties& coreProperties() const { return properties_; }

    std::string blob() const override;

private:
    opc::CoreProperties properties_;
};

}} // namespace fastdocx::parts

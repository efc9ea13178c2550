#pragma once

#include "fastdocx/opc/XmlPart.hpp"
#include "fastdocx/opc/CoreProperties.hpp"
#include "fastdocx/opc/RelationshipType.hpp"
#include "fastdocx/document/Footer.hpp"
#include "fastdocx/styles/Styles.hpp"
#include "fastdocx/settings/Settings.hpp"
#include <memory>
#include <optional>
#include <string>

namespace fastdocx {
namespace opc {
class Package;
}

namespace parts {

class StylesPart;
class NumberingPart;
class SettingsPart;

/**
 * @brief 页脚部件（/word/footerN.xml）
 *
 * 除页脚内容本身外，还负责定位它依赖的样式、编号、设置部件：
 * 先查本部件的出向关系，不存在时创建默认部件、交给包收养并建立关系。
 * 解析结果按部件实例缓存，之后的访问不再查关系。
 *
 * 缓存没有同步，同一个包只能由一个线程操作。
 */
class FooterPart : public opc::XmlPart {
public:
    FooterPart(opc::PackURI partname, std::string content_type,
               std::unique_ptr<xml::XMLElement> element, opc::Package* package = nullptr);
    ~FooterPart() override;

    static std::unique_ptr<opc::Part> load(const opc::PackURI& partname, const std::string& content_type,
                                           const std::string& blob, opc::Package* package);

    /**
     * @brief 新建空页脚（含一个 Footer 样式的空段落）并由 package 收养
     */
    static FooterPart& newPart(opc::Package& package);

    // ========== 向包委托 ==========

    opc::CoreProperties& coreProperties();

    /**
     * @brief 写出整个包
     * @throws core::FileException 写入失败
     */
    void save(const std::string& path);

    // ========== 内容视图 ==========

    document::Footer footer();

    // ========== 依赖部件 ==========

    styles::Styles& styles();
    NumberingPart& numberingPart();
    settings::Settings& settings();

    // ========== 样式查询 ==========

    /**
     * @brief 按 id 取样式，id 为空或找不到该类型的样式时返回该类型的默认样式
     */
    const styles::Style* getStyle(const std::optional<std::string>& style_id, styles::StyleType type);

    /**
     * @brief 样式名或 id 转为样式 id，默认样式和空输入返回 std::nullopt
     * @throws core::StyleNotFoundException
     * @throws core::WrongStyleTypeException
     */
    std::optional<std::string> getStyleId(const std::optional<std::string>& style_or_name, styles::StyleType type);
    std::optional<std::string> getStyleId(const styles::Style& style, styles::StyleType type);

private:
    StylesPart& stylesPart();
    SettingsPart& settingsPart();

    // 按关系类型取目标部件，缺失时创建默认部件
    opc::Part& resolvePart(opc::RelationshipType type);

    StylesPart* styles_part_ = nullptr;
    NumberingPart* numbering_part_ = nullptr;
    SettingsPart* settings_part_ = nullptr;
};

}} // namespace fastdocx::parts

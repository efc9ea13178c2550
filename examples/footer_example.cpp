/**
 * @file footer_example.cpp
 * @brief 页脚部件用法示例
 *
 * 创建一个文档，添加页脚段落，按需生成样式/编号/设置部件，
 * 写入核心属性后保存，再重新打开读取页脚文本。
 */

#include "fastdocx/FastDocx.hpp"
#include "fastdocx/utils/ModuleLoggers.hpp"
#include <iostream>

using namespace fastdocx;

int main(int argc, char* argv[]) {
    const std::string output = argc > 1 ? argv[1] : "footer_example.docx";

    if (!fastdocx::initialize("logs/footer_example.log", true)) {
        std::cerr << "FastDocx 初始化失败" << std::endl;
        return 1;
    }

    try {
        auto package = createDocument();
        opc::Part* main_part = package->mainDocumentPart();

        parts::FooterPart& footer_part = parts::FooterPart::newPart(*package);
        main_part->relateTo(footer_part, opc::RelationshipType::Footer);

        document::Footer footer = footer_part.footer();
        footer.addParagraph("FastDocx footer example");
        footer.addParagraph("Confidential", std::string("Footer"));

        // 奇偶页使用不同页眉页脚
        footer_part.settings().setOddAndEvenPagesHeaderFooter(true);

        int num_id = footer_part.numberingPart().numbering().addNum(0);
        EXAMPLE_INFO("Added numbering instance {}", num_id);
        EXAMPLE_INFO("Next free drawing id in {}: {}", footer_part.partname().str(), footer_part.nextId());

        opc::CoreProperties& props = footer_part.coreProperties();
        props.setTitle("Footer example");
        props.setAuthor("FastDocx");

        footer_part.save(output);
        EXAMPLE_INFO("Saved {}", output);

        auto reopened = openPackage(output);
        auto related = reopened->mainDocumentPart()->partRelatedBy(opc::RelationshipType::Footer);
        if (!related) {
            EXAMPLE_ERROR("Footer relationship missing after reopen");
            fastdocx::cleanup();
            return 1;
        }
        auto* loaded = dynamic_cast<parts::FooterPart*>(*related);
        if (loaded) {
            EXAMPLE_INFO("Footer text:\n{}", loaded->footer().text());
            EXAMPLE_INFO("Title: {}", reopened->coreProperties().title());
        }
    } catch (const core::FastDocxException& e) {
        EXAMPLE_ERROR("Error: {}", e.what());
        fastdocx::cleanup();
        return 1;
    }

    fastdocx::cleanup();
    return 0;
}

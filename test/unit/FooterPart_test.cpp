#include "fastdocx/FastDocx.hpp"
#include "fastdocx/opc/ContentTypes.hpp"
#include "fastdocx/utils/Logger.hpp"

#include <gtest/gtest.h>
#include <filesystem>

namespace fastdocx {
namespace parts {

using styles::StyleType;

class FooterPartTest : public ::testing::Test {
protected:
    void SetUp() override {
        fastdocx::Logger::getInstance().initialize("logs/FooterPart_test.log",
                                                   fastdocx::Logger::Level::DEBUG,
                                                   false);
        package_ = opc::Package::create();
    }

    void TearDown() override {
        package_.reset();
        fastdocx::Logger::getInstance().shutdown();
    }

    FooterPart& loadFooter(const std::string& xml) {
        auto part = FooterPart::load(opc::PackURI("/word/footer1.xml"), opc::ct::kWmlFooter, xml, package_.get());
        return static_cast<FooterPart&>(package_->adoptPart(std::move(part)));
    }

    std::unique_ptr<opc::Package> package_;
};

TEST_F(FooterPartTest, NewPartNamesAreSequential) {
    FooterPart& first = FooterPart::newPart(*package_);
    FooterPart& second = FooterPart::newPart(*package_);
    EXPECT_EQ(first.partname().str(), "/word/footer1.xml");
    EXPECT_EQ(second.partname().str(), "/word/footer2.xml");
    EXPECT_EQ(first.contentType(), opc::ct::kWmlFooter);
    EXPECT_EQ(first.package(), package_.get());
    EXPECT_TRUE(first.rels().empty());
}

TEST_F(FooterPartTest, StylesPartCreatedOnce) {
    FooterPart& footer = FooterPart::newPart(*package_);

    styles::Styles& styles = footer.styles();
    EXPECT_EQ(&footer.styles(), &styles);
    EXPECT_EQ(footer.rels().byType(opc::RelationshipType::Styles).size(), 1u);
    EXPECT_EQ(footer.rels().size(), 1u);

    opc::Part* styles_part = package_->partByName(opc::PackURI("/word/styles.xml"));
    ASSERT_NE(styles_part, nullptr);
    EXPECT_EQ(styles_part->contentType(), opc::ct::kWmlStyles);
    EXPECT_EQ(footer.rels().byType(opc::RelationshipType::Styles).front()->target_part, styles_part);
}

TEST_F(FooterPartTest, NumberingPartCreatedOnce) {
    FooterPart& footer = FooterPart::newPart(*package_);

    NumberingPart& numbering = footer.numberingPart();
    EXPECT_EQ(&footer.numberingPart(), &numbering);
    EXPECT_EQ(numbering.partname().str(), "/word/numbering.xml");
    EXPECT_EQ(numbering.package(), package_.get());
    EXPECT_EQ(numbering.numbering().numCount(), 0u);
    EXPECT_EQ(footer.rels().byType(opc::RelationshipType::Numbering).size(), 1u);
}

TEST_F(FooterPartTest, SettingsPartCreatedOnce) {
    FooterPart& footer = FooterPart::newPart(*package_);

    settings::Settings& settings = footer.settings();
    EXPECT_EQ(&footer.settings(), &settings);
    EXPECT_FALSE(settings.oddAndEvenPagesHeaderFooter());
    EXPECT_EQ(footer.rels().byType(opc::RelationshipType::Settings).size(), 1u);
    EXPECT_NE(package_->partByName(opc::PackURI("/word/settings.xml")), nullptr);
}

TEST_F(FooterPartTest, ExistingRelationshipIsUsed) {
    FooterPart& footer = FooterPart::newPart(*package_);
    auto loaded = StylesPart::load(opc::PackURI("/word/custom-styles.xml"), opc::ct::kWmlStyles,
                                   R"(<w:styles xmlns:w="w">
  <w:style w:type="paragraph" w:default="1" w:styleId="Body"><w:name w:val="Body"/></w:style>
</w:styles>)", package_.get());
    opc::Part& styles_part = package_->adoptPart(std::move(loaded));
    footer.relateTo(styles_part, opc::RelationshipType::Styles);

    EXPECT_EQ(footer.styles().size(), 1u);
    EXPECT_EQ(footer.rels().size(), 1u);
    EXPECT_EQ(package_->partByName(opc::PackURI("/word/styles.xml")), nullptr);
}

TEST_F(FooterPartTest, TwoFootersShareDefaultParts) {
    FooterPart& first = FooterPart::newPart(*package_);
    FooterPart& second = FooterPart::newPart(*package_);

    styles::Styles& styles = first.styles();
    EXPECT_EQ(&second.styles(), &styles);
    EXPECT_EQ(package_->parts().size(), 3u);
}

TEST_F(FooterPartTest, DefaultPartNameTakenByOtherType) {
    package_->adoptPart(std::make_unique<opc::Part>(opc::PackURI("/word/styles.xml"), opc::ct::kXml, "<x/>"));
    FooterPart& footer = FooterPart::newPart(*package_);

    footer.styles();
    opc::Part* created = footer.rels().byType(opc::RelationshipType::Styles).front()->target_part;
    EXPECT_EQ(created->partname().str(), "/word/styles1.xml");
    EXPECT_EQ(created->contentType(), opc::ct::kWmlStyles);
}

TEST_F(FooterPartTest, RelationshipToWrongKindThrows) {
    FooterPart& footer = FooterPart::newPart(*package_);
    opc::Part& plain = package_->adoptPart(
        std::make_unique<opc::Part>(opc::PackURI("/word/settings.bin"), opc::ct::kOctetStream, "data"));
    footer.relateTo(plain, opc::RelationshipType::Settings);
    EXPECT_THROW(footer.settings(), core::PackageException);
}

TEST_F(FooterPartTest, StyleAccessWithoutPackageThrows) {
    auto part = FooterPart::load(opc::PackURI("/word/footer1.xml"), opc::ct::kWmlFooter,
                                 R"(<w:ftr xmlns:w="w"/>)", nullptr);
    auto& footer = static_cast<FooterPart&>(*part);
    EXPECT_THROW(footer.styles(), core::OperationException);
    EXPECT_THROW(footer.coreProperties(), core::OperationException);
}

TEST_F(FooterPartTest, GetStyleFallsBackToDefault) {
    FooterPart& footer = FooterPart::newPart(*package_);

    const styles::Style* normal = footer.getStyle(std::nullopt, StyleType::Paragraph);
    ASSERT_NE(normal, nullptr);
    EXPECT_EQ(normal->styleId(), "Normal");

    const styles::Style* fallback = footer.getStyle(std::string("bogus-id"), StyleType::Paragraph);
    EXPECT_EQ(fallback, normal);

    const styles::Style* heading = footer.getStyle(std::string("Heading1"), StyleType::Paragraph);
    ASSERT_NE(heading, nullptr);
    EXPECT_EQ(heading->name(), "Heading 1");

    // 类型不符时同样回退
    const styles::Style* character = footer.getStyle(std::string("Heading1"), StyleType::Character);
    ASSERT_NE(character, nullptr);
    EXPECT_EQ(character->styleId(), "DefaultParagraphFont");
}

TEST_F(FooterPartTest, GetStyleIdResolvesNamesAndIds) {
    FooterPart& footer = FooterPart::newPart(*package_);

    EXPECT_EQ(footer.getStyleId(std::string("Heading 1"), StyleType::Paragraph), "Heading1");
    EXPECT_EQ(footer.getStyleId(std::string("Heading1"), StyleType::Paragraph), "Heading1");
    EXPECT_EQ(footer.getStyleId(std::string("Footer"), StyleType::Paragraph), "Footer");
    EXPECT_EQ(footer.getStyleId(std::string("Strong"), StyleType::Character), "Strong");
}

TEST_F(FooterPartTest, GetStyleIdReturnsNulloptForDefault) {
    FooterPart& footer = FooterPart::newPart(*package_);

    EXPECT_EQ(footer.getStyleId(std::nullopt, StyleType::Paragraph), std::nullopt);
    EXPECT_EQ(footer.getStyleId(std::string("Normal"), StyleType::Paragraph), std::nullopt);

    const styles::Style* normal = footer.getStyle(std::nullopt, StyleType::Paragraph);
    ASSERT_NE(normal, nullptr);
    EXPECT_EQ(footer.getStyleId(*normal, StyleType::Paragraph), std::nullopt);
}

TEST_F(FooterPartTest, GetStyleIdErrors) {
    FooterPart& footer = FooterPart::newPart(*package_);

    try {
        footer.getStyleId(std::string("Heading 1"), StyleType::Character);
        FAIL() << "expected WrongStyleTypeException";
    } catch (const core::WrongStyleTypeException& e) {
        EXPECT_EQ(e.getStyleRef(), "Heading 1");
        EXPECT_EQ(e.getExpectedType(), "character");
        EXPECT_EQ(e.getActualType(), "paragraph");
        EXPECT_EQ(e.getErrorCode(), core::ErrorCode::WrongStyleType);
    }

    EXPECT_THROW(footer.getStyleId(std::string("NoSuchStyle"), StyleType::Paragraph),
                 core::StyleNotFoundException);
}

TEST_F(FooterPartTest, StylesFromLoadedFooterWithNoRelationships) {
    FooterPart& footer = loadFooter(R"(<w:ftr xmlns:w="w"><w:p/></w:ftr>)");
    EXPECT_NO_THROW(footer.styles());
    EXPECT_EQ(footer.rels().size(), 1u);
}

TEST_F(FooterPartTest, NextIdFromFooterContent) {
    FooterPart& footer = loadFooter(R"(<w:ftr xmlns:w="w" xmlns:wp="wp">
  <w:p><w:r><w:drawing><wp:anchor><wp:docPr id="4" name="Logo"/></wp:anchor></w:drawing></w:r></w:p>
</w:ftr>)");
    EXPECT_EQ(footer.nextId(), 5);

    FooterPart& fresh = FooterPart::newPart(*package_);
    EXPECT_EQ(fresh.nextId(), 1);
}

TEST_F(FooterPartTest, CorePropertiesDelegatesToPackage) {
    FooterPart& footer = FooterPart::newPart(*package_);
    footer.coreProperties().setTitle("Quarterly");
    EXPECT_EQ(package_->coreProperties().title(), "Quarterly");
    EXPECT_EQ(&footer.coreProperties(), &package_->coreProperties());
}

TEST_F(FooterPartTest, SaveDelegatesToPackage) {
    const std::filesystem::path dir = "footer_part_save";
    std::filesystem::create_directories(dir);
    const std::string file = (dir / "saved.docx").string();

    auto document = createDocument();
    FooterPart& footer = FooterPart::newPart(*document);
    document->mainDocumentPart()->relateTo(footer, opc::RelationshipType::Footer);
    footer.footer().addParagraph("Saved through the footer", std::string("Heading 1"));

    footer.save(file);

    auto reopened = opc::Package::open(file);
    auto* loaded = dynamic_cast<FooterPart*>(reopened->partByName(opc::PackURI("/word/footer1.xml")));
    ASSERT_NE(loaded, nullptr);
    EXPECT_EQ(loaded->footer().text(), "\nSaved through the footer");

    size_t rels_before = loaded->rels().size();
    EXPECT_EQ(loaded->styles().size(), 13u);
    EXPECT_EQ(loaded->rels().size(), rels_before);
    EXPECT_NE(dynamic_cast<StylesPart*>(reopened->partByName(opc::PackURI("/word/styles.xml"))), nullptr);
    EXPECT_EQ(loaded->getStyleId(std::string("Heading 1"), StyleType::Paragraph), "Heading1");

    std::filesystem::remove_all(dir);
}

TEST_F(FooterPartTest, SaveWithoutPackageThrows) {
    auto part = FooterPart::load(opc::PackURI("/word/footer1.xml"), opc::ct::kWmlFooter,
                                 R"(<w:ftr xmlns:w="w"/>)", nullptr);
    EXPECT_THROW(static_cast<FooterPart&>(*part).save("unused.docx"), core::OperationException);
}

}} // namespace fastdocx::parts

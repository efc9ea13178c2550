#include "fastdocx/FastDocx.hpp"
#include "fastdocx/opc/ContentTypes.hpp"
#include "fastdocx/utils/Logger.hpp"

#include <gtest/gtest.h>

namespace fastdocx {
namespace document {

class FooterTest : public ::testing::Test {
protected:
    void SetUp() override {
        fastdocx::Logger::getInstance().initialize("logs/Footer_test.log",
                                                   fastdocx::Logger::Level::DEBUG,
                                                   false);
        package_ = opc::Package::create();
    }

    void TearDown() override {
        package_.reset();
        fastdocx::Logger::getInstance().shutdown();
    }

    parts::FooterPart& loadFooter(const std::string& xml) {
        auto part = parts::FooterPart::load(opc::PackURI("/word/footer1.xml"), opc::ct::kWmlFooter,
                                            xml, package_.get());
        return static_cast<parts::FooterPart&>(package_->adoptPart(std::move(part)));
    }

    std::unique_ptr<opc::Package> package_;
};

TEST_F(FooterTest, ParagraphsOfNewFooter) {
    parts::FooterPart& part = parts::FooterPart::newPart(*package_);
    Footer footer = part.footer();

    auto paragraphs = footer.paragraphs();
    ASSERT_EQ(paragraphs.size(), 1u);
    EXPECT_EQ(paragraphs[0].styleId(), "Footer");
    EXPECT_EQ(paragraphs[0].text(), "");
    EXPECT_EQ(&footer.part(), &part);
}

TEST_F(FooterTest, TextOfLoadedFooter) {
    parts::FooterPart& part = loadFooter(R"(<w:ftr xmlns:w="w">
  <w:p><w:r><w:t>Confidential</w:t></w:r></w:p>
  <w:p><w:r><w:t xml:space="preserve">Page </w:t></w:r><w:r><w:tab/><w:t>3</w:t></w:r></w:p>
</w:ftr>)");
    EXPECT_EQ(part.footer().text(), "Confidential\nPage \t3");
}

TEST_F(FooterTest, AddParagraphWithStyle) {
    parts::FooterPart& part = parts::FooterPart::newPart(*package_);
    Footer footer = part.footer();

    Paragraph paragraph = footer.addParagraph("Chapter One", std::string("Heading 1"));
    EXPECT_EQ(paragraph.styleId(), "Heading1");
    EXPECT_EQ(paragraph.text(), "Chapter One");
    EXPECT_EQ(paragraph.runCount(), 1u);

    std::string xml = part.blob();
    EXPECT_NE(xml.find("<w:pStyle w:val=\"Heading1\"/>"), std::string::npos);
    EXPECT_EQ(footer.paragraphs().size(), 2u);
}

TEST_F(FooterTest, AddParagraphWithDefaultStyleOmitsPStyle) {
    parts::FooterPart& part = parts::FooterPart::newPart(*package_);
    Footer footer = part.footer();

    Paragraph plain = footer.addParagraph("plain");
    EXPECT_EQ(plain.styleId(), std::nullopt);
    EXPECT_EQ(plain.element().findChild("w:pPr"), nullptr);

    Paragraph normal = footer.addParagraph("normal", std::string("Normal"));
    EXPECT_EQ(normal.styleId(), std::nullopt);
}

TEST_F(FooterTest, AddParagraphWithBadStyleLeavesFooterUnchanged) {
    parts::FooterPart& part = parts::FooterPart::newPart(*package_);
    Footer footer = part.footer();

    EXPECT_THROW(footer.addParagraph("x", std::string("NoSuchStyle")), core::StyleNotFoundException);
    EXPECT_THROW(footer.addParagraph("x", std::string("Strong")), core::WrongStyleTypeException);
    EXPECT_EQ(footer.paragraphs().size(), 1u);
}

TEST_F(FooterTest, AddRunPreservesOuterSpace) {
    parts::FooterPart& part = parts::FooterPart::newPart(*package_);
    Paragraph paragraph = part.footer().addParagraph(" - 1 - ");

    const xml::XMLElement* run = paragraph.element().findChild("w:r");
    ASSERT_NE(run, nullptr);
    const xml::XMLElement* t = run->findChild("w:t");
    ASSERT_NE(t, nullptr);
    EXPECT_EQ(t->getAttribute("xml:space"), "preserve");
    EXPECT_EQ(paragraph.text(), " - 1 - ");
}

TEST_F(FooterTest, SetStyleIdReplacesAndRemoves) {
    parts::FooterPart& part = parts::FooterPart::newPart(*package_);
    Paragraph paragraph = part.footer().paragraphs().front();

    paragraph.setStyleId(std::string("Header"));
    EXPECT_EQ(paragraph.styleId(), "Header");

    paragraph.setStyleId(std::nullopt);
    EXPECT_EQ(paragraph.styleId(), std::nullopt);
}

}} // namespace fastdocx::document

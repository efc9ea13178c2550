#include "fastdocx/FastDocx.hpp"
#include "fastdocx/archive/ZipWriter.hpp"
#include "fastdocx/opc/ContentTypes.hpp"
#include "fastdocx/opc/XmlPart.hpp"
#include "fastdocx/utils/Logger.hpp"

#include <gtest/gtest.h>
#include <filesystem>

namespace fastdocx {
namespace opc {

class PackageTest : public ::testing::Test {
protected:
    void SetUp() override {
        fastdocx::Logger::getInstance().initialize("logs/Package_test.log",
                                                   fastdocx::Logger::Level::DEBUG,
                                                   false);
        test_dir_ = "test_package";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
        fastdocx::Logger::getInstance().shutdown();
    }

    std::string path(const std::string& name) const {
        return test_dir_ + "/" + name;
    }

    void writeZip(const std::string& file, const std::vector<std::pair<std::string, std::string>>& members) {
        archive::ZipWriter writer(file);
        ASSERT_TRUE(writer.open());
        for (const auto& [name, content] : members) {
            ASSERT_EQ(writer.addFile(name, content), archive::ZipError::Ok);
        }
        ASSERT_TRUE(writer.close());
    }

    const std::string content_types_ = R"(<?xml version="1.0" encoding="UTF-8"?>
<Types xmlns="http://schemas.openxmlformats.org/package/2006/content-types">
  <Default Extension="rels" ContentType="application/vnd.openxmlformats-package.relationships+xml"/>
  <Default Extension="xml" ContentType="application/xml"/>
  <Override PartName="/word/document.xml" ContentType="application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml"/>
</Types>)";

    std::string test_dir_;
};

TEST_F(PackageTest, NextPartnameSkipsUsedNumbers) {
    auto package = Package::create();
    EXPECT_EQ(package->nextPartname("/word/footer%d.xml").str(), "/word/footer1.xml");

    package->adoptPart(std::make_unique<Part>(PackURI("/word/footer1.xml"), ct::kWmlFooter));
    package->adoptPart(std::make_unique<Part>(PackURI("/word/footer3.xml"), ct::kWmlFooter));
    EXPECT_EQ(package->nextPartname("/word/footer%d.xml").str(), "/word/footer2.xml");

    EXPECT_THROW(package->nextPartname("/word/footer.xml"), core::ParameterException);
}

TEST_F(PackageTest, AdoptPartRejectsDuplicateNames) {
    auto package = Package::create();
    Part& adopted = package->adoptPart(std::make_unique<Part>(PackURI("/word/a.xml"), ct::kXml));
    EXPECT_EQ(adopted.package(), package.get());
    EXPECT_EQ(package->partByName(PackURI("/WORD/A.xml")), &adopted);
    EXPECT_THROW(package->adoptPart(std::make_unique<Part>(PackURI("/word/A.xml"), ct::kXml)),
                 core::PackageException);
}

TEST_F(PackageTest, CreateDocumentHasMainPart) {
    auto package = createDocument();
    Part* main = package->mainDocumentPart();
    ASSERT_NE(main, nullptr);
    EXPECT_EQ(main->partname().str(), "/word/document.xml");
    EXPECT_EQ(main->contentType(), ct::kWmlDocumentMain);
}

TEST_F(PackageTest, SaveAndReopen) {
    const std::string file = path("roundtrip.docx");
    {
        auto package = createDocument();
        Part* main = package->mainDocumentPart();
        ASSERT_NE(main, nullptr);

        parts::FooterPart& footer = parts::FooterPart::newPart(*package);
        main->relateTo(footer, RelationshipType::Footer);
        footer.footer().addParagraph("Page 1");
        footer.settings().setOddAndEvenPagesHeaderFooter(true);
        footer.numberingPart().numbering().addNum(0);
        package->coreProperties().setTitle("Annual Report");

        // 不可达部件不写出
        package->adoptPart(std::make_unique<Part>(PackURI("/word/orphan.xml"), ct::kXml, "<orphan/>"));

        package->save(file);
    }

    auto reopened = Package::open(file);
    EXPECT_EQ(reopened->coreProperties().title(), "Annual Report");
    EXPECT_EQ(reopened->partByName(PackURI("/word/orphan.xml")), nullptr);

    Part* main = reopened->mainDocumentPart();
    ASSERT_NE(main, nullptr);
    auto footer_rel = main->partRelatedBy(RelationshipType::Footer);
    ASSERT_TRUE(footer_rel.hasValue());

    auto* footer = dynamic_cast<parts::FooterPart*>(footer_rel.value());
    ASSERT_NE(footer, nullptr);
    EXPECT_EQ(footer->partname().str(), "/word/footer1.xml");

    size_t rels_before = footer->rels().size();
    EXPECT_EQ(rels_before, 3u);
    EXPECT_TRUE(footer->settings().oddAndEvenPagesHeaderFooter());
    EXPECT_EQ(footer->numberingPart().numbering().numCount(), 1u);
    EXPECT_EQ(footer->styles().size(), 13u);
    EXPECT_EQ(footer->rels().size(), rels_before);

    EXPECT_NE(dynamic_cast<parts::StylesPart*>(reopened->partByName(PackURI("/word/styles.xml"))), nullptr);
    EXPECT_EQ(footer->footer().text(), "\nPage 1");
}

TEST_F(PackageTest, RelationshipIdsSurviveRoundTrip) {
    const std::string file = path("rids.docx");
    std::string styles_rid;
    {
        auto package = createDocument();
        parts::FooterPart& footer = parts::FooterPart::newPart(*package);
        package->mainDocumentPart()->relateTo(footer, RelationshipType::Footer);
        footer.relateToExternal("https://example.com/", RelationshipType::Hyperlink);
        footer.styles();
        styles_rid = footer.rels().byType(RelationshipType::Styles).front()->rId;
        package->save(file);
    }

    auto reopened = Package::open(file);
    Part* footer = reopened->partByName(PackURI("/word/footer1.xml"));
    ASSERT_NE(footer, nullptr);
    const Relationship* rel = footer->rels().find(styles_rid);
    ASSERT_NE(rel, nullptr);
    EXPECT_EQ(rel->type, RelationshipType::Styles);
    EXPECT_EQ(footer->targetRef(styles_rid), "styles.xml");
    EXPECT_EQ(footer->targetRef("rId1"), "https://example.com/");
}

TEST_F(PackageTest, OpenMissingFileThrows) {
    EXPECT_THROW(Package::open(path("nope.docx")), core::FileException);
}

TEST_F(PackageTest, OpenWithoutContentTypesThrows) {
    const std::string file = path("no_ct.docx");
    writeZip(file, {{"_rels/.rels", "<Relationships/>"}});
    EXPECT_THROW(Package::open(file), core::PackageException);
}

TEST_F(PackageTest, DanglingRelationshipIsDropped) {
    const std::string file = path("dangling.docx");
    writeZip(file, {
        {"[Content_Types].xml", content_types_},
        {"_rels/.rels", R"(<Relationships xmlns="http://schemas.openxmlformats.org/package/2006/relationships">
  <Relationship Id="rId1" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument" Target="word/document.xml"/>
  <Relationship Id="rId2" Type="http://schemas.openxmlformats.org/package/2006/relationships/metadata/core-properties" Target="docProps/core.xml"/>
</Relationships>)"},
        {"word/document.xml", R"(<w:document xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main"><w:body/></w:document>)"},
    });

    auto package = Package::open(file);
    EXPECT_EQ(package->rels().size(), 1u);
    ASSERT_NE(package->mainDocumentPart(), nullptr);
    EXPECT_NE(dynamic_cast<XmlPart*>(package->mainDocumentPart()), nullptr);
}

TEST_F(PackageTest, PartWithoutContentTypeThrows) {
    const std::string file = path("no_type.docx");
    writeZip(file, {
        {"[Content_Types].xml", R"(<Types xmlns="http://schemas.openxmlformats.org/package/2006/content-types">
  <Default Extension="rels" ContentType="application/vnd.openxmlformats-package.relationships+xml"/>
</Types>)"},
        {"_rels/.rels", R"(<Relationships xmlns="http://schemas.openxmlformats.org/package/2006/relationships">
  <Relationship Id="rId1" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument" Target="word/document.bin"/>
</Relationships>)"},
        {"word/document.bin", "data"},
    });
    EXPECT_THROW(Package::open(file), core::PackageException);
}

}} // namespace fastdocx::opc

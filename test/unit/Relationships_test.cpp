#include "fastdocx/utils/Logger.hpp"
#include "fastdocx/opc/Part.hpp"
#include "fastdocx/opc/Relationships.hpp"
#include "fastdocx/core/Exception.hpp"

#include <gtest/gtest.h>

namespace fastdocx {
namespace opc {

class RelationshipsTest : public ::testing::Test {
protected:
    void SetUp() override {
        fastdocx::Logger::getInstance().initialize("logs/Relationships_test.log",
                                                   fastdocx::Logger::Level::DEBUG,
                                                   false);
    }

    void TearDown() override {
        fastdocx::Logger::getInstance().shutdown();
    }

    Part footer_{PackURI("/word/footer1.xml"), "application/xml"};
    Part styles_{PackURI("/word/styles.xml"), "application/xml"};
    Part other_styles_{PackURI("/word/styles2.xml"), "application/xml"};
    Part core_{PackURI("/docProps/core.xml"), "application/xml"};
};

TEST_F(RelationshipsTest, TypeUriMapping) {
    EXPECT_EQ(std::string(toUri(RelationshipType::Styles)),
              "http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles");
    EXPECT_EQ(relationshipTypeFromUri(toUri(RelationshipType::Numbering)), RelationshipType::Numbering);
    EXPECT_EQ(relationshipTypeFromUri("http://example.com/custom"), RelationshipType::Unknown);
    EXPECT_TRUE(isSingleton(RelationshipType::Settings));
    EXPECT_FALSE(isSingleton(RelationshipType::Footer));
}

TEST_F(RelationshipsTest, RelateToIsIdempotent) {
    std::string first = footer_.relateTo(styles_, RelationshipType::Styles);
    std::string second = footer_.relateTo(styles_, RelationshipType::Styles);
    EXPECT_EQ(first, "rId1");
    EXPECT_EQ(first, second);
    EXPECT_EQ(footer_.rels().size(), 1u);
}

TEST_F(RelationshipsTest, NextRIdFillsGaps) {
    Relationships rels;
    rels.add("rId1", toUri(RelationshipType::Styles), styles_);
    rels.add("rId3", toUri(RelationshipType::CoreProperties), core_);
    EXPECT_EQ(rels.nextRId(), "rId2");

    EXPECT_THROW(rels.add("rId3", toUri(RelationshipType::Footer), footer_), core::PackageException);
}

TEST_F(RelationshipsTest, PartRelatedByDistinguishesMissingAndAmbiguous) {
    auto missing = footer_.partRelatedBy(RelationshipType::Styles);
    ASSERT_FALSE(missing.hasValue());
    EXPECT_EQ(missing.error().code, core::ErrorCode::RelationshipNotFound);

    footer_.relateTo(styles_, RelationshipType::Styles);
    auto found = footer_.partRelatedBy(RelationshipType::Styles);
    ASSERT_TRUE(found.hasValue());
    EXPECT_EQ(found.value(), &styles_);

    footer_.relateTo(other_styles_, RelationshipType::Styles);
    auto ambiguous = footer_.partRelatedBy(RelationshipType::Styles);
    ASSERT_FALSE(ambiguous.hasValue());
    EXPECT_EQ(ambiguous.error().code, core::ErrorCode::InvalidPackage);
}

TEST_F(RelationshipsTest, ExternalRelationships) {
    std::string rId = footer_.relateToExternal("https://example.com/", RelationshipType::Hyperlink);
    EXPECT_EQ(footer_.relateToExternal("https://example.com/", RelationshipType::Hyperlink), rId);
    EXPECT_EQ(footer_.relatedPart(rId), nullptr);
    EXPECT_EQ(footer_.targetRef(rId), "https://example.com/");
    EXPECT_THROW(footer_.targetRef("rId99"), core::PackageException);
}

TEST_F(RelationshipsTest, SerializesRelativeTargets) {
    footer_.relateTo(styles_, RelationshipType::Styles);
    footer_.relateTo(core_, RelationshipType::CoreProperties);
    footer_.relateToExternal("https://example.com/?a=1&b=2", RelationshipType::Hyperlink);

    std::string xml = footer_.rels().toXML(footer_.partname().baseURI());
    EXPECT_NE(xml.find("Id=\"rId1\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles\" "
                       "Target=\"styles.xml\""), std::string::npos);
    EXPECT_NE(xml.find("Target=\"../docProps/core.xml\""), std::string::npos);
    EXPECT_NE(xml.find("Target=\"https://example.com/?a=1&amp;b=2\" TargetMode=\"External\""), std::string::npos);
}

}} // namespace fastdocx::opc

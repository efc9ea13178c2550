#include "fastdocx/utils/Logger.hpp"
#include "fastdocx/xml/XMLElement.hpp"

#include <gtest/gtest.h>

namespace fastdocx {
namespace xml {

class XMLElementTest : public ::testing::Test {
protected:
    void SetUp() override {
        fastdocx::Logger::getInstance().initialize("logs/XMLElement_test.log",
                                                   fastdocx::Logger::Level::DEBUG,
                                                   false);
    }

    void TearDown() override {
        fastdocx::Logger::getInstance().shutdown();
    }
};

TEST_F(XMLElementTest, NameParts) {
    XMLElement element("w:pStyle");
    EXPECT_EQ(element.name(), "w:pStyle");
    EXPECT_EQ(element.localName(), "pStyle");
    EXPECT_EQ(element.prefix(), "w");

    XMLElement plain("Relationship");
    EXPECT_EQ(plain.localName(), "Relationship");
    EXPECT_EQ(plain.prefix(), "");
}

TEST_F(XMLElementTest, AttributesKeepInsertionOrder) {
    XMLElement element("w:style");
    element.setAttribute("w:type", "paragraph");
    element.setAttribute("w:styleId", "Footer");
    element.setAttribute("w:type", "character");

    ASSERT_EQ(element.attributes().size(), 2u);
    EXPECT_EQ(element.attributes()[0].first, "w:type");
    EXPECT_EQ(element.attributes()[0].second, "character");
    EXPECT_EQ(element.attributes()[1].first, "w:styleId");

    EXPECT_TRUE(element.hasAttribute("w:styleId"));
    EXPECT_FALSE(element.attribute("w:default").has_value());
    EXPECT_EQ(element.getAttribute("w:default", "0"), "0");

    EXPECT_TRUE(element.removeAttribute("w:type"));
    EXPECT_FALSE(element.removeAttribute("w:type"));
    EXPECT_EQ(element.attributes().size(), 1u);
}

TEST_F(XMLElementTest, ChildNavigation) {
    XMLElement p("w:p");
    XMLElement& ppr = p.appendChild("w:pPr");
    ppr.appendChild("w:pStyle").setAttribute("w:val", "Footer");
    p.appendChild("w:r").appendChild("w:t").setText("Page ");
    p.appendChild("w:r").appendChild("w:t").setText("1");

    EXPECT_EQ(p.childCount(), 3u);
    EXPECT_EQ(p.findChildren("w:r").size(), 2u);
    EXPECT_EQ(&ppr, p.findChild("w:pPr"));
    EXPECT_EQ(ppr.parent(), &p);

    XMLElement* style = p.findChildByPath("w:pPr/w:pStyle");
    ASSERT_NE(style, nullptr);
    EXPECT_EQ(style->getAttribute("w:val"), "Footer");
    EXPECT_EQ(p.findChildByPath("w:pPr/w:jc"), nullptr);

    EXPECT_EQ(p.findDescendants("w:t").size(), 2u);
    EXPECT_EQ(p.innerText(), "Page 1");
}

TEST_F(XMLElementTest, InsertAndRemoveChild) {
    XMLElement settings("w:settings");
    settings.appendChild("w:zoom");
    settings.appendChild("w:compat");

    XMLElement& inserted = settings.insertChild(1, "w:evenAndOddHeaders");
    ASSERT_EQ(settings.childCount(), 3u);
    EXPECT_EQ(settings.children()[1].get(), &inserted);

    // 越界下标等同追加
    settings.insertChild(100, "w:listSeparator");
    EXPECT_EQ(settings.children().back()->name(), "w:listSeparator");

    EXPECT_TRUE(settings.removeChild(&inserted));
    EXPECT_EQ(settings.childCount(), 3u);
    EXPECT_EQ(settings.findChild("w:evenAndOddHeaders"), nullptr);
}

TEST_F(XMLElementTest, GetOrAddChildReusesExisting) {
    XMLElement rpr("w:rPr");
    XMLElement& first = rpr.getOrAddChild("w:b");
    XMLElement& second = rpr.getOrAddChild("w:b");
    EXPECT_EQ(&first, &second);
    EXPECT_EQ(rpr.childCount(), 1u);
}

TEST_F(XMLElementTest, CollectAttributeValuesIncludesSelfInDocumentOrder) {
    XMLElement root("root");
    root.setAttribute("id", "1");
    XMLElement& a = root.appendChild("a");
    a.setAttribute("id", "2");
    a.appendChild("b").setAttribute("id", "3");
    root.appendChild("c").setAttribute("w:id", "99");
    root.appendChild("d").setAttribute("id", "4");

    auto ids = root.collectAttributeValues("id");
    ASSERT_EQ(ids.size(), 4u);
    EXPECT_EQ(ids[0], "1");
    EXPECT_EQ(ids[1], "2");
    EXPECT_EQ(ids[2], "3");
    EXPECT_EQ(ids[3], "4");
}

TEST_F(XMLElementTest, ToXMLEscapesAndCollapsesEmptyElements) {
    XMLElement root("w:ftr");
    root.setAttribute("xmlns:w", "http://schemas.openxmlformats.org/wordprocessingml/2006/main");
    XMLElement& p = root.appendChild("w:p");
    p.appendChild("w:r").appendChild("w:t").setText("A & B <C>");
    root.appendChild("w:p");

    std::string xml = root.toXML(false);
    EXPECT_EQ(xml,
              "<w:ftr xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\">"
              "<w:p><w:r><w:t>A &amp; B &lt;C&gt;</w:t></w:r></w:p><w:p/></w:ftr>");

    std::string with_decl = root.toXML();
    EXPECT_EQ(with_decl.rfind("<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>", 0), 0u);
}

}} // namespace fastdocx::xml

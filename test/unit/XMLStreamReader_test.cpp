#include "fastdocx/utils/Logger.hpp"
#include "fastdocx/xml/XMLStreamReader.hpp"
#include "fastdocx/xml/XMLElement.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

namespace fastdocx {
namespace xml {

class XMLStreamReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        fastdocx::Logger::getInstance().initialize("logs/XMLStreamReader_test.log",
                                                   fastdocx::Logger::Level::DEBUG,
                                                   false);
        reader_ = std::make_unique<XMLStreamReader>();
    }

    void TearDown() override {
        reader_.reset();
        fastdocx::Logger::getInstance().shutdown();
    }

    std::unique_ptr<XMLStreamReader> reader_;

    const std::string footer_xml_ = R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>
<w:ftr xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main">
  <w:p>
    <w:pPr><w:pStyle w:val="Footer"/></w:pPr>
    <w:r><w:t>Page</w:t></w:r>
    <w:r><w:t xml:space="preserve"> 1 </w:t></w:r>
  </w:p>
</w:ftr>)";
};

TEST_F(XMLStreamReaderTest, StreamsElementsWithDepth) {
    std::vector<std::pair<std::string, int>> starts;
    std::vector<std::string> texts;
    std::string style;

    reader_->setStartElementCallback([&](std::string_view name, core::span<const XMLAttribute> attributes, int depth) {
        starts.emplace_back(std::string(name), depth);
        if (name == "w:pStyle") {
            for (const auto& attr : attributes) {
                if (attr.name == "w:val") style = std::string(attr.value);
            }
        }
    });
    reader_->setTextCallback([&](std::string_view text, int /*depth*/) {
        texts.emplace_back(text);
    });

    EXPECT_EQ(reader_->parseFromString(footer_xml_), XMLParseError::Ok);

    ASSERT_GE(starts.size(), 2u);
    EXPECT_EQ(starts[0].first, "w:ftr");
    EXPECT_EQ(starts[0].second, 0);
    EXPECT_EQ(starts[1].first, "w:p");
    EXPECT_EQ(starts[1].second, 1);
    EXPECT_EQ(style, "Footer");

    // 默认裁剪空白
    ASSERT_EQ(texts.size(), 2u);
    EXPECT_EQ(texts[0], "Page");
    EXPECT_EQ(texts[1], "1");
    EXPECT_EQ(reader_->getElementsParsed(), 8u);
}

TEST_F(XMLStreamReaderTest, EntitiesDecodedOnce) {
    std::string text;
    reader_->setTextCallback([&](std::string_view t, int) { text = std::string(t); });

    EXPECT_EQ(reader_->parseFromString("<a>A &amp;amp; B &lt;</a>"), XMLParseError::Ok);
    EXPECT_EQ(text, "A &amp; B <");
}

TEST_F(XMLStreamReaderTest, MalformedInputReportsError) {
    EXPECT_EQ(reader_->parseFromString("<a><b></a>"), XMLParseError::ParseFailed);
    EXPECT_EQ(reader_->getLastError(), XMLParseError::ParseFailed);
    EXPECT_FALSE(reader_->getLastErrorMessage().empty());
}

TEST_F(XMLStreamReaderTest, CallbackExceptionStopsParsing) {
    int starts = 0;
    reader_->setStartElementCallback([&](std::string_view name, core::span<const XMLAttribute>, int) {
        ++starts;
        if (name == "b") {
            throw std::runtime_error("boom");
        }
    });

    EXPECT_EQ(reader_->parseFromString("<a><b/><c/><d/></a>"), XMLParseError::CallbackError);
    EXPECT_EQ(starts, 2);
}

TEST_F(XMLStreamReaderTest, IncrementalFeeding) {
    const std::string xml = "<root><item id=\"1\"/><item id=\"2\"/></root>";
    int items = 0;
    reader_->setStartElementCallback([&](std::string_view name, core::span<const XMLAttribute>, int) {
        if (name == "item") ++items;
    });

    ASSERT_EQ(reader_->beginParsing(), XMLParseError::Ok);
    for (size_t pos = 0; pos < xml.size(); pos += 5) {
        ASSERT_EQ(reader_->feedData(xml.data() + pos, std::min<size_t>(5, xml.size() - pos)), XMLParseError::Ok);
    }
    EXPECT_EQ(reader_->endParsing(), XMLParseError::Ok);
    EXPECT_EQ(items, 2);
}

TEST_F(XMLStreamReaderTest, ParseToDOMKeepsPreservedWhitespace) {
    auto root = reader_->parseToDOM(footer_xml_);
    ASSERT_NE(root, nullptr);
    EXPECT_EQ(root->name(), "w:ftr");
    EXPECT_EQ(root->text(), "");

    auto texts = root->findDescendants("w:t");
    ASSERT_EQ(texts.size(), 2u);
    EXPECT_EQ(texts[0]->text(), "Page");
    EXPECT_EQ(texts[1]->text(), " 1 ");
    EXPECT_EQ(root->findChildByPath("w:p/w:pPr/w:pStyle")->getAttribute("w:val"), "Footer");
}

TEST_F(XMLStreamReaderTest, ParseToDOMFailureReturnsNull) {
    EXPECT_EQ(reader_->parseToDOM("<unclosed>"), nullptr);
    EXPECT_EQ(reader_->parseToDOM(""), nullptr);
}

TEST_F(XMLStreamReaderTest, TextBeforeChildIsDelivered) {
    std::vector<std::pair<std::string, int>> texts;
    reader_->setTextCallback([&](std::string_view text, int depth) {
        texts.emplace_back(std::string(text), depth);
    });

    EXPECT_EQ(reader_->parseFromString("<a>x<b>inner</b>y</a>"), XMLParseError::Ok);

    ASSERT_EQ(texts.size(), 3u);
    EXPECT_EQ(texts[0], std::make_pair(std::string("x"), 0));
    EXPECT_EQ(texts[1], std::make_pair(std::string("inner"), 1));
    EXPECT_EQ(texts[2], std::make_pair(std::string("y"), 0));
}

TEST_F(XMLStreamReaderTest, ParseToDOMKeepsMixedTextAheadOfChildren) {
    auto root = reader_->parseToDOM("<a>x<b/>y</a>");
    ASSERT_NE(root, nullptr);
    EXPECT_EQ(root->text(), "xy");
    ASSERT_EQ(root->childCount(), 1u);
    EXPECT_EQ(root->toXML(false), "<a>xy<b/></a>");
}

}} // namespace fastdocx::xml

#include "fastdocx/utils/Logger.hpp"
#include "fastdocx/xml/ParsedValueBuilder.hpp"

#include <gtest/gtest.h>

namespace fastdocx {
namespace xml {

class ParsedValueBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        fastdocx::Logger::getInstance().initialize("logs/ParsedValueBuilder_test.log",
                                                  fastdocx::Logger::Level::DEBUG,
                                                  false);
    }

    void TearDown() override {
        fastdocx::Logger::getInstance().shutdown();
    }

    static ParsedDocument parseOk(const std::string& xml) {
        auto result = ParsedValueBuilder::parse(xml);
        EXPECT_TRUE(result.hasValue()) << (result.hasError() ? result.error().fullMessage() : "");
        return result.hasValue() ? std::move(result).value() : ParsedDocument{};
    }
};

TEST_F(ParsedValueBuilderTest, TextOnlyElementBecomesText) {
    auto doc = parseOk("<w:t>Hello</w:t>");
    EXPECT_EQ(doc.root_name, "w:t");
    ASSERT_TRUE(doc.root.isText());
    EXPECT_EQ(doc.root.textValue(), "Hello");
}

TEST_F(ParsedValueBuilderTest, EmptyElementWithoutAttributesIsEmpty) {
    auto doc = parseOk("<w:br/>");
    EXPECT_TRUE(doc.root.isEmpty());
}

TEST_F(ParsedValueBuilderTest, AttributesKeepSourceOrder) {
    auto doc = parseOk(R"(<w:pgSz w:w="11906" w:h="16838" w:orient="portrait"/>)");
    ASSERT_TRUE(doc.root.isElement());
    ASSERT_TRUE(doc.root.attributes().has_value());

    const Attributes& attrs = *doc.root.attributes();
    ASSERT_EQ(attrs.size(), 3u);
    EXPECT_EQ(attrs[0].first, "w:w");
    EXPECT_EQ(attrs[1].first, "w:h");
    EXPECT_EQ(attrs[2].first, "w:orient");
    EXPECT_EQ(doc.root.attribute("w:h"), std::optional<std::string>("16838"));
    EXPECT_TRUE(doc.root.entries().empty());
}

TEST_F(ParsedValueBuilderTest, ConsecutiveSiblingsGroupIntoSequence) {
    auto doc = parseOk("<r><a>1</a><a>2</a><a>3</a></r>");
    ASSERT_TRUE(doc.root.isElement());
    ASSERT_EQ(doc.root.entries().size(), 1u);

    const ParsedValue* a = doc.root.find("a");
    ASSERT_NE(a, nullptr);
    ASSERT_TRUE(a->isSequence());
    ASSERT_EQ(a->items().size(), 3u);
    EXPECT_EQ(a->items()[2].textValue(), "3");
}

TEST_F(ParsedValueBuilderTest, SingleChildIsNotWrappedInSequence) {
    auto doc = parseOk("<r><a>1</a></r>");
    const ParsedValue* a = doc.root.find("a");
    ASSERT_NE(a, nullptr);
    EXPECT_TRUE(a->isText());
    EXPECT_EQ(doc.root.collect("a").size(), 1u);
}

TEST_F(ParsedValueBuilderTest, NonConsecutiveSiblingsStaySeparate) {
    auto doc = parseOk("<r><a>1</a><b/><a>2</a></r>");
    const auto& entries = doc.root.entries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].key, "a");
    EXPECT_EQ(entries[1].key, "b");
    EXPECT_EQ(entries[2].key, "a");

    auto all = doc.root.collect("a");
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[1]->textValue(), "2");
}

TEST_F(ParsedValueBuilderTest, MixedContentKeepsTextPositions) {
    auto doc = parseOk("<p>before<b>bold</b>after</p>");
    const auto& entries = doc.root.entries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].key, ParsedValue::kTextKey);
    EXPECT_EQ(entries[0].value.textValue(), "before");
    EXPECT_EQ(entries[1].key, "b");
    EXPECT_EQ(entries[2].key, ParsedValue::kTextKey);
    EXPECT_EQ(entries[2].value.textValue(), "after");
}

TEST_F(ParsedValueBuilderTest, IndentationBetweenElementsIsDropped) {
    auto doc = parseOk("<r>\n  <a/>\n  <b/>\n</r>");
    const auto& entries = doc.root.entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].key, "a");
    EXPECT_EQ(entries[1].key, "b");
}

TEST_F(ParsedValueBuilderTest, TextIsNotTrimmed) {
    auto doc = parseOk(R"(<w:t xml:space="preserve">  padded  </w:t>)");
    ASSERT_TRUE(doc.root.isElement());
    ASSERT_EQ(doc.root.entries().size(), 1u);
    EXPECT_EQ(doc.root.entries()[0].value.textValue(), "  padded  ");
}

TEST_F(ParsedValueBuilderTest, EntitiesAreDecoded) {
    auto doc = parseOk("<t>a &amp; b &lt;c&gt;</t>");
    EXPECT_EQ(doc.root.textValue(), "a & b <c>");
}

TEST_F(ParsedValueBuilderTest, CommentsAreNotPreserved) {
    auto doc = parseOk("<r><!-- note --><a/></r>");
    ASSERT_EQ(doc.root.entries().size(), 1u);
    EXPECT_EQ(doc.root.entries()[0].key, "a");
}

TEST_F(ParsedValueBuilderTest, MalformedXmlReportsParseError) {
    auto result = ParsedValueBuilder::parse("<r><a></r>", "word/broken.xml");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, core::ErrorCode::XmlParseError);
    EXPECT_EQ(result.error().context, "word/broken.xml");
}

TEST_F(ParsedValueBuilderTest, EmptyInputReportsParseError) {
    auto result = ParsedValueBuilder::parse("");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, core::ErrorCode::XmlParseError);
}

TEST_F(ParsedValueBuilderTest, SecondRootElementIsRejected) {
    auto result = ParsedValueBuilder::parse("<a/><b/>");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, core::ErrorCode::XmlParseError);
}

}} // namespace fastdocx::xml

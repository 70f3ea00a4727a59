#include "fastdocx/utils/Logger.hpp"
#include "fastdocx/xml/XmlableWriter.hpp"
#include "fastdocx/xml/XMLStreamWriter.hpp"
#include "fastdocx/core/Exception.hpp"

#include <gtest/gtest.h>

namespace fastdocx {
namespace xml {

class XmlableWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        fastdocx::Logger::getInstance().initialize("logs/XmlableWriter_test.log",
                                                  fastdocx::Logger::Level::DEBUG,
                                                  false);
    }

    void TearDown() override {
        fastdocx::Logger::getInstance().shutdown();
    }
};

TEST_F(XmlableWriterTest, WritesAttributesTextAndChildren) {
    XmlableObject obj = XmlableObject::element("w:r", {
        XmlableObject::attributes({{"w:rsidR", "00A1"}}),
        XmlableObject::element("w:t", {XmlableObject::text("Tom & \"Jerry\"")}),
        XmlableObject::element("w:tab", {})
    });

    auto result = XmlableWriter::write(obj, false);
    ASSERT_TRUE(result.hasValue()) << result.error().fullMessage();
    EXPECT_EQ(*result, "<w:r w:rsidR=\"00A1\"><w:t>Tom &amp; &quot;Jerry&quot;</w:t><w:tab /></w:r>");
}

TEST_F(XmlableWriterTest, DeclarationIsOptional) {
    XmlableObject obj = XmlableObject::element("w:hdr", {});
    auto with = XmlableWriter::write(obj, true);
    ASSERT_TRUE(with.hasValue());
    EXPECT_EQ(with->rfind("<?xml", 0), 0u);
    EXPECT_NE(with->find("<w:hdr />"), std::string::npos);
}

TEST_F(XmlableWriterTest, AttributeMarkerMustComeFirst) {
    XmlableObject obj = XmlableObject::element("w:p", {
        XmlableObject::element("w:r", {}),
        XmlableObject::attributes({{"w:rsidR", "1"}})
    });
    auto result = XmlableWriter::write(obj);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, core::ErrorCode::XmlMissingElement);
}

TEST_F(XmlableWriterTest, NestedAttributeMarkerIsValidated) {
    XmlableObject obj = XmlableObject::element("w:p", {
        XmlableObject::element("w:r", {XmlableObject::text("x"), XmlableObject::attributes({})})
    });
    EXPECT_TRUE(XmlableWriter::write(obj).hasError());
}

TEST_F(XmlableWriterTest, RootMustBeElement) {
    auto result = XmlableWriter::write(XmlableObject::text("loose"));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, core::ErrorCode::XmlMissingElement);
}

TEST_F(XmlableWriterTest, StreamWriterRejectsMisuse) {
    XMLStreamWriter writer;
    EXPECT_THROW(writer.endElement(), core::FastDocxException);
    EXPECT_THROW(writer.startElement(""), core::FastDocxException);

    writer.startElement("a");
    writer.writeText("x");
    EXPECT_THROW(writer.writeAttribute("late", "1"), core::FastDocxException);
    EXPECT_THROW(writer.endDocument(), core::FastDocxException);
    writer.endElement();
    writer.endDocument();
    EXPECT_EQ(writer.toString(), "<a>x</a>");
}

TEST_F(XmlableWriterTest, StreamWriterCallbackModeReceivesChunks) {
    std::string collected;
    XMLStreamWriter writer([&collected](const std::string& chunk) { collected += chunk; });
    writer.startElement("root");
    writer.writeAttribute("v", "<1>");
    writer.endElement();
    writer.endDocument();

    EXPECT_EQ(collected, "<root v=\"&lt;1&gt;\" />");
    EXPECT_EQ(writer.toString(), "");
    EXPECT_EQ(writer.getBytesWritten(), collected.size());
}

TEST_F(XmlableWriterTest, WhitespaceEscapingDependsOnContext) {
    XMLStreamWriter writer;
    writer.startElement("w:t");
    writer.writeAttribute("w:val", "1\n2\t3\r4");
    writer.writeText("5\n6\t7\r8");
    writer.endElement();
    writer.endDocument();

    EXPECT_EQ(writer.toString(), "<w:t w:val=\"1&#xA;2&#x9;3&#xD;4\">5\n6\t7&#xD;8</w:t>");
}

}} // namespace fastdocx::xml

#include <gtest/gtest.h>
#include "fastdocx/FastDocx.hpp"
#include "fastdocx/reader/TemplateImporter.hpp"
#include "fastdocx/core/Exception.hpp"
#include "support/PackageBuilder.hpp"

#include <cstdio>
#include <stdexcept>
#include <utility>
#include <vector>

using namespace fastdocx;
using namespace fastdocx::test;
using document::HeaderFooterType;

namespace {

const char* kCharacterStylesXml =
    R"(<w:styles xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main">)"
    R"(<w:style w:type="character" w:styleId="Strong"/></w:styles>)";

class ThrowingStylesFactory : public document::IStylesFactory {
public:
    std::unique_ptr<document::Styles> newInstance(const std::string&) const override {
        throw std::runtime_error("styles engine unavailable");
    }
};

class NullStylesFactory : public document::IStylesFactory {
public:
    std::unique_ptr<document::Styles> newInstance(const std::string&) const override {
        return nullptr;
    }
};

class CountingStylesFactory : public document::IStylesFactory {
public:
    std::unique_ptr<document::Styles> newInstance(const std::string& xml_content) const override {
        ++calls;
        last_size = xml_content.size();
        return document::ExternalStylesFactory().newInstance(xml_content);
    }

    mutable int calls = 0;
    mutable size_t last_size = 0;
};

} // namespace

class TemplateImporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        fastdocx::initialize("logs/TemplateImporter_test.log", false);
    }

    void TearDown() override {
        fastdocx::cleanup();
    }

    // 两个页眉一个页脚，源ID故意不连续
    static PackageBuilder threePartTemplate() {
        PackageBuilder builder = PackageBuilder::minimalTemplate(
            R"(<w:headerReference w:type="default" r:id="rId8"/>)"
            R"(<w:headerReference w:type="first" r:id="rId3"/>)"
            R"(<w:footerReference w:type="even" r:id="rId11"/>)"
            R"(<w:titlePg/>)",
            relationship("rId1", "styles", "styles.xml") +
            relationship("rId3", "header", "header2.xml") +
            relationship("rId8", "header", "header1.xml") +
            relationship("rId11", "footer", "footer1.xml"));
        builder.add("word/header1.xml", headerXml("Default header"))
               .add("word/header2.xml", headerXml("First page header"))
               .add("word/footer1.xml", footerXml("Even footer"));
        return builder;
    }

    reader::TemplateImporter importer_;
};

TEST_F(TemplateImporterTest, RenumbersRelationshipIdsInSourceOrder) {
    auto result = importer_.importTemplate(threePartTemplate().build());
    ASSERT_TRUE(result.hasValue()) << result.error().fullMessage();

    const document::DocumentTemplate& tpl = *result;
    ASSERT_EQ(tpl.headers.size(), 2u);
    ASSERT_EQ(tpl.footers.size(), 1u);

    EXPECT_EQ(tpl.headers[0].type, HeaderFooterType::Default);
    EXPECT_EQ(tpl.headers[0].part.relationshipId(), 1u);
    EXPECT_EQ(tpl.headers[0].part.partName(), "word/header1.xml");
    EXPECT_EQ(tpl.headers[0].part.root().name(), "w:hdr");
    EXPECT_EQ(tpl.headers[0].part.root().textContent(), "Default header");

    EXPECT_EQ(tpl.headers[1].type, HeaderFooterType::First);
    EXPECT_EQ(tpl.headers[1].part.relationshipId(), 2u);
    EXPECT_EQ(tpl.headers[1].part.root().textContent(), "First page header");

    EXPECT_EQ(tpl.footers[0].type, HeaderFooterType::Even);
    EXPECT_EQ(tpl.footers[0].part.relationshipId(), 3u);
    EXPECT_EQ(tpl.footers[0].part.kind(), document::PartKind::Footer);
    EXPECT_EQ(tpl.footers[0].part.root().name(), "w:ftr");

    EXPECT_EQ(tpl.next_relationship_id, 4u);
    EXPECT_EQ(tpl.partCount(), 3u);
    EXPECT_TRUE(tpl.title_page_defined);
    ASSERT_NE(tpl.styles, nullptr);
    EXPECT_EQ(tpl.styles->styleCount(), 2u);
    ASSERT_NE(tpl.media, nullptr);
    EXPECT_TRUE(tpl.media->empty());
}

TEST_F(TemplateImporterTest, TemplateWithoutHeadersOrFooters) {
    auto result = importer_.importTemplate(
        PackageBuilder::minimalTemplate("<w:pgSz w:w=\"12240\"/>", relationship("rId1", "styles", "styles.xml"))
            .build());
    ASSERT_TRUE(result.hasValue()) << result.error().fullMessage();

    EXPECT_TRUE(result->headers.empty());
    EXPECT_TRUE(result->footers.empty());
    EXPECT_FALSE(result->title_page_defined);
    EXPECT_EQ(result->next_relationship_id, 1u);
    EXPECT_EQ(result->styles->styleIds(), (std::vector<std::string>{"Normal", "Heading1"}));
}

TEST_F(TemplateImporterTest, UnknownRelationshipIdFails) {
    PackageBuilder builder = PackageBuilder::minimalTemplate(
        R"(<w:headerReference w:type="default" r:id="rId2"/><w:footerReference r:id="rId99"/>)",
        relationship("rId2", "header", "header1.xml"));
    builder.add("word/header1.xml", headerXml("H"));

    auto result = importer_.importTemplate(builder.build());
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, core::ErrorCode::MissingRelationshipTarget);
    EXPECT_EQ(result.error().message, "Can not find target file for id 99");
    EXPECT_EQ(result.error().context, "rId99");
}

TEST_F(TemplateImporterTest, ImportOrThrowRaisesReferenceException) {
    PackageBuilder builder = PackageBuilder::minimalTemplate(R"(<w:headerReference r:id="rId5"/>)", "");
    EXPECT_THROW(importer_.importTemplateOrThrow(builder.build()), core::ReferenceException);

    auto tpl = importer_.importTemplateOrThrow(threePartTemplate().build());
    EXPECT_EQ(tpl.next_relationship_id, 4u);
}

TEST_F(TemplateImporterTest, ImagesAndHyperlinksAreRegistered) {
    PackageBuilder builder = PackageBuilder::minimalTemplate(
        R"(<w:headerReference r:id="rId4"/>)", relationship("rId4", "header", "header1.xml"));
    builder.add("word/header1.xml", headerXml("Logo"))
           .add("word/_rels/header1.xml.rels", relationshipsXml(
               relationship("rId1", "image", "media/image1.png") +
               relationship("rId2", "hyperlink", "https://example.com/", "External") +
               relationship("rId3", "image", "https://example.com/remote.png", "External") +
               relationship("rId4", "hyperlink", "#bookmark")))
           .add("word/media/image1.png", pngBytes(1));

    auto result = importer_.importTemplate(builder.build());
    ASSERT_TRUE(result.hasValue()) << result.error().fullMessage();

    const auto& part = result->headers.at(0).part;
    ASSERT_EQ(part.images().size(), 1u);
    EXPECT_EQ(part.images()[0].id, 1u);
    EXPECT_EQ(part.images()[0].target, "word/media/image1.png");
    ASSERT_NE(part.images()[0].media, nullptr);
    EXPECT_EQ(part.images()[0].media->data, pngBytes(1));
    EXPECT_EQ(part.images()[0].media->format, document::ImageFormat::PNG);

    ASSERT_EQ(part.hyperlinks().size(), 2u);
    EXPECT_EQ(part.hyperlinks()[0].target, "https://example.com/");
    EXPECT_EQ(part.hyperlinks()[0].target_mode, "External");
    EXPECT_EQ(part.hyperlinks()[1].target, "#bookmark");
    EXPECT_EQ(part.hyperlinks()[1].target_mode, "External");

    EXPECT_EQ(result->media->size(), 1u);
    // 部件自身关系ID不影响主文档ID分配
    EXPECT_EQ(result->next_relationship_id, 2u);
}

TEST_F(TemplateImporterTest, SharedImageIsStoredOnce) {
    PackageBuilder builder = PackageBuilder::minimalTemplate(
        R"(<w:headerReference r:id="rId1"/><w:footerReference r:id="rId2"/>)",
        relationship("rId1", "header", "header1.xml") + relationship("rId2", "footer", "footer1.xml"));
    const std::string image_rels = relationshipsXml(relationship("rId1", "image", "media/image1.png"));
    builder.add("word/header1.xml", headerXml("H"))
           .add("word/footer1.xml", footerXml("F"))
           .add("word/_rels/header1.xml.rels", image_rels)
           .add("word/_rels/footer1.xml.rels", image_rels)
           .add("word/media/image1.png", pngBytes(5));

    auto result = importer_.importTemplate(builder.build());
    ASSERT_TRUE(result.hasValue()) << result.error().fullMessage();

    EXPECT_EQ(result->media->size(), 1u);
    EXPECT_EQ(result->headers[0].part.images()[0].media, result->footers[0].part.images()[0].media);
}

TEST_F(TemplateImporterTest, SharedMediaSpansImports) {
    auto media = std::make_shared<document::Media>();
    reader::ImportOptions options;
    options.shared_media = media;
    reader::TemplateImporter importer(options);

    PackageBuilder builder = PackageBuilder::minimalTemplate(
        R"(<w:headerReference r:id="rId1"/>)", relationship("rId1", "header", "header1.xml"));
    builder.add("word/header1.xml", headerXml("H"))
           .add("word/_rels/header1.xml.rels", relationshipsXml(relationship("rId7", "image", "media/logo.png")))
           .add("word/media/logo.png", pngBytes(9));
    const auto bytes = builder.build();

    auto first = importer.importTemplate(bytes);
    auto second = importer.importTemplate(bytes);
    ASSERT_TRUE(first.hasValue());
    ASSERT_TRUE(second.hasValue());

    EXPECT_EQ(first->media, media);
    EXPECT_EQ(second->media, media);
    EXPECT_EQ(media->size(), 1u);
    EXPECT_EQ(second->headers[0].part.images()[0].media->file_name, "image1.png");
}

TEST_F(TemplateImporterTest, MissingImagePartFails) {
    PackageBuilder builder = PackageBuilder::minimalTemplate(
        R"(<w:headerReference r:id="rId1"/>)", relationship("rId1", "header", "header1.xml"));
    builder.add("word/header1.xml", headerXml("H"))
           .add("word/_rels/header1.xml.rels", relationshipsXml(relationship("rId2", "image", "media/gone.png")));

    auto result = importer_.importTemplate(builder.build());
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, core::ErrorCode::PartNotFound);
    EXPECT_EQ(result.error().context, "word/media/gone.png");
}

TEST_F(TemplateImporterTest, MissingHeaderPartFails) {
    PackageBuilder builder = threePartTemplate();
    builder.remove("word/header2.xml");

    auto result = importer_.importTemplate(builder.build());
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, core::ErrorCode::PartNotFound);
    EXPECT_EQ(result.error().context, "word/header2.xml");
}

TEST_F(TemplateImporterTest, HeaderWithWrongRootFails) {
    PackageBuilder builder = threePartTemplate();
    builder.add("word/header1.xml", footerXml("not a header"));

    auto result = importer_.importTemplate(builder.build());
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, core::ErrorCode::MissingRootElement);
    EXPECT_EQ(result.error().context, "word/header1.xml");
}

TEST_F(TemplateImporterTest, MalformedHeaderXmlFails) {
    PackageBuilder builder = threePartTemplate();
    builder.add("word/footer1.xml", std::string("<w:ftr><w:p></w:ftr>"));

    auto result = importer_.importTemplate(builder.build());
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, core::ErrorCode::XmlParseError);
}

TEST_F(TemplateImporterTest, UnreadableContainerFails) {
    std::vector<uint8_t> garbage = {'P', 'K', 0x03, 0x04, 'x', 'y', 'z'};
    auto result = importer_.importTemplate(garbage);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, core::ErrorCode::ContainerUnreadable);

    auto missing = importer_.importTemplateFile(::testing::TempDir() + "no_such_template.dotx");
    ASSERT_TRUE(missing.hasError());
    EXPECT_EQ(missing.error().code, core::ErrorCode::ContainerUnreadable);
}

TEST_F(TemplateImporterTest, MissingStylesFails) {
    PackageBuilder builder = threePartTemplate();
    builder.remove("word/styles.xml");

    auto result = importer_.importTemplate(builder.build());
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, core::ErrorCode::PartNotFound);
    EXPECT_EQ(result.error().context, "word/styles.xml");
}

TEST_F(TemplateImporterTest, MissingDocumentRelationshipsFails) {
    PackageBuilder builder = threePartTemplate();
    builder.remove("word/_rels/document.xml.rels");

    auto result = importer_.importTemplate(builder.build());
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, core::ErrorCode::PartNotFound);
}

TEST_F(TemplateImporterTest, StylesFactoryFailures) {
    reader::ImportOptions throwing;
    throwing.styles_factory = std::make_shared<ThrowingStylesFactory>();
    auto thrown = reader::TemplateImporter(throwing).importTemplate(threePartTemplate().build());
    ASSERT_TRUE(thrown.hasError());
    EXPECT_EQ(thrown.error().code, core::ErrorCode::StylesImportFailed);
    EXPECT_NE(thrown.error().message.find("styles engine unavailable"), std::string::npos);

    reader::ImportOptions null_result;
    null_result.styles_factory = std::make_shared<NullStylesFactory>();
    auto empty = reader::TemplateImporter(null_result).importTemplate(threePartTemplate().build());
    ASSERT_TRUE(empty.hasError());
    EXPECT_EQ(empty.error().code, core::ErrorCode::StylesImportFailed);
}

TEST_F(TemplateImporterTest, DefaultStylesFactoryRejectsWrongRoot) {
    PackageBuilder builder = threePartTemplate();
    builder.add("word/styles.xml", std::string("<w:numbering/>"));

    auto result = importer_.importTemplate(builder.build());
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, core::ErrorCode::StylesImportFailed);
}

TEST_F(TemplateImporterTest, CustomStylesFactoryIsUsed) {
    auto factory = std::make_shared<CountingStylesFactory>();
    reader::ImportOptions options;
    options.styles_factory = factory;

    PackageBuilder builder = threePartTemplate();
    builder.add("word/styles.xml", std::string(kCharacterStylesXml));

    auto result = reader::TemplateImporter(options).importTemplate(builder.build());
    ASSERT_TRUE(result.hasValue()) << result.error().fullMessage();
    EXPECT_EQ(factory->calls, 1);
    EXPECT_EQ(factory->last_size, std::string(kCharacterStylesXml).size());
    EXPECT_NE(result->styles->findStyle("Strong"), nullptr);
}

TEST_F(TemplateImporterTest, UnknownReferenceTypeHonoursStrictness) {
    PackageBuilder builder = PackageBuilder::minimalTemplate(
        R"(<w:headerReference w:type="odd" r:id="rId1"/>)", relationship("rId1", "header", "header1.xml"));
    builder.add("word/header1.xml", headerXml("H"));
    const auto bytes = builder.build();

    auto strict = importer_.importTemplate(bytes);
    ASSERT_TRUE(strict.hasError());
    EXPECT_EQ(strict.error().code, core::ErrorCode::InvalidReferenceType);

    reader::ImportOptions options;
    options.strict_reference_types = false;
    auto lenient = reader::TemplateImporter(options).importTemplate(bytes);
    ASSERT_TRUE(lenient.hasValue());
    EXPECT_EQ(lenient->headers[0].type, HeaderFooterType::Default);
}

TEST_F(TemplateImporterTest, ParallelLoadingMatchesSequential) {
    PackageBuilder builder = threePartTemplate();
    builder.add("word/_rels/footer1.xml.rels", relationshipsXml(relationship("rId1", "image", "media/image1.png")))
           .add("word/media/image1.png", pngBytes(2));
    const auto bytes = builder.build();

    auto sequential = importer_.importTemplate(bytes);
    ASSERT_TRUE(sequential.hasValue()) << sequential.error().fullMessage();

    reader::ImportOptions options;
    options.worker_threads = 3;
    auto parallel = reader::TemplateImporter(options).importTemplate(bytes);
    ASSERT_TRUE(parallel.hasValue()) << parallel.error().fullMessage();

    ASSERT_EQ(parallel->headers.size(), sequential->headers.size());
    ASSERT_EQ(parallel->footers.size(), sequential->footers.size());
    for (size_t i = 0; i < sequential->headers.size(); ++i) {
        EXPECT_EQ(parallel->headers[i].type, sequential->headers[i].type);
        EXPECT_EQ(parallel->headers[i].part.relationshipId(), sequential->headers[i].part.relationshipId());
        EXPECT_EQ(parallel->headers[i].part.root(), sequential->headers[i].part.root());
    }
    EXPECT_EQ(parallel->footers[0].part.relationshipId(), 3u);
    EXPECT_EQ(parallel->footers[0].part.images().size(), 1u);
    EXPECT_EQ(parallel->next_relationship_id, sequential->next_relationship_id);
}

TEST_F(TemplateImporterTest, ParallelLoadingReportsFailure) {
    PackageBuilder builder = threePartTemplate();
    builder.remove("word/footer1.xml");

    reader::ImportOptions options;
    options.worker_threads = 2;
    auto result = reader::TemplateImporter(options).importTemplate(builder.build());
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, core::ErrorCode::PartNotFound);
    EXPECT_EQ(result.error().context, "word/footer1.xml");
}

TEST_F(TemplateImporterTest, ImporterIsReusable) {
    const auto bytes = threePartTemplate().build();
    auto first = importer_.importTemplate(bytes);
    auto second = importer_.importTemplate(bytes);
    ASSERT_TRUE(first.hasValue());
    ASSERT_TRUE(second.hasValue());

    EXPECT_EQ(first->next_relationship_id, second->next_relationship_id);
    EXPECT_EQ(second->headers[0].part.relationshipId(), 1u);
    EXPECT_NE(first->media, second->media);
}

TEST_F(TemplateImporterTest, ImportFromFile) {
    const std::string path = threePartTemplate().writeToFile("from_file.dotx");
    auto result = importer_.importTemplateFile(path);
    std::remove(path.c_str());

    ASSERT_TRUE(result.hasValue()) << result.error().fullMessage();
    EXPECT_EQ(result->partCount(), 3u);
}

TEST_F(TemplateImporterTest, PartWithoutOwnRelationshipsHasNoImagesOrHyperlinks) {
    PackageBuilder builder = threePartTemplate();

    auto result = importer_.importTemplate(builder.build());
    ASSERT_TRUE(result.hasValue()) << result.error().fullMessage();

    for (const auto& header : result->headers) {
        EXPECT_TRUE(header.part.images().empty());
        EXPECT_TRUE(header.part.hyperlinks().empty());
    }
    EXPECT_TRUE(result->footers.at(0).part.images().empty());
    EXPECT_TRUE(result->footers.at(0).part.hyperlinks().empty());
    EXPECT_TRUE(result->media->empty());
}

TEST_F(TemplateImporterTest, MovedBufferIsTakenOver) {
    std::vector<uint8_t> bytes = threePartTemplate().build();
    ASSERT_FALSE(bytes.empty());

    auto result = importer_.importTemplate(std::move(bytes));
    ASSERT_TRUE(result.hasValue()) << result.error().fullMessage();
    EXPECT_EQ(result->partCount(), 3u);
    EXPECT_TRUE(bytes.empty());

    std::vector<uint8_t> again = threePartTemplate().build();
    auto tpl = importer_.importTemplateOrThrow(std::move(again));
    EXPECT_EQ(tpl.next_relationship_id, 4u);
    EXPECT_TRUE(again.empty());
}

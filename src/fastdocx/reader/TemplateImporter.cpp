#include "fastdocx/reader/TemplateImporter.hpp"
#include "fastdocx/archive/ZipReader.hpp"
#include "fastdocx/xml/ParsedValueBuilder.hpp"
#include "fastdocx/xml/TreeConverter.hpp"
#include "fastdocx/opc/PartPath.hpp"
#include "fastdocx/opc/RelationshipIdAllocator.hpp"
#include "fastdocx/core/Constants.hpp"
#include "fastdocx/core/ExceptionBridge.hpp"
#include "fastdocx/core/ThreadPool.hpp"
#include "fastdocx/utils/ModuleLoggers.hpp"
#include <fmt/format.h>
#include <future>

namespace fastdocx {
namespace reader {

namespace {

core::Error partError(archive::ZipError error, const std::string& part_name) {
    if (error == archive::ZipError::FileNotFound) {
        return core::makeError(core::ErrorCode::PartNotFound,
                               fmt::format("Part '{}' not found in container", part_name), part_name);
    }
    return core::makeError(core::ErrorCode::PartReadError,
                           fmt::format("Failed to read part '{}': {}", part_name, archive::toString(error)),
                           part_name);
}

opc::RelationshipKind expectedKind(document::PartKind kind) {
    return kind == document::PartKind::Header ? opc::RelationshipKind::Header : opc::RelationshipKind::Footer;
}

const char* rootElementFor(document::PartKind kind) {
    return kind == document::PartKind::Header ? core::Constants::kHeaderRootElement
                                              : core::Constants::kFooterRootElement;
}

} // namespace

TemplateImporter::TemplateImporter() = default;

TemplateImporter::TemplateImporter(ImportOptions options) : options_(std::move(options)) {
}

core::Result<document::DocumentTemplate> TemplateImporter::importTemplate(std::vector<uint8_t> data) const {
    archive::ZipReader reader(std::move(data));
    return importFrom(reader);
}

core::Result<document::DocumentTemplate> TemplateImporter::importTemplateFile(const std::string& path) const {
    archive::ZipReader reader(path);
    return importFrom(reader);
}

document::DocumentTemplate TemplateImporter::importTemplateOrThrow(std::vector<uint8_t> data) const {
    return FASTDOCX_UNWRAP(importTemplate(std::move(data)));
}

core::Result<document::DocumentTemplate> TemplateImporter::importFrom(archive::ZipReader& reader) const {
    READER_INFO("开始导入模板: {}", reader.getSourceName());

    archive::ZipError open_result = reader.open();
    if (archive::isError(open_result)) {
        READER_ERROR("无法打开模板容器 {}: {}", reader.getSourceName(), archive::toString(open_result));
        return core::makeError(core::ErrorCode::ContainerUnreadable,
                               fmt::format("Template container is unreadable ({})", archive::toString(open_result)),
                               reader.getSourceName());
    }

    // 1. 样式
    auto styles = loadStyles(reader);
    if (!styles) {
        return styles.error();
    }

    // 2. 主文档中的引用
    auto document_xml = readTextPart(reader, core::Constants::kDocumentPart);
    if (!document_xml) {
        return document_xml.error();
    }

    document::ExtractorOptions extractor_options;
    extractor_options.strict_reference_types = options_.strict_reference_types;
    extractor_options.warn_on_multiple_sections = options_.warn_on_multiple_sections;
    auto section = document::DocumentReferenceExtractor(extractor_options).analyze(*document_xml);
    if (!section) {
        return section.error();
    }

    // 3. 主文档关系
    auto rels_xml = readTextPart(reader, core::Constants::kDocumentRelationshipsPart);
    if (!rels_xml) {
        return rels_xml.error();
    }
    auto relationships = opc::RelationshipIndex::parse(*rels_xml, core::Constants::kDocumentRelationshipsPart);
    if (!relationships) {
        return relationships.error();
    }

    // 4. 规划页眉页脚部件并预先分配ID
    auto jobs = planParts(section->references, *relationships);
    if (!jobs) {
        return jobs.error();
    }

    document::DocumentTemplate result;
    result.styles = std::move(styles.value());
    result.media = options_.shared_media ? options_.shared_media : std::make_shared<document::Media>();
    result.title_page_defined = section->title_page_defined;

    std::vector<core::Result<document::HeaderFooterPart>> loaded;
    loaded.reserve(jobs->size());

    if (options_.worker_threads > 0 && jobs->size() > 1) {
        READER_DEBUG("使用 {} 个线程并行加载 {} 个部件", options_.worker_threads, jobs->size());
        core::ThreadPool pool(options_.worker_threads);
        std::vector<std::future<core::Result<document::HeaderFooterPart>>> futures;
        futures.reserve(jobs->size());
        for (const PartJob& job : *jobs) {
            futures.push_back(pool.enqueue([this, &reader, &job, &result]() {
                return loadPart(reader, job, result.media);
            }));
        }
        for (auto& future : futures) {
            loaded.push_back(future.get());
        }
    } else {
        for (const PartJob& job : *jobs) {
            loaded.push_back(loadPart(reader, job, result.media));
            if (!loaded.back()) {
                break;
            }
        }
    }

    // 5. 按源顺序组装，第一个错误即整体失败
    for (size_t i = 0; i < loaded.size(); ++i) {
        if (!loaded[i]) {
            READER_ERROR("加载部件失败: {}", loaded[i].error().fullMessage());
            return loaded[i].error();
        }
        const PartJob& job = (*jobs)[i];
        document::PlacedPart placed{job.type, std::move(loaded[i].value())};
        if (job.kind == document::PartKind::Header) {
            result.headers.push_back(std::move(placed));
        } else {
            result.footers.push_back(std::move(placed));
        }
    }

    result.next_relationship_id = static_cast<uint32_t>(1 + jobs->size());

    READER_INFO("模板导入完成: {} 个页眉, {} 个页脚, {} 张图片, titlePg={}, 下一个关系ID={}",
                result.headers.size(), result.footers.size(), result.media->size(),
                result.title_page_defined, result.next_relationship_id);
    return result;
}

core::Result<std::shared_ptr<document::Styles>> TemplateImporter::loadStyles(const archive::ZipReader& reader) const {
    auto styles_xml = readTextPart(reader, core::Constants::kStylesPart);
    if (!styles_xml) {
        return styles_xml.error();
    }

    std::shared_ptr<const document::IStylesFactory> factory = options_.styles_factory;
    if (!factory) {
        factory = std::make_shared<document::ExternalStylesFactory>();
    }

    auto styles = core::ExceptionBridge::wrapCall([&]() {
        return factory->newInstance(*styles_xml);
    });
    if (!styles) {
        READER_ERROR("样式导入失败: {}", styles.error().message);
        return core::makeError(core::ErrorCode::StylesImportFailed,
                               fmt::format("Styles import failed: {}", styles.error().message),
                               core::Constants::kStylesPart);
    }
    if (!styles.value()) {
        return core::makeError(core::ErrorCode::StylesImportFailed,
                               "Styles factory returned no styles", core::Constants::kStylesPart);
    }
    return std::shared_ptr<document::Styles>(std::move(styles.value()));
}

core::Result<std::vector<TemplateImporter::PartJob>> TemplateImporter::planParts(
    const document::DocumentReferences& references, const opc::RelationshipIndex& relationships) const {
    std::vector<PartJob> jobs;
    jobs.reserve(references.headers.size() + references.footers.size());

    opc::RelationshipIdAllocator allocator;
    const std::string main_directory = opc::directoryOf(core::Constants::kDocumentPart);

    auto plan = [&](const std::vector<document::DocumentReference>& group,
                    document::PartKind kind) -> core::VoidResult {
        for (const auto& reference : group) {
            const opc::RelationshipEntry* entry = relationships.findById(reference.relationship_id);
            if (!entry) {
                return core::makeError(core::ErrorCode::MissingRelationshipTarget,
                                       fmt::format("Can not find target file for id {}", reference.relationship_id),
                                       fmt::format("rId{}", reference.relationship_id));
            }
            if (entry->kind != expectedKind(kind)) {
                READER_WARN("{}引用 rId{} 指向 {} 类型的关系", document::toString(kind),
                            reference.relationship_id, opc::toString(entry->kind));
            }

            PartJob job{kind, reference.type, *entry,
                        opc::resolvePartPath(main_directory, entry->target), allocator.next()};
            READER_DEBUG("{} {} rId{} -> {} 分配ID {}", document::toString(kind),
                         document::toString(job.type), entry->id, job.part_name, job.assigned_id);
            jobs.push_back(std::move(job));
        }
        return core::success();
    };

    auto headers = plan(references.headers, document::PartKind::Header);
    if (!headers) {
        return headers.error();
    }
    auto footers = plan(references.footers, document::PartKind::Footer);
    if (!footers) {
        return footers.error();
    }
    return jobs;
}

core::Result<document::HeaderFooterPart> TemplateImporter::loadPart(const archive::ZipReader& reader,
                                                                   const PartJob& job,
                                                                   const std::shared_ptr<document::Media>& media) const {
    auto xml_content = readTextPart(reader, job.part_name);
    if (!xml_content) {
        return xml_content.error();
    }

    auto parsed = xml::ParsedValueBuilder::parse(*xml_content, job.part_name);
    if (!parsed) {
        return parsed.error();
    }

    auto root = xml::TreeConverter::convertRoot(rootElementFor(job.kind), *parsed, job.part_name);
    if (!root) {
        return root.error();
    }

    document::HeaderFooterPart part(job.kind, job.assigned_id, job.part_name, std::move(root.value()), media);

    auto nested = resolveNestedRelationships(reader, part);
    if (!nested) {
        return nested.error();
    }
    return part;
}

core::VoidResult TemplateImporter::resolveNestedRelationships(const archive::ZipReader& reader,
                                                              document::HeaderFooterPart& part) const {
    const std::string rels_path = opc::relationshipsPathFor(part.partName());

    archive::ZipError exists = reader.fileExists(rels_path);
    if (exists == archive::ZipError::FileNotFound) {
        READER_DEBUG("{} 没有关系文件", part.partName());
        return core::success();
    }
    if (archive::isError(exists)) {
        return partError(exists, rels_path);
    }

    auto rels_xml = readTextPart(reader, rels_path);
    if (!rels_xml) {
        return rels_xml.error();
    }
    auto relationships = opc::RelationshipIndex::parse(*rels_xml, rels_path);
    if (!relationships) {
        return relationships.error();
    }

    const std::string part_directory = opc::directoryOf(part.partName());

    for (const opc::RelationshipEntry* image : relationships->findByKind(opc::RelationshipKind::Image)) {
        if (image->target_mode == core::Constants::kTargetModeExternal) {
            READER_WARN("{}: 跳过外部链接图片 rId{} -> {}", part.partName(), image->id, image->target);
            continue;
        }
        const std::string image_path = opc::resolvePartPath(part_directory, image->target);
        auto data = readBinaryPart(reader, image_path);
        if (!data) {
            return data.error();
        }
        part.addImageRelationship(std::move(data.value()), image->id, image_path);
    }

    for (const opc::RelationshipEntry* link : relationships->findByKind(opc::RelationshipKind::Hyperlink)) {
        part.addHyperlinkRelationship(link->target, link->id, core::Constants::kTargetModeExternal);
    }

    return core::success();
}

core::Result<std::string> TemplateImporter::readTextPart(const archive::ZipReader& reader,
                                                         const std::string& part_name) {
    std::string content;
    archive::ZipError error = reader.extractFile(part_name, content);
    if (archive::isError(error)) {
        return partError(error, part_name);
    }
    READER_DEBUG("读取部件 {} ({} 字节)", part_name, content.size());
    return content;
}

core::Result<std::vector<uint8_t>> TemplateImporter::readBinaryPart(const archive::ZipReader& reader,
                                                                    const std::string& part_name) {
    std::vector<uint8_t> data;
    archive::ZipError error = reader.extractFile(part_name, data);
    if (archive::isError(error)) {
        return partError(error, part_name);
    }
    return data;
}

}} // namespace fastdocx::reader

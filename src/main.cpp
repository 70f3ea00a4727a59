/**
 * @file main.cpp
 * @brief fastdocx_inspect - 导入DOTX模板并输出摘要
 *
 * 用法: fastdocx_inspect <template.dotx> [--xml]
 * 退出码: 0 成功, 1 导入失败, 2 参数错误
 */

#include "fastdocx/FastDocx.hpp"
#include "fastdocx/xml/TreeConverter.hpp"
#include "fastdocx/xml/XmlableWriter.hpp"
#include "fastdocx/utils/Logger.hpp"
#include <fmt/format.h>
#include <string>
#include <vector>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitImportFailed = 1;
constexpr int kExitUsage = 2;

void printUsage(const char* program) {
    fmt::print(stderr, "Usage: {} <template.dotx> [--xml]\n", program);
}

bool printParts(const char* label, const std::vector<fastdocx::document::PlacedPart>& parts, bool dump_xml) {
    for (const auto& placed : parts) {
        const auto& part = placed.part;
        fmt::print("  {} [{}] rId{} <- {} (images: {}, hyperlinks: {})\n",
                   label, fastdocx::document::toString(placed.type), part.relationshipId(),
                   part.partName(), part.images().size(), part.hyperlinks().size());
        if (!dump_xml) {
            continue;
        }
        auto xml = fastdocx::xml::XmlableWriter::write(fastdocx::xml::TreeConverter::toSerializable(part.root()), false);
        if (!xml) {
            fmt::print(stderr, "  serialization failed: {}\n", xml.error().fullMessage());
            return false;
        }
        fmt::print("{}\n", *xml);
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string path;
    bool dump_xml = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--xml") {
            dump_xml = true;
        } else if (!arg.empty() && arg[0] == '-') {
            printUsage(argv[0]);
            return kExitUsage;
        } else if (path.empty()) {
            path = arg;
        } else {
            printUsage(argv[0]);
            return kExitUsage;
        }
    }
    if (path.empty()) {
        printUsage(argv[0]);
        return kExitUsage;
    }

    if (!fastdocx::initialize("logs/fastdocx_inspect.log", false)) {
        return kExitImportFailed;
    }

    fastdocx::reader::TemplateImporter importer;
    auto result = importer.importTemplateFile(path);
    if (!result) {
        const auto& error = result.error();
        fmt::print(stderr, "Import failed [{}]: {}\n", fastdocx::core::toString(error.code), error.fullMessage());
        fastdocx::cleanup();
        return kExitImportFailed;
    }

    const auto& doc = *result;
    fmt::print("Template: {}\n", path);
    fmt::print("Headers: {}\n", doc.headers.size());
    bool ok = printParts("header", doc.headers, dump_xml);
    fmt::print("Footers: {}\n", doc.footers.size());
    ok = printParts("footer", doc.footers, dump_xml) && ok;
    fmt::print("Title page: {}\n", doc.title_page_defined ? "yes" : "no");
    fmt::print("Styles: {}\n", doc.styles->styleCount());
    fmt::print("Media: {}\n", doc.media->size());
    fmt::print("Next relationship id: {}\n", doc.next_relationship_id);

    fastdocx::cleanup();
    return ok ? kExitSuccess : kExitImportFailed;
}

#include "PackageBuilder.hpp"

#include <mz.h>
#include <mz_strm.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>

#include <gtest/gtest.h>

#include <atomic>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace fastdocx {
namespace test {

namespace {

constexpr const char* kWordNs = "http://schemas.openxmlformats.org/wordprocessingml/2006/main";
constexpr const char* kRelNs = "http://schemas.openxmlformats.org/officeDocument/2006/relationships";
constexpr const char* kPackageRelNs = "http://schemas.openxmlformats.org/package/2006/relationships";

std::string tempPath(const std::string& file_name) {
    static std::atomic<int> counter{0};
    std::filesystem::path dir(::testing::TempDir());
    return (dir / (std::to_string(counter.fetch_add(1)) + "_" + file_name)).string();
}

void writeZip(const std::string& path, const std::map<std::string, std::vector<uint8_t>>& entries) {
    void* writer = mz_zip_writer_create();
    if (!writer) {
        throw std::runtime_error("mz_zip_writer_create failed");
    }
    mz_zip_writer_set_compress_method(writer, MZ_COMPRESS_METHOD_DEFLATE);
    mz_zip_writer_set_compress_level(writer, 6);

    int32_t result = mz_zip_writer_open_file(writer, path.c_str(), 0, 0);
    if (result != MZ_OK) {
        mz_zip_writer_delete(&writer);
        throw std::runtime_error("Failed to open zip for writing: " + path);
    }

    const std::time_t now = std::time(nullptr);
    for (const auto& [name, content] : entries) {
        mz_zip_file file_info = {};
        file_info.filename = name.c_str();
        file_info.uncompressed_size = static_cast<int64_t>(content.size());
        file_info.compression_method = MZ_COMPRESS_METHOD_DEFLATE;
        file_info.modified_date = now;
        file_info.creation_date = now;
        file_info.version_madeby = MZ_VERSION_MADEBY;

        result = mz_zip_writer_entry_open(writer, &file_info);
        if (result == MZ_OK && !content.empty()) {
            int32_t written = mz_zip_writer_entry_write(writer, content.data(), static_cast<int32_t>(content.size()));
            if (written != static_cast<int32_t>(content.size())) {
                result = MZ_WRITE_ERROR;
            }
        }
        if (result == MZ_OK) {
            result = mz_zip_writer_entry_close(writer);
        }
        if (result != MZ_OK) {
            mz_zip_writer_close(writer);
            mz_zip_writer_delete(&writer);
            throw std::runtime_error("Failed to write zip entry: " + name);
        }
    }

    result = mz_zip_writer_close(writer);
    mz_zip_writer_delete(&writer);
    if (result != MZ_OK) {
        throw std::runtime_error("Failed to finalize zip: " + path);
    }
}

} // namespace

PackageBuilder& PackageBuilder::add(const std::string& path, const std::string& content) {
    entries_[path] = std::vector<uint8_t>(content.begin(), content.end());
    return *this;
}

PackageBuilder& PackageBuilder::add(const std::string& path, const std::vector<uint8_t>& data) {
    entries_[path] = data;
    return *this;
}

PackageBuilder& PackageBuilder::remove(const std::string& path) {
    entries_.erase(path);
    return *this;
}

std::vector<uint8_t> PackageBuilder::build() const {
    const std::string path = writeToFile("package.dotx");
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to read back package: " + path);
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    in.close();
    std::error_code ec;
    std::filesystem::remove(path, ec);
    return bytes;
}

std::string PackageBuilder::writeToFile(const std::string& file_name) const {
    const std::string path = tempPath(file_name);
    writeZip(path, entries_);
    return path;
}

PackageBuilder PackageBuilder::minimalTemplate(const std::string& section_properties,
                                               const std::string& relationships) {
    PackageBuilder builder;
    builder.add("word/styles.xml", stylesXml())
           .add("word/document.xml", documentXml(section_properties))
           .add("word/_rels/document.xml.rels", relationshipsXml(relationships));
    return builder;
}

std::string stylesXml() {
    return std::string(R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)") +
           "<w:styles xmlns:w=\"" + kWordNs + "\">"
           "<w:docDefaults><w:rPrDefault><w:rPr><w:sz w:val=\"22\"/></w:rPr></w:rPrDefault></w:docDefaults>"
           "<w:style w:type=\"paragraph\" w:default=\"1\" w:styleId=\"Normal\"><w:name w:val=\"Normal\"/></w:style>"
           "<w:style w:type=\"paragraph\" w:styleId=\"Heading1\"><w:name w:val=\"heading 1\"/></w:style>"
           "</w:styles>";
}

std::string documentXml(const std::string& section_properties, const std::string& extra_body) {
    return std::string(R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)") +
           "<w:document xmlns:w=\"" + kWordNs + "\" xmlns:r=\"" + kRelNs + "\">"
           "<w:body><w:p><w:r><w:t>Body</w:t></w:r></w:p>" + extra_body +
           "<w:sectPr>" + section_properties + "</w:sectPr>"
           "</w:body></w:document>";
}

std::string relationshipsXml(const std::string& entries) {
    return std::string(R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)") +
           "<Relationships xmlns=\"" + kPackageRelNs + "\">" + entries + "</Relationships>";
}

std::string relationship(const std::string& id, const std::string& kind, const std::string& target,
                         const std::string& target_mode) {
    std::string result = "<Relationship Id=\"" + id + "\" Type=\"" + kRelNs + "/" + kind +
                         "\" Target=\"" + target + "\"";
    if (!target_mode.empty()) {
        result += " TargetMode=\"" + target_mode + "\"";
    }
    return result + "/>";
}

std::string headerXml(const std::string& text) {
    return std::string(R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)") +
           "<w:hdr xmlns:w=\"" + kWordNs + "\" xmlns:r=\"" + kRelNs + "\">"
           "<w:p><w:r><w:t>" + text + "</w:t></w:r></w:p></w:hdr>";
}

std::string footerXml(const std::string& text) {
    return std::string(R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)") +
           "<w:ftr xmlns:w=\"" + kWordNs + "\" xmlns:r=\"" + kRelNs + "\">"
           "<w:p><w:r><w:t>" + text + "</w:t></w:r></w:p></w:ftr>";
}

std::vector<uint8_t> pngBytes(uint8_t seed) {
    std::vector<uint8_t> data = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A,
                                 0x00, 0x00, 0x00, 0x0D, 0x49, 0x48, 0x44, 0x52};
    data.push_back(seed);
    return data;
}

}} // namespace fastdocx::test

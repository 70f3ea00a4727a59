#include "fastdocx/archive/ZipReader.hpp"
#include "fastdocx/utils/ModuleLoggers.hpp"
#include <mz.h>
#include <mz_strm.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>
#include <array>
#include <algorithm>

namespace fastdocx {
namespace archive {

ZipReader::ZipReader(const std::string& path)
    : filepath_(path), source_name_(path) {
}

ZipReader::ZipReader(std::vector<uint8_t> buffer)
    : buffer_(std::move(buffer)), from_memory_(true), source_name_("<memory>") {
}

ZipReader::~ZipReader() {
    cleanup();
}

ZipError ZipReader::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    cleanup();  // 清理之前的状态
    return initializeReader();
}

void ZipReader::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    cleanup();
}

std::vector<std::string> ZipReader::listFiles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> files;

    if (!is_open_) {
        return files;
    }

    files.reserve(entry_cache_.size());
    for (const auto& [key, info] : entry_cache_) {
        files.push_back(info.path);
    }
    std::sort(files.begin(), files.end());
    return files;
}

ZipError ZipReader::fileExists(std::string_view internal_path) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!is_open_) {
        return ZipError::NotOpen;
    }
    return findEntry(internal_path) ? ZipError::Ok : ZipError::FileNotFound;
}

bool ZipReader::getEntryInfo(std::string_view internal_path, EntryInfo& info) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!is_open_) {
        return false;
    }

    const EntryInfo* entry = findEntry(internal_path);
    if (!entry) {
        return false;
    }
    info = *entry;
    return true;
}

ZipError ZipReader::extractFile(std::string_view internal_path, std::string& content) const {
    std::vector<uint8_t> data;
    ZipError result = extractFile(internal_path, data);
    if (result != ZipError::Ok) {
        return result;
    }

    content.assign(reinterpret_cast<const char*>(data.data()), data.size());
    return ZipError::Ok;
}

ZipError ZipReader::extractFile(std::string_view internal_path, std::vector<uint8_t>& data) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return extractFileInternal(internal_path, data);
}

ZipError ZipReader::extractFileInternal(std::string_view internal_path,
                                        std::vector<uint8_t>& data) const {
    if (!is_open_ || !unzip_handle_) {
        ARCHIVE_ERROR("Zip archive not opened for reading");
        return ZipError::NotOpen;
    }

    const EntryInfo* entry = findEntry(internal_path);
    if (!entry || entry->is_directory) {
        ARCHIVE_DEBUG("条目不存在: {}", internal_path);
        return ZipError::FileNotFound;
    }

    if (entry->uncompressed_size > kMaxEntrySize) {
        ARCHIVE_ERROR("Entry {} too large: {} bytes", entry->path, entry->uncompressed_size);
        return ZipError::TooLarge;
    }

    // 用缓存中的原始名称精确定位
    if (mz_zip_reader_locate_entry(unzip_handle_, entry->path.c_str(), 0) != MZ_OK) {
        ARCHIVE_ERROR("Failed to locate entry: {}", entry->path);
        return ZipError::FileNotFound;
    }

    if (mz_zip_reader_entry_open(unzip_handle_) != MZ_OK) {
        ARCHIVE_ERROR("Failed to open entry: {}", entry->path);
        return ZipError::IoFail;
    }

    std::vector<uint8_t> buf;
    buf.reserve(static_cast<size_t>(entry->uncompressed_size));

    std::array<uint8_t, 8192> chunk;
    int32_t bytes_read = 0;
    do {
        bytes_read = mz_zip_reader_entry_read(unzip_handle_, chunk.data(),
                                              static_cast<int32_t>(chunk.size()));
        if (bytes_read > 0) {
            buf.insert(buf.end(), chunk.begin(), chunk.begin() + bytes_read);
        }
    } while (bytes_read > 0);

    mz_zip_reader_entry_close(unzip_handle_);

    if (bytes_read < 0) {
        ARCHIVE_ERROR("Read error {} on entry {}", bytes_read, entry->path);
        return ZipError::IoFail;
    }

    if (buf.size() != entry->uncompressed_size) {
        ARCHIVE_ERROR("Incomplete read for entry {}, expected: {} bytes, read: {} bytes",
                      entry->path, entry->uncompressed_size, buf.size());
        return ZipError::IoFail;
    }

    data.swap(buf);
    FASTDOCX_LOG_ZIP_DEBUG("Extracted {} from zip, size: {} bytes", entry->path, data.size());
    return ZipError::Ok;
}

ZipError ZipReader::initializeReader() {
    unzip_handle_ = mz_zip_reader_create();
    if (!unzip_handle_) {
        ARCHIVE_ERROR("Failed to create zip reader");
        return ZipError::InternalError;
    }

    int32_t result = MZ_OK;
    if (from_memory_) {
        if (buffer_.empty()) {
            ARCHIVE_ERROR("ZIP缓冲区为空");
            mz_zip_reader_delete(&unzip_handle_);
            unzip_handle_ = nullptr;
            return ZipError::BadFormat;
        }
        if (buffer_.size() > kMaxEntrySize) {
            mz_zip_reader_delete(&unzip_handle_);
            unzip_handle_ = nullptr;
            return ZipError::TooLarge;
        }
        result = mz_zip_reader_open_buffer(unzip_handle_, buffer_.data(),
                                           static_cast<int32_t>(buffer_.size()), 0);
    } else {
        result = mz_zip_reader_open_file(unzip_handle_, filepath_.c_str());
    }

    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open zip for reading: {}, error: {}", source_name_, result);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
        return (result == MZ_OPEN_ERROR || result == MZ_EXIST_ERROR) ? ZipError::IoFail : ZipError::BadFormat;
    }

    is_open_ = true;
    buildEntryCache();
    ARCHIVE_DEBUG("Zip archive opened for reading: {} ({} entries)", source_name_, entry_cache_.size());
    return ZipError::Ok;
}

void ZipReader::cleanup() {
    if (unzip_handle_) {
        mz_zip_reader_close(unzip_handle_);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
    }

    is_open_ = false;
    entry_cache_.clear();
}

void ZipReader::buildEntryCache() {
    entry_cache_.clear();

    if (mz_zip_reader_goto_first_entry(unzip_handle_) != MZ_OK) {
        return;
    }

    do {
        mz_zip_file* file_info = nullptr;
        if (mz_zip_reader_entry_get_info(unzip_handle_, &file_info) == MZ_OK && file_info) {
            if (file_info->filename && file_info->filename[0] != '\0') {
                EntryInfo info;
                info.path = file_info->filename;
                info.compressed_size = static_cast<uint64_t>(file_info->compressed_size);
                info.uncompressed_size = static_cast<uint64_t>(file_info->uncompressed_size);
                info.crc32 = file_info->crc;
                info.modified_date = file_info->modified_date;
                info.is_directory = (info.path.back() == '/');

                // 重名条目以第一个为准
                const std::string key = toLowerAscii(info.path);
                if (!entry_cache_.emplace(key, info).second) {
                    ARCHIVE_WARN("Duplicate entry name in zip: {}", info.path);
                }
            }
        }
    } while (mz_zip_reader_goto_next_entry(unzip_handle_) == MZ_OK);
}

const ZipReader::EntryInfo* ZipReader::findEntry(std::string_view path) const {
    // 部件名可带前导"/"
    if (!path.empty() && path.front() == '/') {
        path.remove_prefix(1);
    }
    auto it = entry_cache_.find(toLowerAscii(path));
    return it != entry_cache_.end() ? &it->second : nullptr;
}

std::string ZipReader::toLowerAscii(std::string_view path) {
    std::string lowered(path);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>((c >= 'A' && c <= 'Z') ? c + ('a' - 'A') : c);
    });
    return lowered;
}

}} // namespace fastdocx::archive

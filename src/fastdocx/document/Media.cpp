#include "fastdocx/document/Media.hpp"
#include "fastdocx/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <cctype>
#include <functional>
#include <fmt/format.h>

namespace fastdocx {
namespace document {

namespace {

size_t hashContent(const std::vector<uint8_t>& data) {
    return std::hash<std::string_view>{}(
        std::string_view(reinterpret_cast<const char*>(data.data()), data.size()));
}

} // namespace

std::shared_ptr<const MediaData> Media::addImage(std::vector<uint8_t> data, const std::string& source_path) {
    const size_t hash = hashContent(data);

    std::lock_guard<std::mutex> lock(mutex_);

    auto range = content_index_.equal_range(hash);
    for (auto it = range.first; it != range.second; ++it) {
        const auto& existing = items_[it->second];
        if (existing->data == data) {
            DOC_DEBUG("图片 {} 与 {} 内容相同, 复用", source_path, existing->file_name);
            return existing;
        }
    }

    ImageFormat format = detectFormat(data);
    if (format == ImageFormat::UNKNOWN) {
        format = formatFromExtension(source_path);
    }
    if (format == ImageFormat::UNKNOWN) {
        DOC_WARN("无法识别图片格式: {}", source_path);
    }

    auto item = std::make_shared<MediaData>();
    item->format = format;
    item->source_path = source_path;
    item->file_name = fmt::format("image{}", items_.size() + 1);
    if (format != ImageFormat::UNKNOWN) {
        item->file_name += '.';
        item->file_name += getExtension(format);
    }
    item->data = std::move(data);

    DOC_DEBUG("添加图片 {} ({}, {} 字节) 来自 {}", item->file_name, formatToString(format),
              item->data.size(), source_path);

    content_index_.emplace(hash, items_.size());
    items_.push_back(item);
    return item;
}

size_t Media::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

std::vector<std::shared_ptr<const MediaData>> Media::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_;
}

ImageFormat Media::detectFormat(const std::vector<uint8_t>& data) {
    if (data.size() < 8) {
        return ImageFormat::UNKNOWN;
    }

    const uint8_t* bytes = data.data();

    // PNG: 89 50 4E 47 0D 0A 1A 0A
    if (bytes[0] == 0x89 && bytes[1] == 0x50 && bytes[2] == 0x4E && bytes[3] == 0x47 &&
        bytes[4] == 0x0D && bytes[5] == 0x0A && bytes[6] == 0x1A && bytes[7] == 0x0A) {
        return ImageFormat::PNG;
    }

    // JPEG: FF D8 FF
    if (bytes[0] == 0xFF && bytes[1] == 0xD8 && bytes[2] == 0xFF) {
        return ImageFormat::JPEG;
    }

    // GIF: GIF87a or GIF89a
    if (bytes[0] == 'G' && bytes[1] == 'I' && bytes[2] == 'F' &&
        bytes[3] == '8' && (bytes[4] == '7' || bytes[4] == '9') && bytes[5] == 'a') {
        return ImageFormat::GIF;
    }

    // BMP: BM
    if (bytes[0] == 'B' && bytes[1] == 'M') {
        return ImageFormat::BMP;
    }

    return ImageFormat::UNKNOWN;
}

ImageFormat Media::formatFromExtension(std::string_view filename) {
    size_t dot_pos = filename.find_last_of('.');
    if (dot_pos == std::string_view::npos) {
        return ImageFormat::UNKNOWN;
    }

    std::string ext(filename.substr(dot_pos + 1));
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == "png") return ImageFormat::PNG;
    if (ext == "jpg" || ext == "jpeg") return ImageFormat::JPEG;
    if (ext == "gif") return ImageFormat::GIF;
    if (ext == "bmp") return ImageFormat::BMP;

    return ImageFormat::UNKNOWN;
}

const char* Media::formatToString(ImageFormat format) noexcept {
    switch (format) {
        case ImageFormat::PNG:  return "PNG";
        case ImageFormat::JPEG: return "JPEG";
        case ImageFormat::GIF:  return "GIF";
        case ImageFormat::BMP:  return "BMP";
        default:                return "UNKNOWN";
    }
}

const char* Media::getExtension(ImageFormat format) noexcept {
    switch (format) {
        case ImageFormat::PNG:  return "png";
        case ImageFormat::JPEG: return "jpg";
        case ImageFormat::GIF:  return "gif";
        case ImageFormat::BMP:  return "bmp";
        default:                return "";
    }
}

}} // namespace fastdocx::document

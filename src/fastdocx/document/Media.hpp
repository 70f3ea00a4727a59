#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace fastdocx {
namespace document {

/**
 * @brief 图片格式枚举
 */
enum class ImageFormat : uint8_t {
    PNG = 0,
    JPEG = 1,
    GIF = 2,
    BMP = 3,
    UNKNOWN = 255
};

/**
 * @brief 媒体库中的一张图片
 */
struct MediaData {
    std::string file_name;          // 库内文件名，如 "image1.png"
    std::string source_path;        // 首次导入时的包内路径
    ImageFormat format = ImageFormat::UNKNOWN;
    std::vector<uint8_t> data;
};

/**
 * @brief 线程安全的图片库
 *
 * 按内容去重：相同字节只保存一份，再次添加返回已有条目。
 * 可在多次导入之间共享。
 */
class Media {
public:
    Media() = default;

    Media(const Media&) = delete;
    Media& operator=(const Media&) = delete;

    /**
     * @brief 添加图片
     * @param data 图片二进制数据
     * @param source_path 包内路径，用于格式回退判断和日志
     * @return 库中的条目（新建或已有）
     */
    std::shared_ptr<const MediaData> addImage(std::vector<uint8_t> data, const std::string& source_path);

    size_t size() const;
    bool empty() const { return size() == 0; }

    /**
     * @brief 按添加顺序返回所有条目
     */
    std::vector<std::shared_ptr<const MediaData>> all() const;

    /**
     * @brief 根据文件头判断格式
     */
    static ImageFormat detectFormat(const std::vector<uint8_t>& data);

    /**
     * @brief 根据扩展名判断格式
     */
    static ImageFormat formatFromExtension(std::string_view filename);

    static const char* formatToString(ImageFormat format) noexcept;
    static const char* getExtension(ImageFormat format) noexcept;

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<const MediaData>> items_;
    std::unordered_multimap<size_t, size_t> content_index_;  // 内容哈希 -> items_下标
};

}} // namespace fastdocx::document

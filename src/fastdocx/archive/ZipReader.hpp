#pragma once

#include "fastdocx/archive/ZipError.hpp"
#include <cstdint>
#include <ctime>
#include <string>
#include <vector>
#include <string_view>
#include <mutex>
#include <unordered_map>

namespace fastdocx {
namespace archive {

/**
 * @brief ZIP读取器 - 模板包的只读访问
 *
 * 特性：
 * - 线程安全（条目读取串行化）
 * - 条目信息缓存
 * - 支持从文件路径或内存缓冲区打开
 * - 条目名按ASCII大小写不敏感匹配（OPC部件名规则）
 */
class ZipReader {
public:
    struct EntryInfo {
        std::string path;
        uint64_t compressed_size = 0;
        uint64_t uncompressed_size = 0;
        uint32_t crc32 = 0;
        time_t modified_date = 0;
        bool is_directory = false;
    };

    /**
     * @brief 从文件路径构造
     */
    explicit ZipReader(const std::string& path);

    /**
     * @brief 从内存构造，读取器持有数据副本
     */
    explicit ZipReader(std::vector<uint8_t> buffer);

    ~ZipReader();

    // 禁止拷贝
    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;

    /**
     * 打开ZIP进行读取
     * @return Ok、IoFail（文件不可读）或BadFormat（不是ZIP）
     */
    ZipError open();

    void close();

    bool isOpen() const { return is_open_; }

    /**
     * 获取所有条目路径（保留包内原始大小写）
     */
    std::vector<std::string> listFiles() const;

    /**
     * 检查条目是否存在
     * @return Ok、NotOpen或FileNotFound
     */
    ZipError fileExists(std::string_view internal_path) const;

    bool getEntryInfo(std::string_view internal_path, EntryInfo& info) const;

    /**
     * 提取条目到字符串
     */
    ZipError extractFile(std::string_view internal_path, std::string& content) const;

    /**
     * 提取条目到字节数组
     */
    ZipError extractFile(std::string_view internal_path, std::vector<uint8_t>& data) const;

    /**
     * 数据来源描述（文件路径或"<memory>"），用于日志
     */
    const std::string& getSourceName() const { return source_name_; }

private:
    void* unzip_handle_ = nullptr;
    std::string filepath_;
    std::vector<uint8_t> buffer_;
    bool from_memory_ = false;
    std::string source_name_;
    bool is_open_ = false;
    mutable std::mutex mutex_;

    // 条目信息缓存，键为小写路径
    std::unordered_map<std::string, EntryInfo> entry_cache_;

    static constexpr uint64_t kMaxEntrySize = 0x7FFFFFFF;

    ZipError initializeReader();
    void cleanup();
    void buildEntryCache();
    const EntryInfo* findEntry(std::string_view path) const;
    ZipError extractFileInternal(std::string_view internal_path,
                                 std::vector<uint8_t>& data) const;

    static std::string toLowerAscii(std::string_view path);
};

}} // namespace fastdocx::archive

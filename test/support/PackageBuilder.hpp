#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace fastdocx {
namespace test {

/**
 * @brief 测试用模板包构造器
 *
 * 条目先收集在内存中，build()时通过minizip-ng写成zip并返回字节。
 */
class PackageBuilder {
public:
    PackageBuilder& add(const std::string& path, const std::string& content);
    PackageBuilder& add(const std::string& path, const std::vector<uint8_t>& data);
    PackageBuilder& remove(const std::string& path);

    /**
     * @throws std::runtime_error 写包失败
     */
    std::vector<uint8_t> build() const;

    /**
     * @brief 写入临时目录下的文件并返回完整路径
     */
    std::string writeToFile(const std::string& file_name) const;

    /**
     * @brief 只含styles.xml、document.xml与主关系文件的最小模板
     */
    static PackageBuilder minimalTemplate(const std::string& section_properties,
                                          const std::string& relationships);

private:
    std::map<std::string, std::vector<uint8_t>> entries_;
};

// ========== 部件内容 ==========

std::string stylesXml();
std::string documentXml(const std::string& section_properties, const std::string& extra_body = "");
std::string relationshipsXml(const std::string& entries);
std::string relationship(const std::string& id, const std::string& kind, const std::string& target,
                         const std::string& target_mode = "");
std::string headerXml(const std::string& text);
std::string footerXml(const std::string& text);

/**
 * @brief 最小的合法PNG文件头加数据
 */
std::vector<uint8_t> pngBytes(uint8_t seed);

}} // namespace fastdocx::test

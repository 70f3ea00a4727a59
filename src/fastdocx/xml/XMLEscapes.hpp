#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace fastdocx {
namespace xml {

// XML 转义实体字面量
struct XMLEscapes {
    inline static constexpr char AMP[]  = "&amp;";   // &  → &amp;
    inline static constexpr char LT[]   = "&lt;";    // <  → &lt;
    inline static constexpr char GT[]   = "&gt;";    // >  → &gt;
    inline static constexpr char QUOT[] = "&quot;";  // " → &quot;
    inline static constexpr char APOS[] = "&apos;";  // '  → &apos;
    inline static constexpr char NL[]   = "&#xA;";   // \n（属性上下文）
    inline static constexpr char TAB[]  = "&#x9;";   // \t（属性上下文）
    inline static constexpr char CR[]   = "&#xD;";   // \r（文本与属性）

    /**
     * @brief 转义上下文
     *
     * 属性值中的换行与制表符在读回时会被规范化为空格，必须写成字符引用；
     * 回车在两种上下文中都会被规范化为换行。
     */
    enum class Context {
        Text,
        Attribute
    };

    /**
     * @brief 单个字符的转义结果，无需转义时返回nullptr
     */
    static constexpr const char* entityFor(char c, Context context) noexcept {
        switch (c) {
            case '<':  return LT;
            case '>':  return GT;
            case '&':  return AMP;
            case '"':  return QUOT;
            case '\'': return APOS;
            case '\r': return CR;
            case '\n': return context == Context::Attribute ? NL : nullptr;
            case '\t': return context == Context::Attribute ? TAB : nullptr;
            default:   return nullptr;
        }
    }

    /**
     * @brief 转义后所需长度
     */
    static size_t escapedSize(std::string_view text, Context context = Context::Text) {
        size_t size = 0;
        for (char c : text) {
            const char* entity = entityFor(c, context);
            size += entity ? std::char_traits<char>::length(entity) : 1;
        }
        return size;
    }

    /**
     * @brief 追加转义后的文本
     */
    static void appendEscaped(std::string& target, std::string_view source, Context context = Context::Text) {
        for (char c : source) {
            if (const char* entity = entityFor(c, context)) {
                target += entity;
            } else {
                target += c;
            }
        }
    }
};

}} // namespace fastdocx::xml

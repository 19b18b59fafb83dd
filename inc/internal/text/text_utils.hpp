#ifndef MIXVOICE_TEXT_UTILS_HPP
#define MIXVOICE_TEXT_UTILS_HPP

/**
 * TextUtils - 文本处理工具模块
 *
 * 提供 UTF-8 字符串处理、字符类型判断、标点分类等功能。
 * 长度一律按 Unicode 码点计算。
 */

#include <cstddef>
#include <cstdint>

#include <string>
#include <vector>

namespace mixvoice {
namespace text {

// =============================================================================
// UTF-8 字符串处理
// =============================================================================

/**
 * @brief 将 UTF-8 字符串分割为单个字符
 * @param str UTF-8 编码的字符串
 * @return 每个 UTF-8 字符组成的向量
 */
std::vector<std::string> splitUtf8(const std::string& str);

/**
 * @brief 解码单个 UTF-8 字符的码点
 * @param ch UTF-8 编码的单个字符
 * @return 码点, 非法序列返回 0
 */
uint32_t codePointOf(const std::string& ch);

/**
 * @brief 计算 UTF-8 字符串的码点数
 */
size_t utf8Length(const std::string& str);

/**
 * @brief 去除首尾空白 (ASCII 空白和全角空格)
 */
std::string trim(const std::string& str);

/**
 * @brief 按空白切分单词
 */
std::vector<std::string> splitWhitespace(const std::string& str);

/**
 * @brief 用单个空格连接单词
 */
std::string joinWords(const std::vector<std::string>& words);

// =============================================================================
// 字符类型判断
// =============================================================================

/**
 * @brief 判断 UTF-8 字符是否为中文字符 (CJK Unified Ideographs, U+4E00..U+9FFF)
 */
bool isChineseChar(const std::string& ch);

/**
 * @brief 判断是否为中文标点 (｀，。！？；：“”‘’（）、)
 */
bool isCjkPunctuation(const std::string& ch);

/// @brief 中文字符或中文标点
inline bool isCjkChar(const std::string& ch) {
    return isChineseChar(ch) || isCjkPunctuation(ch);
}

/**
 * @brief 判断字符串是否包含中文字符 (不含标点)
 */
bool containsChinese(const std::string& text);

/**
 * @brief 判断是否为英文字母 (A-Z, a-z)
 */
bool isEnglishLetter(const std::string& ch);

/**
 * @brief 判断是否为数字 (0-9)
 */
bool isDigit(const std::string& ch);

/**
 * @brief 判断是否为空白字符
 */
bool isWhitespace(const std::string& ch);

// =============================================================================
// 单词/片段判断
// =============================================================================

/**
 * @brief 是否为纯数字串 (仅 0-9)
 */
bool isAllDigits(const std::string& str);

/**
 * @brief 是否为数字记号: 仅由数字和 '.' '%' 组成且至少包含一个数字
 *
 * 例如 "42", "3.14", "50%"。
 */
bool isNumericToken(const std::string& str);

/**
 * @brief 是否全部为大写字母 (空串视为 true)
 */
bool isAllUppercase(const std::string& str);

/**
 * @brief 判断字符串是否以给定后缀结尾
 */
bool endsWith(const std::string& str, const std::string& suffix);

// =============================================================================
// 标点分类
// =============================================================================

/// @brief 中文主要句末标点: 。！？；
bool isZhMajorPunct(const std::string& ch);

/// @brief 中文次要标点: ，、：
bool isZhMinorPunct(const std::string& ch);

/// @brief 中英文句末标点: 。！？；.!?;
bool isSentenceTerminal(const std::string& ch);

}  // namespace text
}  // namespace mixvoice

#endif  // MIXVOICE_TEXT_UTILS_HPP

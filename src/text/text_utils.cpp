#include "internal/text/text_utils.hpp"

#include <cstdint>

#include <string>
#include <unordered_set>
#include <vector>

namespace mixvoice {
namespace text {

// =============================================================================
// UTF-8 字符串处理
// =============================================================================

std::vector<std::string> splitUtf8(const std::string& str) {
    std::vector<std::string> result;
    for (size_t i = 0; i < str.length();) {
        int char_len = 1;
        unsigned char c = str[i];

        // Determine UTF-8 character length
        if ((c & 0x80) == 0) {
            char_len = 1;  // ASCII
        } else if ((c & 0xE0) == 0xC0) {
            char_len = 2;  // 2-byte UTF-8
        } else if ((c & 0xF0) == 0xE0) {
            char_len = 3;  // 3-byte UTF-8
        } else if ((c & 0xF8) == 0xF0) {
            char_len = 4;  // 4-byte UTF-8
        }

        if (i + char_len <= str.length()) {
            result.push_back(str.substr(i, char_len));
        }
        i += char_len;
    }
    return result;
}

uint32_t codePointOf(const std::string& ch) {
    if (ch.empty()) return 0;
    unsigned char c0 = ch[0];
    if ((c0 & 0x80) == 0) {
        return c0;
    }
    if ((c0 & 0xE0) == 0xC0 && ch.size() >= 2) {
        return ((c0 & 0x1F) << 6) | (static_cast<unsigned char>(ch[1]) & 0x3F);
    }
    if ((c0 & 0xF0) == 0xE0 && ch.size() >= 3) {
        return ((c0 & 0x0F) << 12) |
            ((static_cast<unsigned char>(ch[1]) & 0x3F) << 6) |
            (static_cast<unsigned char>(ch[2]) & 0x3F);
    }
    if ((c0 & 0xF8) == 0xF0 && ch.size() >= 4) {
        return ((c0 & 0x07) << 18) |
            ((static_cast<unsigned char>(ch[1]) & 0x3F) << 12) |
            ((static_cast<unsigned char>(ch[2]) & 0x3F) << 6) |
            (static_cast<unsigned char>(ch[3]) & 0x3F);
    }
    return 0;
}

size_t utf8Length(const std::string& str) {
    size_t count = 0;
    for (unsigned char c : str) {
        // 只统计非续字节
        if ((c & 0xC0) != 0x80) {
            count++;
        }
    }
    return count;
}

std::string trim(const std::string& str) {
    std::vector<std::string> chars = splitUtf8(str);
    size_t first = 0;
    while (first < chars.size() && isWhitespace(chars[first])) {
        first++;
    }
    size_t last = chars.size();
    while (last > first && isWhitespace(chars[last - 1])) {
        last--;
    }
    std::string result;
    for (size_t i = first; i < last; ++i) {
        result += chars[i];
    }
    return result;
}

std::vector<std::string> splitWhitespace(const std::string& str) {
    std::vector<std::string> words;
    std::string current;
    for (const auto& ch : splitUtf8(str)) {
        if (isWhitespace(ch)) {
            if (!current.empty()) {
                words.push_back(current);
                current.clear();
            }
        } else {
            current += ch;
        }
    }
    if (!current.empty()) {
        words.push_back(current);
    }
    return words;
}

std::string joinWords(const std::vector<std::string>& words) {
    std::string result;
    for (size_t i = 0; i < words.size(); ++i) {
        if (i > 0) result += " ";
        result += words[i];
    }
    return result;
}

// =============================================================================
// 字符类型判断
// =============================================================================

bool isChineseChar(const std::string& ch) {
    if (ch.length() != 3) return false;
    uint32_t cp = codePointOf(ch);
    // CJK Unified Ideographs: U+4E00 to U+9FFF
    return cp >= 0x4E00 && cp <= 0x9FFF;
}

bool isCjkPunctuation(const std::string& ch) {
    static const std::unordered_set<std::string> puncts = {
        "｀", "，", "。", "！", "？", "；", "：",
        "“", "”", "‘", "’",
        "（", "）", "、"
    };
    return puncts.count(ch) > 0;
}

bool containsChinese(const std::string& text) {
    for (const auto& ch : splitUtf8(text)) {
        if (isChineseChar(ch)) {
            return true;
        }
    }
    return false;
}

bool isEnglishLetter(const std::string& ch) {
    if (ch.length() != 1) return false;
    char c = ch[0];
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

bool isDigit(const std::string& ch) {
    if (ch.length() != 1) return false;
    char c = ch[0];
    return c >= '0' && c <= '9';
}

bool isWhitespace(const std::string& ch) {
    if (ch.length() == 1) {
        char c = ch[0];
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
    }
    uint32_t cp = codePointOf(ch);
    return cp == 0x3000 || cp == 0x00A0;  // 全角空格, NBSP
}

// =============================================================================
// 单词/片段判断
// =============================================================================

bool isAllDigits(const std::string& str) {
    if (str.empty()) return false;
    for (char c : str) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

bool isNumericToken(const std::string& str) {
    bool has_digit = false;
    for (char c : str) {
        if (c >= '0' && c <= '9') {
            has_digit = true;
        } else if (c != '.' && c != '%') {
            return false;
        }
    }
    return has_digit;
}

bool isAllUppercase(const std::string& str) {
    for (char c : str) {
        if (c < 'A' || c > 'Z') return false;
    }
    return true;
}

bool endsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
        str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// =============================================================================
// 标点分类
// =============================================================================

bool isZhMajorPunct(const std::string& ch) {
    return ch == "。" || ch == "！" || ch == "？" || ch == "；";
}

bool isZhMinorPunct(const std::string& ch) {
    return ch == "，" || ch == "、" || ch == "：";
}

bool isSentenceTerminal(const std::string& ch) {
    return isZhMajorPunct(ch) || ch == "." || ch == "!" || ch == "?" || ch == ";";
}

}  // namespace text
}  // namespace mixvoice

#include "internal/text/segmenter.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "internal/text/language_classifier.hpp"
#include "internal/text/text_utils.hpp"

namespace mixvoice {
namespace text {

// =============================================================================
// 工具函数
// =============================================================================

std::vector<std::string> hardSplit(const std::string& text, size_t max_length) {
    std::vector<std::string> pieces;
    if (max_length == 0) {
        pieces.push_back(text);
        return pieces;
    }
    std::string current;
    size_t current_len = 0;
    for (const auto& ch : splitUtf8(text)) {
        if (current_len == max_length) {
            pieces.push_back(current);
            current.clear();
            current_len = 0;
        }
        current += ch;
        current_len++;
    }
    if (!current.empty()) {
        pieces.push_back(current);
    }
    return pieces;
}

Segmenter::Segmenter(const SegmenterOptions& options) : options_(options) {
}

// =============================================================================
// 片段切分入口
// =============================================================================

std::vector<Segment> Segmenter::segment(const std::string& text, int chunk_index,
                                        int line_index) const {
    std::vector<Segment> segments;
    if (trim(text).empty()) {
        return segments;
    }

    auto append = [&](const std::string& piece, LanguageTag language) {
        Segment seg;
        seg.text = trim(piece);
        if (seg.text.empty()) return;
        seg.language = language;
        seg.chunk_index = chunk_index;
        seg.line_index = line_index;
        seg.segment_index = static_cast<int>(segments.size());
        segments.push_back(std::move(seg));
    };

    switch (classifyText(text)) {
        case TextType::EN:
            for (const auto& sentence : splitEnglishSentences(text)) {
                append(sentence, LanguageTag::EN);
            }
            break;

        case TextType::ZH:
            for (const auto& clause : splitChineseText(text)) {
                append(clause, LanguageTag::ZH);
            }
            break;

        case TextType::MIXED:
            for (const auto& run : splitMixedText(text)) {
                append(run.first, run.second);
            }
            break;
    }

    return segments;
}

// =============================================================================
// 英文策略
// =============================================================================

bool Segmenter::isAbbreviation(const std::string& word) const {
    // 以 '.' 结尾的缩写/数字不作为句末: "Mr.", "U.S.A." 中的 "USA.", "3.50."
    std::string stem = word.substr(0, word.size() - 1);
    return isNumericToken(stem) || isAllUppercase(stem) || utf8Length(word) <= 3;
}

void Segmenter::appendEnglish(const std::string& sentence, std::vector<std::string>& out) const {
    std::string trimmed = trim(sentence);
    if (trimmed.empty()) return;
    // 数字无论多短都保留
    if (static_cast<int>(utf8Length(trimmed)) >= options_.min_segment_length ||
        isNumericToken(trimmed)) {
        out.push_back(trimmed);
    }
}

std::vector<std::string> Segmenter::splitEnglishSentences(const std::string& text) const {
    std::vector<std::string> sentences;
    std::vector<std::string> current;
    size_t current_length = 0;

    for (const auto& word : splitWhitespace(text)) {
        current_length += utf8Length(word) + (current.empty() ? 0 : 1);
        current.push_back(word);

        bool terminal = endsWith(word, ".") || endsWith(word, "!") || endsWith(word, "?");
        bool clause = endsWith(word, ",") || endsWith(word, ";") || endsWith(word, ":");
        bool too_long = current_length >= static_cast<size_t>(options_.max_segment_length);
        if (!terminal && !clause && !too_long) {
            continue;
        }

        if (endsWith(word, ".") && isAbbreviation(word)) {
            continue;
        }

        appendEnglish(joinWords(current), sentences);
        current.clear();
        current_length = 0;
    }

    if (!current.empty()) {
        appendEnglish(joinWords(current), sentences);
    }

    return sentences;
}

// =============================================================================
// 中文策略
// =============================================================================

std::vector<std::string> Segmenter::splitByMinorPunct(const std::string& clause) const {
    const size_t max_len = static_cast<size_t>(options_.max_segment_length);

    // 按 ，、： 切开，标点保留在前一段末尾
    std::vector<std::string> parts;
    std::string part;
    for (const auto& ch : splitUtf8(clause)) {
        part += ch;
        if (isZhMinorPunct(ch)) {
            parts.push_back(part);
            part.clear();
        }
    }
    if (!part.empty()) {
        parts.push_back(part);
    }

    // 贪心合并到最大长度
    std::vector<std::string> merged;
    std::string current;
    size_t current_len = 0;
    for (const auto& p : parts) {
        size_t p_len = utf8Length(p);
        if (current_len + p_len <= max_len) {
            current += p;
            current_len += p_len;
        } else {
            if (!current.empty()) {
                merged.push_back(current);
            }
            current = p;
            current_len = p_len;
        }
    }
    if (!current.empty()) {
        merged.push_back(current);
    }

    // 单个分句仍超长时硬切
    std::vector<std::string> result;
    for (const auto& m : merged) {
        if (utf8Length(m) > max_len) {
            auto pieces = hardSplit(m, max_len);
            result.insert(result.end(), pieces.begin(), pieces.end());
        } else {
            result.push_back(m);
        }
    }
    return result;
}

std::vector<std::string> Segmenter::splitChineseText(const std::string& text) const {
    std::vector<std::string> result;
    if (trim(text).empty()) {
        return result;
    }

    // 按 。！？； 切分，标点接回前一句
    std::vector<std::string> clauses;
    std::string body;
    for (const auto& ch : splitUtf8(text)) {
        if (isZhMajorPunct(ch)) {
            clauses.push_back(trim(body) + ch);
            body.clear();
        } else {
            body += ch;
        }
    }
    std::string tail = trim(body);
    if (!tail.empty()) {
        clauses.push_back(tail);
    }

    const size_t max_len = static_cast<size_t>(options_.max_segment_length);
    for (const auto& clause : clauses) {
        if (utf8Length(clause) > max_len) {
            for (const auto& sub : splitByMinorPunct(clause)) {
                std::string trimmed = trim(sub);
                if (!trimmed.empty()) {
                    result.push_back(trimmed);
                }
            }
        } else {
            std::string trimmed = trim(clause);
            if (!trimmed.empty()) {
                result.push_back(trimmed);
            }
        }
    }

    return result;
}

// =============================================================================
// 中英混合策略
// =============================================================================

bool Segmenter::hasChineseContext(const std::vector<std::string>& chars, size_t pos) const {
    // 向前看 window 个字符，向后从数字起点看 window 个字符
    const size_t window = static_cast<size_t>(options_.numeric_context_window);
    size_t begin = pos > window ? pos - window : 0;
    size_t end = std::min(chars.size(), pos + window);
    for (size_t i = begin; i < end; ++i) {
        if (isChineseChar(chars[i])) {
            return true;
        }
    }
    return false;
}

std::vector<std::pair<std::string, LanguageTag>> Segmenter::splitMixedText(
    const std::string& text) const {
    std::vector<std::pair<std::string, LanguageTag>> runs;
    if (trim(text).empty()) {
        return runs;
    }

    std::vector<std::string> chars = splitUtf8(text);
    std::string buffer;
    LanguageTag current = LanguageTag::EN;
    bool has_current = false;

    auto flush = [&]() {
        if (!trim(buffer).empty()) {
            runs.emplace_back(buffer, current);
        }
        buffer.clear();
    };

    auto switchTo = [&](LanguageTag language) {
        if (!has_current || current != language) {
            flush();
            current = language;
            has_current = true;
        }
    };

    for (size_t i = 0; i < chars.size(); ++i) {
        const std::string& ch = chars[i];

        if (isCjkChar(ch)) {
            switchTo(LanguageTag::ZH);
            buffer += ch;

        } else if (isDigit(ch)) {
            // 数字连同 '.' '%' 作为一个整体
            size_t num_start = i;
            std::string number;
            while (i < chars.size() &&
                   (isDigit(chars[i]) || chars[i] == "." || chars[i] == "%")) {
                number += chars[i];
                i++;
            }
            i--;

            switchTo(hasChineseContext(chars, num_start) ? LanguageTag::ZH : LanguageTag::EN);
            buffer += number;

        } else if (isEnglishLetter(ch)) {
            switchTo(LanguageTag::EN);
            buffer += ch;

        } else if (!buffer.empty()) {
            // 标点和空白附着在当前游程
            buffer += ch;
        }
    }
    flush();

    std::vector<std::pair<std::string, LanguageTag>> result;
    for (const auto& run : runs) {
        std::string trimmed = trim(run.first);
        if (trimmed.empty()) continue;
        if (run.second == LanguageTag::ZH ||
            static_cast<int>(utf8Length(trimmed)) >= options_.min_segment_length ||
            isNumericToken(trimmed)) {
            result.emplace_back(trimmed, run.second);
        }
    }
    return result;
}

// =============================================================================
// 分块与分行
// =============================================================================

std::vector<std::string> Segmenter::splitLongLine(const std::string& line) const {
    const size_t max_len = static_cast<size_t>(options_.max_chunk_length);

    std::vector<std::string> sentences;
    std::string sentence;
    auto chars = splitUtf8(line);
    for (size_t i = 0; i < chars.size(); ++i) {
        const std::string& ch = chars[i];
        sentence += ch;
        // 小数点不断句
        if (ch == "." && i + 1 < chars.size() && isDigit(chars[i + 1])) {
            continue;
        }
        if (isSentenceTerminal(ch)) {
            sentences.push_back(sentence);
            sentence.clear();
        }
    }
    if (!sentence.empty()) {
        sentences.push_back(sentence);
    }

    std::vector<std::string> pieces;
    std::string current;
    size_t current_len = 0;
    for (const auto& s : sentences) {
        size_t s_len = utf8Length(s);
        if (current_len + s_len > max_len && !current.empty()) {
            pieces.push_back(current);
            current.clear();
            current_len = 0;
        }
        if (s_len > max_len) {
            auto cut = hardSplit(s, max_len);
            pieces.insert(pieces.end(), cut.begin(), cut.end());
            continue;
        }
        current += s;
        current_len += s_len;
    }
    if (!current.empty()) {
        pieces.push_back(current);
    }
    return pieces;
}

std::vector<std::string> Segmenter::splitIntoChunks(const std::string& text) const {
    std::vector<std::string> chunks;
    if (text.empty()) {
        return chunks;
    }

    const size_t max_len = static_cast<size_t>(options_.max_chunk_length);
    std::string current;
    size_t current_len = 0;
    bool has_line = false;

    auto addLine = [&](const std::string& line) {
        size_t line_len = utf8Length(line);
        size_t sep = has_line ? 1 : 0;
        if (has_line && current_len + sep + line_len > max_len) {
            chunks.push_back(current);
            current.clear();
            current_len = 0;
            has_line = false;
            sep = 0;
        }
        if (sep) {
            current += "\n";
        }
        current += line;
        current_len += sep + line_len;
        has_line = true;
    };

    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) end = text.size();
        std::string line = text.substr(start, end - start);

        if (utf8Length(line) > max_len) {
            for (const auto& piece : splitLongLine(line)) {
                addLine(piece);
            }
        } else {
            addLine(line);
        }
        start = end + 1;
    }

    if (has_line) {
        chunks.push_back(current);
    }
    return chunks;
}

std::vector<TextSpan> Segmenter::splitIntoLines(const std::string& chunk, int chunk_index) const {
    std::vector<TextSpan> spans;
    int line_index = 0;
    size_t start = 0;
    while (start <= chunk.size()) {
        size_t end = chunk.find('\n', start);
        if (end == std::string::npos) end = chunk.size();

        std::string line = trim(chunk.substr(start, end - start));
        if (!line.empty()) {
            TextSpan span;
            span.text = line;
            span.chunk_index = chunk_index;
            span.line_index = line_index;
            spans.push_back(std::move(span));
        }

        line_index++;
        start = end + 1;
    }
    return spans;
}

}  // namespace text
}  // namespace mixvoice

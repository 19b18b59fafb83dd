#ifndef MIXVOICE_SEGMENTER_HPP
#define MIXVOICE_SEGMENTER_HPP

/**
 * Segmenter - 文本分段
 *
 * 将一段文本切分为有序的 (text, language) 合成片段:
 * - 英文: 按句末/分句标点切分，带缩写与数字启发式
 * - 中文: 按 。！？； 切分，超长分句再按 ，、： 贪心合并
 * - 中英混合: 逐字符扫描语言游程，数字按上下文归属中文或英文
 *
 * 另外提供顶层分块 (chunk) 与按行拆分，供流水线使用。
 * 所有方法无状态、可重入。
 */

#include <string>
#include <utility>
#include <vector>

#include "internal/mixvoice_config.hpp"
#include "internal/mixvoice_types.hpp"

namespace mixvoice {
namespace text {

// =============================================================================
// SegmenterOptions - 分段参数
// =============================================================================

struct SegmenterOptions {
    int max_segment_length = 1000;      ///< 单片段最大长度 (码点)
    int min_segment_length = 2;         ///< 英文片段最小长度 (码点)
    int numeric_context_window = 5;     ///< 数字上下文窗口 (码点)
    int max_chunk_length = 5000;        ///< 顶层分块最大长度 (码点)

    static SegmenterOptions fromConfig(const PipelineConfig& config) {
        SegmenterOptions options;
        options.max_segment_length = config.max_segment_length;
        options.min_segment_length = config.min_segment_length;
        options.numeric_context_window = config.numeric_context_window;
        options.max_chunk_length = config.max_chunk_length;
        return options;
    }
};

// =============================================================================
// Segmenter
// =============================================================================

class Segmenter {
public:
    explicit Segmenter(const SegmenterOptions& options = SegmenterOptions());

    // -------------------------------------------------------------------------
    // 片段切分
    // -------------------------------------------------------------------------

    /// @brief 将一行文本切分为片段
    /// @param text 文本 (通常为一行)
    /// @param chunk_index 所属分块序号
    /// @param line_index 分块内行号
    /// @return 按朗读顺序排列的片段, segment_index 从 0 递增
    std::vector<Segment> segment(const std::string& text, int chunk_index, int line_index) const;

    /// @brief 同上，以 TextSpan 为输入
    std::vector<Segment> segment(const TextSpan& span) const {
        return segment(span.text, span.chunk_index, span.line_index);
    }

    /// @brief 英文句子切分
    std::vector<std::string> splitEnglishSentences(const std::string& text) const;

    /// @brief 中文分句
    std::vector<std::string> splitChineseText(const std::string& text) const;

    /// @brief 中英混合文本按语言游程切分
    std::vector<std::pair<std::string, LanguageTag>> splitMixedText(const std::string& text) const;

    // -------------------------------------------------------------------------
    // 分块与分行
    // -------------------------------------------------------------------------

    /// @brief 将原始输入按行打包为不超过 max_chunk_length 的分块
    /// @note 超长行按句末标点切开，仍超长时硬切
    std::vector<std::string> splitIntoChunks(const std::string& text) const;

    /// @brief 将分块拆为非空行 (保留原始行号)
    std::vector<TextSpan> splitIntoLines(const std::string& chunk, int chunk_index) const;

    const SegmenterOptions& options() const { return options_; }

private:
    bool isAbbreviation(const std::string& word) const;
    bool hasChineseContext(const std::vector<std::string>& chars, size_t pos) const;
    void appendEnglish(const std::string& sentence, std::vector<std::string>& out) const;
    std::vector<std::string> splitByMinorPunct(const std::string& clause) const;
    std::vector<std::string> splitLongLine(const std::string& line) const;

    SegmenterOptions options_;
};

/// @brief 按码点数硬切
std::vector<std::string> hardSplit(const std::string& text, size_t max_length);

}  // namespace text
}  // namespace mixvoice

#endif  // MIXVOICE_SEGMENTER_HPP

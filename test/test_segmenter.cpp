#include <string>
#include <utility>
#include <vector>

#include "internal/text/segmenter.hpp"
#include "internal/text/text_utils.hpp"
#include "test_utils.hpp"

using mixvoice::LanguageTag;
using mixvoice::Segment;
using mixvoice::text::Segmenter;
using mixvoice::text::SegmenterOptions;

static std::string joinTexts(const std::vector<std::string>& parts) {
    std::string out;
    for (const auto& p : parts) {
        out += "[" + p + "]";
    }
    return out;
}

static std::string joinRuns(const std::vector<std::pair<std::string, LanguageTag>>& runs) {
    std::string out;
    for (const auto& r : runs) {
        out += std::string("[") + mixvoice::languageTagToString(r.second) + ":" + r.first + "]";
    }
    return out;
}

static std::string joinSegments(const std::vector<Segment>& segments) {
    std::string out;
    for (const auto& s : segments) {
        out += std::string("[") + mixvoice::languageTagToString(s.language) + ":" + s.text + "]";
    }
    return out;
}

int main() {
    using mixvoice::test::runTest;

    // -------------------------------------------------------------------------
    // 英文
    // -------------------------------------------------------------------------

    runTest("EnglishSentences", []() {
        Segmenter segmenter;
        MV_CHECK_EQ(joinTexts(segmenter.splitEnglishSentences("Hello world. How are you?")),
                    std::string("[Hello world.][How are you?]"));
    });

    runTest("EnglishClausePunctuationCloses", []() {
        Segmenter segmenter;
        MV_CHECK_EQ(joinTexts(segmenter.splitEnglishSentences("First, second; third: end")),
                    std::string("[First,][second;][third:][end]"));
    });

    runTest("EnglishAbbreviationsDoNotClose", []() {
        Segmenter segmenter;
        MV_CHECK_EQ(joinTexts(segmenter.splitEnglishSentences("Mr. Smith went home.")),
                    std::string("[Mr. Smith went home.]"));
        MV_CHECK_EQ(joinTexts(segmenter.splitEnglishSentences("The USA. is big.")),
                    std::string("[The USA. is big.]"));
    });

    runTest("EnglishNumbersStayInSentence", []() {
        Segmenter segmenter;
        MV_CHECK_EQ(joinTexts(segmenter.splitEnglishSentences("There are 42 apples")),
                    std::string("[There are 42 apples]"));
        MV_CHECK_EQ(joinTexts(segmenter.splitEnglishSentences("Price is 3.50. Next item.")),
                    std::string("[Price is 3.50. Next item.]"));
    });

    runTest("EnglishMinimumLength", []() {
        Segmenter segmenter;
        MV_CHECK_EQ(joinTexts(segmenter.splitEnglishSentences("Go! I")), std::string("[Go!]"));
        // 纯数字不受最小长度限制
        MV_CHECK_EQ(joinTexts(segmenter.splitEnglishSentences("7")), std::string("[7]"));
    });

    runTest("EnglishMaximumLength", []() {
        SegmenterOptions options;
        options.max_segment_length = 10;
        Segmenter segmenter(options);
        MV_CHECK_EQ(joinTexts(segmenter.splitEnglishSentences("aaaa bbbb cccc dddd")),
                    std::string("[aaaa bbbb cccc][dddd]"));
    });

    // -------------------------------------------------------------------------
    // 中文
    // -------------------------------------------------------------------------

    runTest("ChineseClauses", []() {
        Segmenter segmenter;
        MV_CHECK_EQ(joinTexts(segmenter.splitChineseText("你好。今天天气很好！我们去公园吧？")),
                    std::string("[你好。][今天天气很好！][我们去公园吧？]"));
        MV_CHECK_EQ(joinTexts(segmenter.splitChineseText("没有标点的句子")),
                    std::string("[没有标点的句子]"));
        MV_CHECK_EQ(joinTexts(segmenter.splitChineseText("  你好 。第二句")),
                    std::string("[你好。][第二句]"));
    });

    runTest("ChineseLongClauseSplitsOnMinorPunctuation", []() {
        SegmenterOptions options;
        options.max_segment_length = 6;
        Segmenter segmenter(options);
        MV_CHECK_EQ(joinTexts(segmenter.splitChineseText("一二三，四五六，七八九。")),
                    std::string("[一二三，][四五六，][七八九。]"));
    });

    runTest("ChineseMinorPiecesArePacked", []() {
        SegmenterOptions options;
        options.max_segment_length = 8;
        Segmenter segmenter(options);
        MV_CHECK_EQ(joinTexts(segmenter.splitChineseText("一二，三四，五六七八九。")),
                    std::string("[一二，三四，][五六七八九。]"));
    });

    runTest("ChineseHardCut", []() {
        SegmenterOptions options;
        options.max_segment_length = 4;
        Segmenter segmenter(options);
        auto pieces = segmenter.splitChineseText("一二三四五六七八九");
        MV_CHECK_EQ(joinTexts(pieces), std::string("[一二三四][五六七八][九]"));
        for (const auto& p : pieces) {
            MV_CHECK(mixvoice::text::utf8Length(p) <= 4);
        }
    });

    // -------------------------------------------------------------------------
    // 中英混合
    // -------------------------------------------------------------------------

    runTest("MixedNumbersFollowChineseContext", []() {
        Segmenter segmenter;
        MV_CHECK_EQ(joinRuns(segmenter.splitMixedText("我有42个苹果and5个桔子")),
                    std::string("[zh:我有42个苹果][en:and][zh:5个桔子]"));
    });

    runTest("MixedNumberLooksAhead", []() {
        Segmenter segmenter;
        MV_CHECK_EQ(joinRuns(segmenter.splitMixedText("I have 5个苹果")),
                    std::string("[en:I have][zh:5个苹果]"));
    });

    runTest("MixedNumberInEnglishContext", []() {
        Segmenter segmenter;
        MV_CHECK_EQ(joinRuns(segmenter.splitMixedText("我说hello world 2024 is good")),
                    std::string("[zh:我说][en:hello world 2024 is good]"));
    });

    runTest("MixedContextWindowIsConfigurable", []() {
        SegmenterOptions options;
        options.numeric_context_window = 1;
        Segmenter segmenter(options);
        // 窗口为 1 时 "5" 只能看到自身和前一个字符 'd'
        MV_CHECK_EQ(joinRuns(segmenter.splitMixedText("苹果and5个桔子")),
                    std::string("[zh:苹果][en:and5][zh:个桔子]"));
    });

    runTest("MixedShortEnglishRunsDropped", []() {
        Segmenter segmenter;
        MV_CHECK_EQ(joinRuns(segmenter.splitMixedText("你好a世界")),
                    std::string("[zh:你好][zh:世界]"));
    });

    runTest("MixedPunctuationAttachesToRun", []() {
        Segmenter segmenter;
        MV_CHECK_EQ(joinRuns(segmenter.splitMixedText("今天学习Python，效率提升了50%。")),
                    std::string("[zh:今天学习][en:Python][zh:，效率提升了50%。]"));
    });

    // -------------------------------------------------------------------------
    // segment() 入口
    // -------------------------------------------------------------------------

    runTest("SegmentCarriesIndices", []() {
        Segmenter segmenter;
        auto segments = segmenter.segment("我有42个苹果and5个桔子", 2, 3);
        MV_CHECK_EQ(segments.size(), static_cast<size_t>(3));
        for (size_t i = 0; i < segments.size(); ++i) {
            MV_CHECK_EQ(segments[i].chunk_index, 2);
            MV_CHECK_EQ(segments[i].line_index, 3);
            MV_CHECK_EQ(segments[i].segment_index, static_cast<int>(i));
        }
        MV_CHECK_EQ(joinSegments(segments), std::string("[zh:我有42个苹果][en:and][zh:5个桔子]"));
    });

    runTest("SegmentDispatchesByType", []() {
        Segmenter segmenter;
        MV_CHECK_EQ(joinSegments(segmenter.segment("There are 42 apples", 0, 0)),
                    std::string("[en:There are 42 apples]"));
        MV_CHECK_EQ(joinSegments(segmenter.segment("你好。再见。", 0, 0)),
                    std::string("[zh:你好。][zh:再见。]"));
        MV_CHECK_EQ(joinSegments(segmenter.segment("2024", 0, 0)), std::string("[en:2024]"));
    });

    runTest("SegmentEmptyInput", []() {
        Segmenter segmenter;
        MV_CHECK(segmenter.segment("", 0, 0).empty());
        MV_CHECK(segmenter.segment("   \t", 0, 0).empty());
    });

    runTest("SegmentIsDeterministic", []() {
        Segmenter segmenter;
        const std::string text = "今天学习Python 3.12，效率提升了50%。Mr. Smith agrees!";
        auto first = segmenter.segment(text, 0, 0);
        auto second = segmenter.segment(text, 0, 0);
        MV_CHECK_EQ(joinSegments(first), joinSegments(second));
        MV_CHECK(!first.empty());
    });

    runTest("SegmentTextIsTrimmedAndNonEmpty", []() {
        Segmenter segmenter;
        for (const auto& seg : segmenter.segment("  Hello there.   你好 ,  world  ", 0, 0)) {
            MV_CHECK(!seg.text.empty());
            MV_CHECK_EQ(seg.text, mixvoice::text::trim(seg.text));
        }
    });

    // -------------------------------------------------------------------------
    // 分块与分行
    // -------------------------------------------------------------------------

    runTest("ChunksPackLines", []() {
        SegmenterOptions options;
        options.max_chunk_length = 10;
        Segmenter segmenter(options);
        auto chunks = segmenter.splitIntoChunks("abc\ndefgh\nijklmnop");
        MV_CHECK_EQ(chunks.size(), static_cast<size_t>(2));
        if (chunks.size() == 2) {
            MV_CHECK_EQ(chunks[0], std::string("abc\ndefgh"));
            MV_CHECK_EQ(chunks[1], std::string("ijklmnop"));
        }
    });

    runTest("ChunksSplitLongLines", []() {
        SegmenterOptions options;
        options.max_chunk_length = 10;
        Segmenter segmenter(options);
        auto chunks = segmenter.splitIntoChunks("Hello. World is big. End");
        MV_CHECK(chunks.size() >= 2);
        std::string rejoined;
        for (const auto& chunk : chunks) {
            MV_CHECK(mixvoice::text::utf8Length(chunk) <= 10);
            for (char c : chunk) {
                if (c != '\n') rejoined += c;
            }
        }
        MV_CHECK_EQ(rejoined, std::string("Hello. World is big. End"));
    });

    runTest("ChunksKeepDecimalsTogether", []() {
        SegmenterOptions options;
        options.max_chunk_length = 12;
        Segmenter segmenter(options);
        auto chunks = segmenter.splitIntoChunks("Ab cd. Pi 3.75.");
        MV_CHECK(chunks.size() >= 2);
        bool found = false;
        for (const auto& chunk : chunks) {
            MV_CHECK(mixvoice::text::utf8Length(chunk) <= 12);
            MV_CHECK(chunk.size() < 2 || chunk.compare(chunk.size() - 2, 2, "3.") != 0);
            if (chunk.find("3.75") != std::string::npos) found = true;
        }
        MV_CHECK(found);
    });

    runTest("ChunksOfEmptyInput", []() {
        Segmenter segmenter;
        MV_CHECK(segmenter.splitIntoChunks("").empty());
        MV_CHECK_EQ(segmenter.splitIntoChunks("one line").size(), static_cast<size_t>(1));
    });

    runTest("LinesKeepOriginalIndex", []() {
        Segmenter segmenter;
        auto spans = segmenter.splitIntoLines("first\n\n  second  \nthird", 4);
        MV_CHECK_EQ(spans.size(), static_cast<size_t>(3));
        if (spans.size() == 3) {
            MV_CHECK_EQ(spans[0].text, std::string("first"));
            MV_CHECK_EQ(spans[0].line_index, 0);
            MV_CHECK_EQ(spans[1].text, std::string("second"));
            MV_CHECK_EQ(spans[1].line_index, 2);
            MV_CHECK_EQ(spans[2].line_index, 3);
            MV_CHECK_EQ(spans[2].chunk_index, 4);
        }
    });

    runTest("HardSplitCountsCodePoints", []() {
        auto pieces = mixvoice::text::hardSplit("ab你好cd", 3);
        MV_CHECK_EQ(joinTexts(pieces), std::string("[ab你][好cd]"));
    });

    return mixvoice::test::finish();
}

#ifndef MIXVOICE_TYPES_HPP
#define MIXVOICE_TYPES_HPP

#include <cstdint>

#include <atomic>
#include <memory>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace mixvoice {

// =============================================================================
// Language Tag (语言标签)
// =============================================================================

enum class LanguageTag {
    ZH,     // 中文音色
    EN,     // 英文音色 (数字默认也用英文音色)
};

inline const char* languageTagToString(LanguageTag tag) {
    switch (tag) {
        case LanguageTag::ZH: return "zh";
        case LanguageTag::EN: return "en";
        default:              return "unknown";
    }
}

// =============================================================================
// Text Type (文本类型 - 分类结果)
// =============================================================================
//
// MIXED 只是分类结果，用于触发进一步切分，不会成为片段的最终语言。
//

enum class TextType {
    ZH,
    EN,
    MIXED,
};

inline const char* textTypeToString(TextType type) {
    switch (type) {
        case TextType::ZH:    return "zh";
        case TextType::EN:    return "en";
        case TextType::MIXED: return "mixed";
        default:              return "unknown";
    }
}

// =============================================================================
// Failure Policy (失败策略)
// =============================================================================

enum class FailurePolicy {
    FAIL_FAST,      // 任一片段失败即中止整个任务 (默认)
    BEST_EFFORT,    // 跳过失败片段，至少一个片段成功即可
};

inline const char* failurePolicyToString(FailurePolicy policy) {
    switch (policy) {
        case FailurePolicy::FAIL_FAST:   return "fail-fast";
        case FailurePolicy::BEST_EFFORT: return "best-effort";
        default:                         return "unknown";
    }
}

// =============================================================================
// Error Code (错误码)
// =============================================================================

enum class ErrorCode {
    OK = 0,

    // 配置错误 (1xx)
    INVALID_CONFIG = 100,
    UNKNOWN_VOICE = 101,

    // 输入错误 (15x)
    INVALID_INPUT = 150,
    TEXT_TOO_LONG = 151,
    NO_SEGMENTS = 152,
    EMPTY_SEGMENT = 153,

    // 运行时错误 (2xx)
    SYNTHESIS_BACKEND_ERROR = 200,
    SYNTHESIS_TIMEOUT = 201,
    EMPTY_SYNTHESIS = 202,
    NO_ARTIFACTS = 203,
    ASSEMBLY_ERROR = 204,
    CANCELLED = 205,

    // 网络错误 (3xx)
    NETWORK_ERROR = 300,
    AUTH_FAILED = 301,

    // 内部错误 (4xx)
    INTERNAL_ERROR = 400,
    WORKSPACE_ERROR = 401,
    FILE_WRITE_ERROR = 402,
    FILE_READ_ERROR = 403,
};

inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:                      return "OK";
        case ErrorCode::INVALID_CONFIG:          return "INVALID_CONFIG";
        case ErrorCode::UNKNOWN_VOICE:           return "UNKNOWN_VOICE";
        case ErrorCode::INVALID_INPUT:           return "INVALID_INPUT";
        case ErrorCode::TEXT_TOO_LONG:           return "TEXT_TOO_LONG";
        case ErrorCode::NO_SEGMENTS:             return "NO_SEGMENTS";
        case ErrorCode::EMPTY_SEGMENT:           return "EMPTY_SEGMENT";
        case ErrorCode::SYNTHESIS_BACKEND_ERROR: return "SYNTHESIS_BACKEND_ERROR";
        case ErrorCode::SYNTHESIS_TIMEOUT:       return "SYNTHESIS_TIMEOUT";
        case ErrorCode::EMPTY_SYNTHESIS:         return "EMPTY_SYNTHESIS";
        case ErrorCode::NO_ARTIFACTS:            return "NO_ARTIFACTS";
        case ErrorCode::ASSEMBLY_ERROR:          return "ASSEMBLY_ERROR";
        case ErrorCode::CANCELLED:               return "CANCELLED";
        case ErrorCode::NETWORK_ERROR:           return "NETWORK_ERROR";
        case ErrorCode::AUTH_FAILED:             return "AUTH_FAILED";
        case ErrorCode::INTERNAL_ERROR:          return "INTERNAL_ERROR";
        case ErrorCode::WORKSPACE_ERROR:         return "WORKSPACE_ERROR";
        case ErrorCode::FILE_WRITE_ERROR:        return "FILE_WRITE_ERROR";
        case ErrorCode::FILE_READ_ERROR:         return "FILE_READ_ERROR";
        default:                                 return "UNKNOWN";
    }
}

/// @brief 是否属于单片段合成失败 (超时/后端/空音频/网络)
inline bool isSynthesisFailure(ErrorCode code) {
    switch (code) {
        case ErrorCode::SYNTHESIS_BACKEND_ERROR:
        case ErrorCode::SYNTHESIS_TIMEOUT:
        case ErrorCode::EMPTY_SYNTHESIS:
        case ErrorCode::EMPTY_SEGMENT:
        case ErrorCode::NETWORK_ERROR:
        case ErrorCode::AUTH_FAILED:
            return true;
        default:
            return false;
    }
}

// =============================================================================
// Error Info (错误信息)
// =============================================================================

struct ErrorInfo {
    ErrorCode code;
    std::string message;
    std::string detail;  // 详细信息(调试用)

    bool isOk() const { return code == ErrorCode::OK; }

    static ErrorInfo ok() {
        return {ErrorCode::OK, "", ""};
    }

    static ErrorInfo error(ErrorCode code, const std::string& msg, const std::string& detail = "") {
        return {code, msg, detail};
    }
};

// =============================================================================
// Text Span (文本片段 - 分段输入)
// =============================================================================

struct TextSpan {
    std::string text;
    int chunk_index = 0;
    int line_index = 0;
};

// =============================================================================
// Segment (合成片段)
// =============================================================================
//
// (chunk_index, line_index, segment_index) 在一次请求内唯一，
// 并定义最终拼接顺序。
//

struct Segment {
    std::string text;               // 已去除首尾空白, 非空
    LanguageTag language = LanguageTag::EN;
    int chunk_index = 0;
    int line_index = 0;
    int segment_index = 0;

    std::tuple<int, int, int> orderKey() const {
        return std::make_tuple(chunk_index, line_index, segment_index);
    }
};

inline bool segmentOrderLess(const Segment& a, const Segment& b) {
    return a.orderKey() < b.orderKey();
}

// =============================================================================
// Voice Profile (音色配置)
// =============================================================================

struct VoiceProfile {
    std::string en;     // 英文音色 ID
    std::string zh;     // 中文音色 ID

    const std::string& voiceFor(LanguageTag tag) const {
        return tag == LanguageTag::ZH ? zh : en;
    }
};

// =============================================================================
// Audio Artifact (单片段音频产物)
// =============================================================================

struct AudioArtifact {
    Segment segment;
    std::string path;           // 工作目录中的文件路径
    uint64_t size_bytes = 0;    // 必须 > 0
};

// =============================================================================
// Pipeline Result (流水线结果)
// =============================================================================

struct PipelineResult {
    std::vector<uint8_t> audio;     // 拼接后的完整音频
    int segment_count = 0;          // 合并的片段数
    int64_t processing_time_ms = 0;

    bool isEmpty() const { return audio.empty(); }
};

// =============================================================================
// Cancel Token (取消标记)
// =============================================================================
//
// 子标记在父标记取消时同样视为已取消。
//

class CancelToken {
public:
    CancelToken() = default;
    explicit CancelToken(std::shared_ptr<const CancelToken> parent)
        : parent_(std::move(parent)) {}

    void cancel() { cancelled_.store(true); }

    bool isCancelled() const {
        if (cancelled_.load()) return true;
        return parent_ && parent_->isCancelled();
    }

private:
    std::atomic<bool> cancelled_{false};
    std::shared_ptr<const CancelToken> parent_;
};

}  // namespace mixvoice

#endif  // MIXVOICE_TYPES_HPP

#ifndef MIXVOICE_CONFIG_HPP
#define MIXVOICE_CONFIG_HPP

#include <cstdint>
#include <cstdlib>

#include <map>
#include <string>

#include "mixvoice_types.hpp"

namespace mixvoice {

// =============================================================================
// Pipeline Config (流水线配置 - 内部使用)
// =============================================================================
//
// 进程级只读配置，启动时构造一次，显式传入各组件。
//

struct PipelineConfig {
    // -------------------------------------------------------------------------
    // 分段参数
    // -------------------------------------------------------------------------

    int max_segment_length = 1000;      ///< 单片段最大长度 (码点)
    int min_segment_length = 2;         ///< 英文片段最小长度 (码点)
    int max_chunk_length = 5000;        ///< 顶层分块最大长度 (码点)
    int numeric_context_window = 5;     ///< 数字上下文窗口 (码点)
    uint64_t max_input_bytes = 10485760;  ///< 输入文本最大字节数

    // -------------------------------------------------------------------------
    // 并发与超时
    // -------------------------------------------------------------------------

    int max_concurrency = 4;            ///< 最大并发合成数
    int synthesis_timeout_seconds = 30; ///< 单片段合成超时 (秒)
    FailurePolicy failure_policy = FailurePolicy::FAIL_FAST;

    // -------------------------------------------------------------------------
    // 工作目录与产物
    // -------------------------------------------------------------------------

    std::string temp_base_dir;          ///< 系统临时目录不可用时的备用目录
    std::string artifact_extension = "mp3";

    // -------------------------------------------------------------------------
    // 音色表
    // -------------------------------------------------------------------------

    std::map<std::string, VoiceProfile> voice_table = {
        {"male",   {"en-US-ChristopherNeural", "zh-CN-YunxiNeural"}},
        {"female", {"en-US-JennyNeural", "zh-CN-XiaoxiaoNeural"}},
    };

    bool verbose = false;               ///< 输出逐片段日志

    // -------------------------------------------------------------------------
    // 便捷构建方法
    // -------------------------------------------------------------------------

    /// @brief 创建默认配置
    static PipelineConfig Default() {
        return PipelineConfig();
    }

    // -------------------------------------------------------------------------
    // 链式配置
    // -------------------------------------------------------------------------

    PipelineConfig withMaxConcurrency(int n) const {
        auto c = *this;
        c.max_concurrency = n;
        return c;
    }

    PipelineConfig withTimeout(int seconds) const {
        auto c = *this;
        c.synthesis_timeout_seconds = seconds;
        return c;
    }

    PipelineConfig withFailurePolicy(FailurePolicy policy) const {
        auto c = *this;
        c.failure_policy = policy;
        return c;
    }

    PipelineConfig withSegmentLengths(int min_len, int max_len) const {
        auto c = *this;
        c.min_segment_length = min_len;
        c.max_segment_length = max_len;
        return c;
    }

    PipelineConfig withMaxChunkLength(int len) const {
        auto c = *this;
        c.max_chunk_length = len;
        return c;
    }

    PipelineConfig withNumericContextWindow(int window) const {
        auto c = *this;
        c.numeric_context_window = window;
        return c;
    }

    PipelineConfig withTempBaseDir(const std::string& dir) const {
        auto c = *this;
        c.temp_base_dir = dir;
        return c;
    }

    PipelineConfig withVoice(const std::string& name, const VoiceProfile& profile) const {
        auto c = *this;
        c.voice_table[name] = profile;
        return c;
    }

    PipelineConfig withVerbose(bool on) const {
        auto c = *this;
        c.verbose = on;
        return c;
    }

    // -------------------------------------------------------------------------
    // 工具方法
    // -------------------------------------------------------------------------

    /// @brief 按音色名 (male/female) 查找音色配置
    /// @param name 音色名
    /// @param profile [out] 音色配置
    /// @return 错误信息
    ErrorInfo findVoiceProfile(const std::string& name, VoiceProfile& profile) const {
        auto it = voice_table.find(name);
        if (it == voice_table.end()) {
            return ErrorInfo::error(ErrorCode::UNKNOWN_VOICE, "Invalid voice type: " + name);
        }
        profile = it->second;
        return ErrorInfo::ok();
    }

    /// @brief 获取备用临时目录的完整路径
    /// @return 展开后的路径
    std::string getExpandedTempBaseDir() const {
        if (temp_base_dir.empty()) {
            return "./temp";
        }
        // 展开 ~ 到 HOME 目录
        if (temp_base_dir[0] == '~') {
            const char* home = getenv("HOME");
            if (home) {
                return std::string(home) + temp_base_dir.substr(1);
            }
        }
        return temp_base_dir;
    }

    /// @brief 验证配置是否有效
    /// @return 错误信息
    ErrorInfo validate() const {
        if (max_segment_length <= 0) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "max_segment_length must be positive");
        }
        if (min_segment_length < 0 || min_segment_length > max_segment_length) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "min_segment_length must be within [0, max_segment_length]");
        }
        if (max_chunk_length <= 0) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "max_chunk_length must be positive");
        }
        if (numeric_context_window < 0) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "numeric_context_window must be >= 0");
        }
        if (max_concurrency <= 0) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "max_concurrency must be positive");
        }
        if (synthesis_timeout_seconds <= 0) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "synthesis_timeout_seconds must be positive");
        }
        if (voice_table.empty()) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "voice_table is empty");
        }
        for (const auto& entry : voice_table) {
            if (entry.second.en.empty() || entry.second.zh.empty()) {
                return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                    "Voice profile '" + entry.first + "' needs both en and zh voices");
            }
        }
        return ErrorInfo::ok();
    }
};

// =============================================================================
// Synthesis Client Config (合成客户端配置)
// =============================================================================

enum class ClientType {
    AZURE_SPEECH,       // Azure Speech REST (SSML -> mp3)
    EDGE_TTS_COMMAND,   // edge-tts 命令行
};

inline const char* clientTypeToString(ClientType type) {
    switch (type) {
        case ClientType::AZURE_SPEECH:     return "azure";
        case ClientType::EDGE_TTS_COMMAND: return "edge-tts";
        default:                           return "unknown";
    }
}

struct SynthesisClientConfig {
    ClientType type = ClientType::AZURE_SPEECH;

    // Azure Speech
    std::string region = "eastus";
    std::string api_key;
    std::string endpoint;               ///< 为空时由 region 推导
    std::string output_format = "audio-24khz-48kbitrate-mono-mp3";
    int connect_timeout_seconds = 10;
    int request_timeout_seconds = 60;   ///< 单次请求上限, 流水线另有片段超时

    // edge-tts
    std::string command = "edge-tts";

    /// @brief 获取 Azure REST 地址
    std::string getEndpoint() const {
        if (!endpoint.empty()) {
            return endpoint;
        }
        return "https://" + region + ".tts.speech.microsoft.com/cognitiveservices/v1";
    }

    ErrorInfo validate() const {
        if (type == ClientType::AZURE_SPEECH) {
            if (api_key.empty()) {
                return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Azure speech key not set");
            }
            if (endpoint.empty() && region.empty()) {
                return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Azure region or endpoint required");
            }
            if (connect_timeout_seconds <= 0 || request_timeout_seconds <= 0) {
                return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Azure timeouts must be positive");
            }
        } else if (type == ClientType::EDGE_TTS_COMMAND) {
            if (command.empty()) {
                return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "edge-tts command not set");
            }
        }
        return ErrorInfo::ok();
    }
};

}  // namespace mixvoice

#endif  // MIXVOICE_CONFIG_HPP

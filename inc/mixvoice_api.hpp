#ifndef MIXVOICE_API_HPP
#define MIXVOICE_API_HPP

/**
 * MixVoice SDK - 中英混合文本语音合成
 *
 * 将任意中英混合文本切分为片段，按语言选择音色并发合成，
 * 再按原文顺序拼接为一个音频文件 (mp3)。
 *
 * 使用示例 1 - 默认配置 (从环境变量 / .env 读取 Azure 密钥):
 *
 *   MixVoice::SpeechService service(MixVoice::SpeechConfig::FromEnv());
 *   auto result = service.Synthesize("今天学习Python 3.12，效率提升了50%。", "female");
 *   if (result->IsSuccess()) {
 *       result->SaveToFile("output.mp3");
 *   }
 *
 * 使用示例 2 - 链式配置:
 *
 *   auto config = MixVoice::SpeechConfig::Default()
 *       .withBackend(MixVoice::BackendType::EDGE_TTS)
 *       .withMaxConcurrency(8)
 *       .withFailurePolicy(MixVoice::FailurePolicy::BEST_EFFORT);
 *   MixVoice::SpeechService service(config);
 *
 * 使用示例 3 - 只查看分段结果:
 *
 *   for (const auto& seg : service.PreviewSegments("我有42个苹果and5个桔子")) {
 *       std::cout << seg.language << ": " << seg.text << std::endl;
 *   }
 */

#include <cstdint>

#include <map>
#include <memory>
#include <string>
#include <vector>

// Forward declaration of internal types
namespace mixvoice {
    class ISynthesisClient;
}  // namespace mixvoice

namespace MixVoice {

// =============================================================================
// BackendType - 合成后端
// =============================================================================

enum class BackendType {
    AZURE_SPEECH,       ///< Azure Speech REST (需要 AZURE_SPEECH_KEY)
    EDGE_TTS,           ///< 本机 edge-tts 命令行
};

// =============================================================================
// FailurePolicy - 片段失败策略
// =============================================================================

enum class FailurePolicy {
    FAIL_FAST,          ///< 任一片段失败即返回错误 (默认)
    BEST_EFFORT,        ///< 跳过失败片段, 全部失败时返回 NO_ARTIFACTS
};

// =============================================================================
// VoicePair - 一组中英音色
// =============================================================================

struct VoicePair {
    std::string en;     ///< 英文音色, 如 "en-US-JennyNeural"
    std::string zh;     ///< 中文音色, 如 "zh-CN-XiaoxiaoNeural"
};

// =============================================================================
// SpeechConfig - 服务配置
// =============================================================================

struct SpeechConfig {
    // -------------------------------------------------------------------------
    // 后端选择
    // -------------------------------------------------------------------------

    BackendType backend = BackendType::AZURE_SPEECH;

    std::string azure_key;                      ///< Azure 订阅密钥
    std::string azure_region = "eastus";        ///< Azure 区域
    std::string azure_endpoint;                 ///< 自定义地址, 空则由区域推导
    std::string output_format = "audio-24khz-48kbitrate-mono-mp3";
    std::string edge_tts_command = "edge-tts";  ///< edge-tts 可执行文件

    // -------------------------------------------------------------------------
    // 分段参数
    // -------------------------------------------------------------------------

    int max_segment_length = 1000;      ///< 单片段最大字符数
    int min_segment_length = 2;         ///< 英文片段最小字符数
    int max_chunk_length = 5000;        ///< 顶层分块最大字符数
    int numeric_context_window = 5;     ///< 数字归属判断的上下文窗口

    // -------------------------------------------------------------------------
    // 并发与超时
    // -------------------------------------------------------------------------

    int max_concurrency = 4;            ///< 最大并发合成数
    int timeout_seconds = 30;           ///< 单片段合成超时
    FailurePolicy failure_policy = FailurePolicy::FAIL_FAST;

    // -------------------------------------------------------------------------
    // 其他
    // -------------------------------------------------------------------------

    std::string temp_dir;               ///< 备用临时目录, 空则使用 ./temp
    bool verbose = false;               ///< 输出逐片段日志

    /// 音色表, 键为调用方使用的音色名
    std::map<std::string, VoicePair> voices = {
        {"male",   {"en-US-ChristopherNeural", "zh-CN-YunxiNeural"}},
        {"female", {"en-US-JennyNeural", "zh-CN-XiaoxiaoNeural"}},
    };

    // -------------------------------------------------------------------------
    // 便捷构建方法
    // -------------------------------------------------------------------------

    /// @brief 创建默认配置
    static SpeechConfig Default() {
        return SpeechConfig();
    }

    /// @brief 从 .env 文件和环境变量创建配置 (环境变量优先)
    /// @param env_file .env 文件路径, 不存在时忽略
    /// @note 格式错误的项会打印警告并保留默认值
    static SpeechConfig FromEnv(const std::string& env_file = ".env");

    // 链式配置
    SpeechConfig withBackend(BackendType type) const {
        auto c = *this;
        c.backend = type;
        return c;
    }

    SpeechConfig withAzure(const std::string& key, const std::string& region) const {
        auto c = *this;
        c.azure_key = key;
        c.azure_region = region;
        return c;
    }

    SpeechConfig withMaxConcurrency(int n) const {
        auto c = *this;
        c.max_concurrency = n;
        return c;
    }

    SpeechConfig withTimeout(int seconds) const {
        auto c = *this;
        c.timeout_seconds = seconds;
        return c;
    }

    SpeechConfig withFailurePolicy(FailurePolicy policy) const {
        auto c = *this;
        c.failure_policy = policy;
        return c;
    }

    SpeechConfig withVoice(const std::string& name, const VoicePair& pair) const {
        auto c = *this;
        c.voices[name] = pair;
        return c;
    }

    SpeechConfig withVerbose(bool on) const {
        auto c = *this;
        c.verbose = on;
        return c;
    }
};

// =============================================================================
// SegmentInfo - 分段预览
// =============================================================================

struct SegmentInfo {
    std::string text;
    std::string language;       ///< "zh" 或 "en"
    int chunk_index = 0;
    int line_index = 0;
    int segment_index = 0;
};

// =============================================================================
// SpeechResult - 合成结果
// =============================================================================

class SpeechResult {
public:
    SpeechResult();
    ~SpeechResult();

    // 禁止拷贝，允许移动
    SpeechResult(const SpeechResult&) = delete;
    SpeechResult& operator=(const SpeechResult&) = delete;
    SpeechResult(SpeechResult&&) noexcept;
    SpeechResult& operator=(SpeechResult&&) noexcept;

    // -------------------------------------------------------------------------
    // 音频数据获取
    // -------------------------------------------------------------------------

    /// @brief 获取拼接后的音频 (编码后的字节, 默认 mp3)
    const std::vector<uint8_t>& GetAudioData() const;

    // -------------------------------------------------------------------------
    // 状态检查
    // -------------------------------------------------------------------------

    /// @brief 是否合成成功
    bool IsSuccess() const;

    /// @brief 获取错误码名称, 成功时为 "OK"
    /// @return 如 "NO_SEGMENTS", "SYNTHESIS_TIMEOUT"
    std::string GetCode() const;

    /// @brief 获取数值错误码, 成功时为 0
    int GetErrorCode() const;

    /// @brief 获取错误信息
    std::string GetMessage() const;

    /// @brief 获取错误详情 (调试用)
    std::string GetDetail() const;

    /// @brief 是否为空结果
    bool IsEmpty() const;

    // -------------------------------------------------------------------------
    // 统计
    // -------------------------------------------------------------------------

    /// @brief 拼接的片段数
    int GetSegmentCount() const;

    /// @brief 处理耗时 (毫秒)
    int GetProcessingTimeMs() const;

    // -------------------------------------------------------------------------
    // 文件操作
    // -------------------------------------------------------------------------

    /// @brief 保存到文件
    /// @param file_path 文件路径
    /// @return 是否成功
    bool SaveToFile(const std::string& file_path) const;

private:
    friend class SpeechService;

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// =============================================================================
// SpeechService - 合成服务
// =============================================================================

class SpeechService {
public:
    /// @brief 构造服务, 按配置创建合成客户端
    /// @param config 配置对象
    /// @note 配置无效时 IsInitialized() 返回 false, 之后的合成请求返回 INVALID_CONFIG
    explicit SpeechService(const SpeechConfig& config = SpeechConfig::Default());

    /// @brief 构造服务, 使用外部提供的合成客户端 (忽略配置中的后端选项)
    SpeechService(const SpeechConfig& config,
                  std::shared_ptr<mixvoice::ISynthesisClient> client);

    ~SpeechService();

    // 禁止拷贝
    SpeechService(const SpeechService&) = delete;
    SpeechService& operator=(const SpeechService&) = delete;

    // =========================================================================
    // 合成
    // =========================================================================

    /// @brief 合成文本 (阻塞直到完成)
    /// @param text 任意中英混合文本
    /// @param voice 音色名, 默认 "male" / "female"
    /// @return 合成结果, 不会为 nullptr
    std::shared_ptr<SpeechResult> Synthesize(const std::string& text,
                                             const std::string& voice = "male");

    /// @brief 合成文本并保存到文件
    /// @return 是否成功
    bool SynthesizeToFile(const std::string& text, const std::string& file_path,
                          const std::string& voice = "male");

    /// @brief 只做分段, 不合成
    std::vector<SegmentInfo> PreviewSegments(const std::string& text) const;

    // =========================================================================
    // 辅助方法
    // =========================================================================

    bool IsInitialized() const;

    /// @brief 初始化失败的原因
    std::string GetInitError() const;

    /// @brief 合成客户端名称
    std::string GetClientName() const;

    /// @brief 可用的音色名
    std::vector<std::string> GetVoiceNames() const;

    SpeechConfig GetConfig() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace MixVoice

#endif  // MIXVOICE_API_HPP

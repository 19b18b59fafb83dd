#ifndef MIXVOICE_SYNTHESIS_CLIENT_HPP
#define MIXVOICE_SYNTHESIS_CLIENT_HPP

#include <cstdint>

#include <memory>
#include <string>
#include <vector>

#include "internal/mixvoice_config.hpp"
#include "internal/mixvoice_types.hpp"

namespace mixvoice {

// =============================================================================
// Synthesis Client Interface (语音合成客户端抽象接口)
// =============================================================================
//
// 一次调用合成一个片段，返回编码后的音频字节 (mp3 等)。
// 调用可能很慢，也可能失败; 调用方负责超时与重排序。
//
// 实现约定:
// - 可被多个工作线程并发调用，实现必须线程安全
// - 应周期性检查 cancel.isCancelled() 并尽快返回 CANCELLED
// - 临时文件只能写在 scratch_dir 中 (本次请求的工作目录, 请求结束时整体删除);
//   片段产物由 SegmentSynthesizer 落盘
// - 被取消后须在返回前结束自己启动的子进程
// - 抛出的 std::exception 会被转换为 SYNTHESIS_BACKEND_ERROR
//
// 已实现的客户端:
// - AzureSpeechClient:     Azure Speech REST (SSML)
// - EdgeTtsCommandClient:  edge-tts 命令行
//

class ISynthesisClient {
public:
    virtual ~ISynthesisClient() = default;

    /// @brief 合成一段文本
    /// @param text 片段文本 (已去除首尾空白)
    /// @param voice_id 音色 ID, 例如 "zh-CN-YunxiNeural"
    /// @param scratch_dir 可写的临时目录
    /// @param cancel 取消标记
    /// @param audio [out] 音频字节
    /// @return 错误信息, OK表示成功
    virtual ErrorInfo synthesize(const std::string& text,
                                 const std::string& voice_id,
                                 const std::string& scratch_dir,
                                 const CancelToken& cancel,
                                 std::vector<uint8_t>& audio) = 0;

    /// @brief 获取客户端名称 (用于日志)
    virtual std::string getName() const = 0;
};

// =============================================================================
// Client Factory (客户端工厂)
// =============================================================================

class SynthesisClientFactory {
public:
    /// @brief 创建合成客户端
    /// @param config 客户端配置
    /// @param client [out] 客户端实例
    /// @return 错误信息 (配置无效时为 INVALID_CONFIG)
    static ErrorInfo create(const SynthesisClientConfig& config,
                            std::unique_ptr<ISynthesisClient>& client);

    /// @brief 获取客户端名称
    static const char* getClientName(ClientType type) {
        return clientTypeToString(type);
    }
};

}  // namespace mixvoice

#endif  // MIXVOICE_SYNTHESIS_CLIENT_HPP

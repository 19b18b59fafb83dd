#ifndef MIXVOICE_SEGMENT_SYNTHESIZER_HPP
#define MIXVOICE_SEGMENT_SYNTHESIZER_HPP

#include <chrono>
#include <memory>
#include <string>

#include "internal/mixvoice_types.hpp"
#include "internal/synthesis/synthesis_client.hpp"
#include "internal/workspace/workspace.hpp"

namespace mixvoice {

// =============================================================================
// SegmentSynthesizer - 单片段合成
// =============================================================================
//
// 按片段语言选择音色，带超时调用合成客户端，校验并写出产物文件。
//
// 客户端在独立线程中执行，工作目录作为其临时目录传入。
// 超时或取消后置位调用的取消标记，并最多等待 2s 让客户端退出 (期间仍占用
// 当前工作线程, 保证同时进行的调用数不超过并发上限); 仍未退出的线程被放弃，
// 迟到的结果只留在内存中，不会写入工作目录。
//

class SegmentSynthesizer {
public:
    /// @param client 合成客户端 (被放弃的调用线程也持有它)
    /// @param workspace 本次请求的工作目录, 生命周期须覆盖所有 synthesize 调用
    /// @param extension 产物扩展名
    /// @param verbose 输出逐片段日志
    SegmentSynthesizer(std::shared_ptr<ISynthesisClient> client,
                       const WorkspaceScope& workspace,
                       const std::string& extension = "mp3",
                       bool verbose = false);

    /// @brief 合成一个片段并写出产物
    /// @param segment 片段
    /// @param voice 音色配置, 使用 voice.voiceFor(segment.language)
    /// @param timeout 超时时间
    /// @param run_token 整个任务的取消标记, 可为空
    /// @param artifact [out] 产物
    /// @return 错误信息:
    ///   EMPTY_SEGMENT / SYNTHESIS_TIMEOUT / EMPTY_SYNTHESIS /
    ///   SYNTHESIS_BACKEND_ERROR (含 NETWORK_ERROR, AUTH_FAILED) /
    ///   FILE_WRITE_ERROR / CANCELLED
    ErrorInfo synthesize(const Segment& segment,
                         const VoiceProfile& voice,
                         std::chrono::milliseconds timeout,
                         const std::shared_ptr<const CancelToken>& run_token,
                         AudioArtifact& artifact) const;

private:
    std::shared_ptr<ISynthesisClient> client_;
    const WorkspaceScope& workspace_;
    std::string extension_;
    bool verbose_;
};

}  // namespace mixvoice

#endif  // MIXVOICE_SEGMENT_SYNTHESIZER_HPP

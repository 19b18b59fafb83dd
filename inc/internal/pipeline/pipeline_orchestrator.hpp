#ifndef MIXVOICE_PIPELINE_ORCHESTRATOR_HPP
#define MIXVOICE_PIPELINE_ORCHESTRATOR_HPP

#include <memory>
#include <string>
#include <vector>

#include "internal/mixvoice_config.hpp"
#include "internal/mixvoice_types.hpp"
#include "internal/synthesis/synthesis_client.hpp"
#include "internal/text/segmenter.hpp"

namespace mixvoice {

// =============================================================================
// PipelineOrchestrator - 合成流水线
// =============================================================================
//
// 文本 -> 分块 -> 分行 -> 片段 -> 并发合成 -> 按 (chunk, line, segment) 排序 -> 拼接
//
// 每次 run() 独立: 自己的工作目录、会话 ID、线程池和取消标记。
// 同一个 orchestrator 可被多个线程同时调用 run()。
//

/// @brief 单个片段的合成结果, 只由对应任务写入
/// 默认为错误状态, 任务未执行或中途异常时不会被当作成功
struct SegmentSlot {
    ErrorInfo error = ErrorInfo::error(ErrorCode::INTERNAL_ERROR, "Segment not synthesized");
    AudioArtifact artifact;
    bool has_artifact = false;
};

class PipelineOrchestrator {
public:
    /// @param config 流水线配置 (须已通过 validate())
    /// @param client 合成客户端
    PipelineOrchestrator(const PipelineConfig& config, std::shared_ptr<ISynthesisClient> client);

    /// @brief 将文本切分为有序片段, 不做合成
    /// @param text 原始文本
    /// @param segments [out] 片段
    /// @return 错误信息: 超过 max_input_bytes 时为 TEXT_TOO_LONG
    ErrorInfo planSegments(const std::string& text, std::vector<Segment>& segments) const;

    /// @brief 合成整段文本, 并发数取配置中的 max_concurrency
    ErrorInfo run(const std::string& text, const VoiceProfile& voice, PipelineResult& result) const;

    /// @brief 合成整段文本
    /// @param text 原始文本
    /// @param voice 音色配置
    /// @param max_concurrency 最大并发合成数
    /// @param result [out] 合成结果
    /// @return 错误信息:
    ///   NO_SEGMENTS: 没有可合成的片段
    ///   FAIL_FAST 下第一个片段错误; BEST_EFFORT 下全部失败时为 NO_ARTIFACTS
    ErrorInfo run(const std::string& text, const VoiceProfile& voice,
                  int max_concurrency, PipelineResult& result) const;

    /// @brief 按失败策略汇总各片段结果
    /// @param slots 片段结果, 与片段顺序一致
    /// @param policy 失败策略
    /// @param first_error 任务执行期间记录的第一个错误 (可为 ok)
    /// @param artifacts [out] 成功的产物 (未排序)
    /// @return FAIL_FAST: first_error 或第一个未成功片段的错误;
    ///         BEST_EFFORT: 没有任何产物时为 NO_ARTIFACTS
    static ErrorInfo collectArtifacts(const std::vector<SegmentSlot>& slots,
                                      FailurePolicy policy,
                                      const ErrorInfo& first_error,
                                      std::vector<AudioArtifact>& artifacts);

    const PipelineConfig& config() const { return config_; }

private:
    PipelineConfig config_;
    std::shared_ptr<ISynthesisClient> client_;
    text::Segmenter segmenter_;
};

}  // namespace mixvoice

#endif  // MIXVOICE_PIPELINE_ORCHESTRATOR_HPP

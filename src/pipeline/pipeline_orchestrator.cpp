#include "internal/pipeline/pipeline_orchestrator.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <filesystem>  // NOLINT(build/c++17)
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "internal/pipeline/assembler.hpp"
#include "internal/pipeline/segment_synthesizer.hpp"
#include "internal/pipeline/synthesis_worker_pool.hpp"
#include "internal/workspace/workspace.hpp"

namespace fs = std::filesystem;

namespace mixvoice {

namespace {

void removeArtifacts(const std::vector<SegmentSlot>& slots) {
    for (const auto& slot : slots) {
        if (!slot.has_artifact) continue;
        std::error_code ec;
        fs::remove(slot.artifact.path, ec);
        if (ec) {
            std::cerr << "[Pipeline] Failed to remove " << slot.artifact.path
                      << ": " << ec.message() << std::endl;
        }
    }
}

}  // namespace

PipelineOrchestrator::PipelineOrchestrator(const PipelineConfig& config,
                                           std::shared_ptr<ISynthesisClient> client)
    : config_(config),
      client_(std::move(client)),
      segmenter_(text::SegmenterOptions::fromConfig(config)) {
}

ErrorInfo PipelineOrchestrator::planSegments(const std::string& text,
                                             std::vector<Segment>& segments) const {
    segments.clear();
    if (static_cast<uint64_t>(text.size()) > config_.max_input_bytes) {
        return ErrorInfo::error(ErrorCode::TEXT_TOO_LONG,
            "Input text exceeds " + std::to_string(config_.max_input_bytes) + " bytes");
    }

    auto chunks = segmenter_.splitIntoChunks(text);
    for (size_t chunk_index = 0; chunk_index < chunks.size(); ++chunk_index) {
        auto lines = segmenter_.splitIntoLines(chunks[chunk_index], static_cast<int>(chunk_index));
        for (const auto& line : lines) {
            auto line_segments = segmenter_.segment(line);
            segments.insert(segments.end(), line_segments.begin(), line_segments.end());
        }
    }
    return ErrorInfo::ok();
}

ErrorInfo PipelineOrchestrator::collectArtifacts(const std::vector<SegmentSlot>& slots,
                                                FailurePolicy policy,
                                                const ErrorInfo& first_error,
                                                std::vector<AudioArtifact>& artifacts) {
    artifacts.clear();

    if (policy == FailurePolicy::FAIL_FAST) {
        if (!first_error.isOk()) {
            return first_error;
        }
        // 提交失败、任务异常等未记录的错误同样中止
        for (const auto& slot : slots) {
            if (!slot.has_artifact) {
                return slot.error.isOk()
                    ? ErrorInfo::error(ErrorCode::INTERNAL_ERROR, "Segment has no artifact")
                    : slot.error;
            }
        }
    }

    artifacts.reserve(slots.size());
    for (size_t i = 0; i < slots.size(); ++i) {
        if (slots[i].has_artifact) {
            artifacts.push_back(slots[i].artifact);
        } else {
            std::cerr << "[Pipeline] Skipping segment " << i << " ("
                      << errorCodeToString(slots[i].error.code) << "): "
                      << slots[i].error.message << std::endl;
        }
    }

    if (artifacts.empty()) {
        return ErrorInfo::error(ErrorCode::NO_ARTIFACTS,
            "All " + std::to_string(slots.size()) + " segments failed");
    }
    return ErrorInfo::ok();
}

ErrorInfo PipelineOrchestrator::run(const std::string& text, const VoiceProfile& voice,
                                    PipelineResult& result) const {
    return run(text, voice, config_.max_concurrency, result);
}

ErrorInfo PipelineOrchestrator::run(const std::string& text, const VoiceProfile& voice,
                                    int max_concurrency, PipelineResult& result) const {
    auto start_time = std::chrono::steady_clock::now();

    if (max_concurrency <= 0) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "max_concurrency must be positive");
    }

    // -------------------------------------------------------------------------
    // 1. 切分
    // -------------------------------------------------------------------------

    std::vector<Segment> segments;
    auto err = planSegments(text, segments);
    if (!err.isOk()) {
        return err;
    }
    if (segments.empty()) {
        return ErrorInfo::error(ErrorCode::NO_SEGMENTS, "Nothing to synthesize");
    }

    if (config_.verbose) {
        std::cout << "[Pipeline] " << segments.size() << " segments, concurrency "
                  << std::min<size_t>(static_cast<size_t>(max_concurrency), segments.size())
                  << std::endl;
    }

    // -------------------------------------------------------------------------
    // 2. 工作目录
    // -------------------------------------------------------------------------

    WorkspaceManager workspace_manager(config_.getExpandedTempBaseDir());
    WorkspaceScope workspace;
    err = workspace_manager.newScope(workspace);
    if (!err.isOk()) {
        return err;
    }

    // -------------------------------------------------------------------------
    // 3. 并发合成
    // -------------------------------------------------------------------------

    SegmentSynthesizer synthesizer(client_, workspace, config_.artifact_extension, config_.verbose);
    auto run_token = std::make_shared<CancelToken>();
    const bool fail_fast = config_.failure_policy == FailurePolicy::FAIL_FAST;
    const std::chrono::milliseconds timeout(
        static_cast<int64_t>(config_.synthesis_timeout_seconds) * 1000);

    std::vector<SegmentSlot> slots(segments.size());
    std::mutex first_error_mutex;
    ErrorInfo first_error = ErrorInfo::ok();

    {
        SynthesisWorkerPool pool(std::min<size_t>(static_cast<size_t>(max_concurrency),
                                                  segments.size()));
        pool.start();

        for (size_t i = 0; i < segments.size(); ++i) {
            bool submitted = pool.submit([&, i]() {
                SegmentSlot& slot = slots[i];
                if (run_token->isCancelled()) {
                    slot.error = ErrorInfo::error(ErrorCode::CANCELLED, "Skipped after failure");
                    return;
                }

                try {
                    slot.error = synthesizer.synthesize(segments[i], voice, timeout,
                                                        run_token, slot.artifact);
                } catch (const std::exception& e) {
                    slot.error = ErrorInfo::error(ErrorCode::INTERNAL_ERROR,
                        "Segment synthesis threw an exception", e.what());
                }
                slot.has_artifact = slot.error.isOk();

                if (!slot.error.isOk() && slot.error.code != ErrorCode::CANCELLED && fail_fast) {
                    std::lock_guard<std::mutex> lock(first_error_mutex);
                    if (first_error.isOk()) {
                        first_error = slot.error;
                        run_token->cancel();
                    }
                }
            });
            if (!submitted) {
                slots[i].error = ErrorInfo::error(ErrorCode::INTERNAL_ERROR, "Failed to submit task");
            }
        }

        pool.waitIdle();
        pool.stop();
    }

    // -------------------------------------------------------------------------
    // 4. 收集结果
    // -------------------------------------------------------------------------

    std::vector<AudioArtifact> artifacts;
    err = collectArtifacts(slots, config_.failure_policy, first_error, artifacts);
    if (!err.isOk()) {
        if (fail_fast) {
            std::cerr << "[Pipeline] Synthesis failed: " << errorCodeToString(err.code)
                      << " " << err.message;
            if (!err.detail.empty()) {
                std::cerr << " (" << err.detail << ")";
            }
            std::cerr << std::endl;
        }
        removeArtifacts(slots);
        workspace_manager.release(workspace);
        return err;
    }

    // 完成顺序不确定, 必须按索引重新排序
    std::sort(artifacts.begin(), artifacts.end(),
        [](const AudioArtifact& a, const AudioArtifact& b) {
            return segmentOrderLess(a.segment, b.segment);
        });

    // -------------------------------------------------------------------------
    // 5. 拼接与清理
    // -------------------------------------------------------------------------

    PipelineResult assembled;
    err = Assembler::assemble(artifacts, assembled);
    removeArtifacts(slots);
    workspace_manager.release(workspace);
    if (!err.isOk()) {
        return err;
    }

    auto end_time = std::chrono::steady_clock::now();
    assembled.processing_time_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();

    if (config_.verbose) {
        std::cout << "[Pipeline] Assembled " << assembled.segment_count << " segments, "
                  << assembled.audio.size() << " bytes in "
                  << assembled.processing_time_ms << " ms" << std::endl;
    }

    result = std::move(assembled);
    return ErrorInfo::ok();
}

}  // namespace mixvoice

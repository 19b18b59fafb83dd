#include "internal/pipeline/segment_synthesizer.hpp"

#include <algorithm>
#include <condition_variable>
#include <filesystem>  // NOLINT(build/c++17)
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "internal/text/text_utils.hpp"

namespace fs = std::filesystem;

namespace mixvoice {

namespace {

// 调用线程与等待方共享的状态
struct CallState {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    ErrorInfo error = ErrorInfo::ok();
    std::vector<uint8_t> audio;
};

constexpr std::chrono::milliseconds kPollInterval(20);
// 取消后等待客户端退出的时间, 期间仍占用工作线程
constexpr std::chrono::milliseconds kCancelGrace(2000);

// 置位取消标记并等待调用线程结束; 超过 kCancelGrace 则放弃
void cancelAndWait(CancelToken& call_token, CallState& state,
                   std::unique_lock<std::mutex>& lock, const std::string& what) {
    call_token.cancel();
    if (!state.cv.wait_for(lock, kCancelGrace, [&state]() { return state.done; })) {
        std::cerr << "[Synthesizer] Client did not stop within "
                  << kCancelGrace.count() << " ms after cancel, abandoning " << what << std::endl;
    }
}

std::string describe(const Segment& segment) {
    return "(" + std::to_string(segment.chunk_index) + "," +
        std::to_string(segment.line_index) + "," +
        std::to_string(segment.segment_index) + ")";
}

}  // namespace

SegmentSynthesizer::SegmentSynthesizer(std::shared_ptr<ISynthesisClient> client,
                                       const WorkspaceScope& workspace,
                                       const std::string& extension,
                                       bool verbose)
    : client_(std::move(client)),
      workspace_(workspace),
      extension_(extension),
      verbose_(verbose) {
}

ErrorInfo SegmentSynthesizer::synthesize(const Segment& segment,
                                         const VoiceProfile& voice,
                                         std::chrono::milliseconds timeout,
                                         const std::shared_ptr<const CancelToken>& run_token,
                                         AudioArtifact& artifact) const {
    std::string text = text::trim(segment.text);
    if (text.empty()) {
        return ErrorInfo::error(ErrorCode::EMPTY_SEGMENT,
            "Segment text is empty", describe(segment));
    }
    if (!client_) {
        return ErrorInfo::error(ErrorCode::SYNTHESIS_BACKEND_ERROR, "No synthesis client");
    }

    const std::string& voice_id = voice.voiceFor(segment.language);
    auto state = std::make_shared<CallState>();
    auto call_token = std::make_shared<CancelToken>(run_token);
    auto client = client_;
    std::string scratch_dir = workspace_.path();

    if (verbose_) {
        std::cout << "[Synthesizer] " << describe(segment) << " ["
                  << languageTagToString(segment.language) << "] " << voice_id
                  << ": " << text << std::endl;
    }

    try {
        std::thread([state, call_token, client, text, voice_id, scratch_dir]() {
            ErrorInfo err = ErrorInfo::ok();
            std::vector<uint8_t> audio;
            try {
                err = client->synthesize(text, voice_id, scratch_dir, *call_token, audio);
            } catch (const std::exception& e) {
                err = ErrorInfo::error(ErrorCode::SYNTHESIS_BACKEND_ERROR,
                    "Synthesis client threw an exception", e.what());
            } catch (...) {
                err = ErrorInfo::error(ErrorCode::SYNTHESIS_BACKEND_ERROR,
                    "Synthesis client threw an unknown exception");
            }
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                state->error = std::move(err);
                state->audio = std::move(audio);
                state->done = true;
            }
            state->cv.notify_all();
        }).detach();
    } catch (const std::system_error& e) {
        return ErrorInfo::error(ErrorCode::INTERNAL_ERROR,
            "Failed to start synthesis thread", e.what());
    }

    // 等待完成、超时或取消
    auto deadline = std::chrono::steady_clock::now() + timeout;
    ErrorInfo call_error = ErrorInfo::ok();
    std::vector<uint8_t> audio;
    {
        std::unique_lock<std::mutex> lock(state->mutex);
        while (!state->done) {
            if (run_token && run_token->isCancelled()) {
                cancelAndWait(*call_token, *state, lock, describe(segment));
                return ErrorInfo::error(ErrorCode::CANCELLED, "Run cancelled", describe(segment));
            }
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                cancelAndWait(*call_token, *state, lock, describe(segment));
                return ErrorInfo::error(ErrorCode::SYNTHESIS_TIMEOUT,
                    "Synthesis timed out after " + std::to_string(timeout.count()) + " ms",
                    describe(segment));
            }
            state->cv.wait_until(lock, std::min(deadline, now + kPollInterval));
        }
        call_error = std::move(state->error);
        audio = std::move(state->audio);
    }

    if (!call_error.isOk()) {
        if (call_error.code == ErrorCode::CANCELLED || isSynthesisFailure(call_error.code)) {
            return call_error;
        }
        return ErrorInfo::error(ErrorCode::SYNTHESIS_BACKEND_ERROR,
            call_error.message, call_error.detail);
    }

    if (audio.empty()) {
        return ErrorInfo::error(ErrorCode::EMPTY_SYNTHESIS,
            "Synthesis returned no audio", describe(segment));
    }

    // 写出产物
    std::string path = workspace_.artifactPath(segment, extension_);
    {
        std::ofstream file(path, std::ios::binary);
        if (!file) {
            return ErrorInfo::error(ErrorCode::FILE_WRITE_ERROR,
                "Failed to open artifact for writing", path);
        }
        file.write(reinterpret_cast<const char*>(audio.data()),
                   static_cast<std::streamsize>(audio.size()));
        if (!file.good()) {
            return ErrorInfo::error(ErrorCode::FILE_WRITE_ERROR, "Failed to write artifact", path);
        }
    }

    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec || size == 0) {
        return ErrorInfo::error(ErrorCode::EMPTY_SYNTHESIS,
            "Artifact missing or empty after write", path);
    }

    artifact.segment = segment;
    artifact.path = path;
    artifact.size_bytes = static_cast<uint64_t>(size);

    if (verbose_) {
        std::cout << "[Synthesizer] " << describe(segment) << " -> "
                  << artifact.size_bytes << " bytes" << std::endl;
    }
    return ErrorInfo::ok();
}

}  // namespace mixvoice

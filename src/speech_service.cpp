#include "mixvoice_api.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "internal/config_loader.hpp"
#include "internal/mixvoice_config.hpp"
#include "internal/mixvoice_types.hpp"
#include "internal/pipeline/pipeline_orchestrator.hpp"
#include "internal/synthesis/synthesis_client.hpp"

namespace MixVoice {

// =============================================================================
// 配置转换
// =============================================================================

static mixvoice::FailurePolicy convertFailurePolicy(FailurePolicy policy) {
    switch (policy) {
        case FailurePolicy::BEST_EFFORT:
            return mixvoice::FailurePolicy::BEST_EFFORT;
        case FailurePolicy::FAIL_FAST:
        default:
            return mixvoice::FailurePolicy::FAIL_FAST;
    }
}

static mixvoice::ClientType convertBackendType(BackendType type) {
    switch (type) {
        case BackendType::EDGE_TTS:
            return mixvoice::ClientType::EDGE_TTS_COMMAND;
        case BackendType::AZURE_SPEECH:
        default:
            return mixvoice::ClientType::AZURE_SPEECH;
    }
}

static void toInternal(const SpeechConfig& cfg,
                       mixvoice::PipelineConfig& pipeline,
                       mixvoice::SynthesisClientConfig& client) {
    pipeline.max_segment_length = cfg.max_segment_length;
    pipeline.min_segment_length = cfg.min_segment_length;
    pipeline.max_chunk_length = cfg.max_chunk_length;
    pipeline.numeric_context_window = cfg.numeric_context_window;
    pipeline.max_concurrency = cfg.max_concurrency;
    pipeline.synthesis_timeout_seconds = cfg.timeout_seconds;
    pipeline.failure_policy = convertFailurePolicy(cfg.failure_policy);
    pipeline.temp_base_dir = cfg.temp_dir;
    pipeline.verbose = cfg.verbose;
    pipeline.voice_table.clear();
    for (const auto& entry : cfg.voices) {
        pipeline.voice_table[entry.first] = {entry.second.en, entry.second.zh};
    }

    client.type = convertBackendType(cfg.backend);
    client.api_key = cfg.azure_key;
    client.region = cfg.azure_region;
    client.endpoint = cfg.azure_endpoint;
    client.output_format = cfg.output_format;
    client.command = cfg.edge_tts_command;
}

static SpeechConfig fromInternal(const mixvoice::PipelineConfig& pipeline,
                                 const mixvoice::SynthesisClientConfig& client) {
    SpeechConfig cfg;
    cfg.max_segment_length = pipeline.max_segment_length;
    cfg.min_segment_length = pipeline.min_segment_length;
    cfg.max_chunk_length = pipeline.max_chunk_length;
    cfg.numeric_context_window = pipeline.numeric_context_window;
    cfg.max_concurrency = pipeline.max_concurrency;
    cfg.timeout_seconds = pipeline.synthesis_timeout_seconds;
    cfg.failure_policy = pipeline.failure_policy == mixvoice::FailurePolicy::BEST_EFFORT
        ? FailurePolicy::BEST_EFFORT : FailurePolicy::FAIL_FAST;
    cfg.temp_dir = pipeline.temp_base_dir;
    cfg.verbose = pipeline.verbose;
    cfg.voices.clear();
    for (const auto& entry : pipeline.voice_table) {
        cfg.voices[entry.first] = {entry.second.en, entry.second.zh};
    }

    cfg.backend = client.type == mixvoice::ClientType::EDGE_TTS_COMMAND
        ? BackendType::EDGE_TTS : BackendType::AZURE_SPEECH;
    cfg.azure_key = client.api_key;
    cfg.azure_region = client.region;
    cfg.azure_endpoint = client.endpoint;
    cfg.output_format = client.output_format;
    cfg.edge_tts_command = client.command;
    return cfg;
}

SpeechConfig SpeechConfig::FromEnv(const std::string& env_file) {
    mixvoice::ConfigLoader loader;
    if (!env_file.empty() && !loader.loadEnvFile(env_file)) {
        std::cout << "[Config] " << env_file << " not found, reading environment only" << std::endl;
    }
    loader.loadProcessEnv();

    mixvoice::PipelineConfig pipeline;
    mixvoice::SynthesisClientConfig client;
    toInternal(SpeechConfig(), pipeline, client);

    auto err = loader.apply(pipeline, client);
    if (!err.isOk()) {
        std::cerr << "[Config] " << err.message;
        if (!err.detail.empty()) {
            std::cerr << " (" << err.detail << ")";
        }
        std::cerr << ", using defaults" << std::endl;
        return SpeechConfig::Default();
    }
    return fromInternal(pipeline, client);
}

// =============================================================================
// SpeechResult 实现
// =============================================================================

struct SpeechResult::Impl {
    std::vector<uint8_t> audio;
    mixvoice::ErrorCode code = mixvoice::ErrorCode::OK;
    std::string message;
    std::string detail;
    int segment_count = 0;
    int processing_time_ms = 0;

    void setError(const mixvoice::ErrorInfo& err) {
        code = err.code;
        message = err.message;
        detail = err.detail;
    }
};

SpeechResult::SpeechResult() : impl_(std::make_unique<Impl>()) {}
SpeechResult::~SpeechResult() = default;

SpeechResult::SpeechResult(SpeechResult&&) noexcept = default;
SpeechResult& SpeechResult::operator=(SpeechResult&&) noexcept = default;

const std::vector<uint8_t>& SpeechResult::GetAudioData() const {
    return impl_->audio;
}

bool SpeechResult::IsSuccess() const {
    return impl_->code == mixvoice::ErrorCode::OK;
}

std::string SpeechResult::GetCode() const {
    return mixvoice::errorCodeToString(impl_->code);
}

int SpeechResult::GetErrorCode() const {
    return static_cast<int>(impl_->code);
}

std::string SpeechResult::GetMessage() const {
    return impl_->message;
}

std::string SpeechResult::GetDetail() const {
    return impl_->detail;
}

bool SpeechResult::IsEmpty() const {
    return impl_->audio.empty();
}

int SpeechResult::GetSegmentCount() const {
    return impl_->segment_count;
}

int SpeechResult::GetProcessingTimeMs() const {
    return impl_->processing_time_ms;
}

bool SpeechResult::SaveToFile(const std::string& file_path) const {
    if (impl_->audio.empty()) {
        return false;
    }

    std::ofstream file(file_path, std::ios::binary);
    if (!file) {
        return false;
    }

    file.write(reinterpret_cast<const char*>(impl_->audio.data()),
               static_cast<std::streamsize>(impl_->audio.size()));
    return file.good();
}

// =============================================================================
// SpeechService 实现
// =============================================================================

struct SpeechService::Impl {
    SpeechConfig config;
    mixvoice::PipelineConfig pipeline_config;
    std::shared_ptr<mixvoice::ISynthesisClient> client;
    std::unique_ptr<mixvoice::PipelineOrchestrator> orchestrator;
    mixvoice::ErrorInfo init_error = mixvoice::ErrorInfo::ok();
    bool initialized = false;

    bool init(const SpeechConfig& cfg, std::shared_ptr<mixvoice::ISynthesisClient> injected) {
        config = cfg;

        // 转换配置
        mixvoice::SynthesisClientConfig client_config;
        toInternal(cfg, pipeline_config, client_config);

        init_error = pipeline_config.validate();
        if (!init_error.isOk()) {
            std::cerr << "[SpeechService] Invalid configuration: " << init_error.message << std::endl;
            return false;
        }

        // 创建客户端
        if (injected) {
            client = std::move(injected);
        } else {
            std::unique_ptr<mixvoice::ISynthesisClient> created;
            init_error = mixvoice::SynthesisClientFactory::create(client_config, created);
            if (!init_error.isOk()) {
                std::cerr << "[SpeechService] Failed to create synthesis client: "
                          << init_error.message << std::endl;
                return false;
            }
            client = std::move(created);
        }

        orchestrator = std::make_unique<mixvoice::PipelineOrchestrator>(pipeline_config, client);
        initialized = true;
        return true;
    }
};

SpeechService::SpeechService(const SpeechConfig& config)
    : impl_(std::make_unique<Impl>()) {
    impl_->init(config, nullptr);
}

SpeechService::SpeechService(const SpeechConfig& config,
                             std::shared_ptr<mixvoice::ISynthesisClient> client)
    : impl_(std::make_unique<Impl>()) {
    if (!client) {
        impl_->config = config;
        mixvoice::SynthesisClientConfig unused;
        toInternal(config, impl_->pipeline_config, unused);
        impl_->init_error = mixvoice::ErrorInfo::error(
            mixvoice::ErrorCode::INVALID_CONFIG, "Synthesis client is null");
        return;
    }
    impl_->init(config, std::move(client));
}

SpeechService::~SpeechService() = default;

std::shared_ptr<SpeechResult> SpeechService::Synthesize(const std::string& text,
                                                        const std::string& voice) {
    auto result = std::make_shared<SpeechResult>();

    if (!impl_->initialized || !impl_->orchestrator) {
        result->impl_->setError(impl_->init_error.isOk()
            ? mixvoice::ErrorInfo::error(mixvoice::ErrorCode::INVALID_CONFIG, "Service not initialized")
            : impl_->init_error);
        return result;
    }

    if (text.empty()) {
        result->impl_->setError(mixvoice::ErrorInfo::error(
            mixvoice::ErrorCode::INVALID_INPUT, "Text is empty"));
        return result;
    }

    std::string voice_name = voice;
    std::transform(voice_name.begin(), voice_name.end(), voice_name.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    mixvoice::VoiceProfile profile;
    auto err = impl_->pipeline_config.findVoiceProfile(voice_name, profile);
    if (!err.isOk()) {
        result->impl_->setError(err);
        return result;
    }

    auto start_time = std::chrono::steady_clock::now();

    mixvoice::PipelineResult pipeline_result;
    err = impl_->orchestrator->run(text, profile, pipeline_result);

    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
    result->impl_->processing_time_ms = static_cast<int>(duration.count());

    if (!err.isOk()) {
        result->impl_->setError(err);
        return result;
    }

    result->impl_->audio = std::move(pipeline_result.audio);
    result->impl_->segment_count = pipeline_result.segment_count;
    return result;
}

bool SpeechService::SynthesizeToFile(const std::string& text, const std::string& file_path,
                                     const std::string& voice) {
    auto result = Synthesize(text, voice);
    if (!result->IsSuccess()) {
        std::cerr << "[SpeechService] " << result->GetCode() << ": " << result->GetMessage() << std::endl;
        return false;
    }
    return result->SaveToFile(file_path);
}

std::vector<SegmentInfo> SpeechService::PreviewSegments(const std::string& text) const {
    std::vector<SegmentInfo> infos;

    // 未初始化时仍可按配置分段
    mixvoice::PipelineOrchestrator planner(impl_->pipeline_config, nullptr);
    const mixvoice::PipelineOrchestrator& orchestrator =
        impl_->orchestrator ? *impl_->orchestrator : planner;

    std::vector<mixvoice::Segment> segments;
    auto err = orchestrator.planSegments(text, segments);
    if (!err.isOk()) {
        std::cerr << "[SpeechService] " << err.message << std::endl;
        return infos;
    }

    infos.reserve(segments.size());
    for (const auto& seg : segments) {
        SegmentInfo info;
        info.text = seg.text;
        info.language = mixvoice::languageTagToString(seg.language);
        info.chunk_index = seg.chunk_index;
        info.line_index = seg.line_index;
        info.segment_index = seg.segment_index;
        infos.push_back(std::move(info));
    }
    return infos;
}

bool SpeechService::IsInitialized() const {
    return impl_->initialized;
}

std::string SpeechService::GetInitError() const {
    return impl_->init_error.message;
}

std::string SpeechService::GetClientName() const {
    if (impl_->client) {
        return impl_->client->getName();
    }
    return "Unknown";
}

std::vector<std::string> SpeechService::GetVoiceNames() const {
    std::vector<std::string> names;
    for (const auto& entry : impl_->config.voices) {
        names.push_back(entry.first);
    }
    return names;
}

SpeechConfig SpeechService::GetConfig() const {
    return impl_->config;
}

}  // namespace MixVoice

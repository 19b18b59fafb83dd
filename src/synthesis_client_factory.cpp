#include "internal/synthesis/synthesis_client.hpp"

#include <memory>

#include "internal/synthesis/azure_speech_client.hpp"
#include "internal/synthesis/edge_tts_client.hpp"

namespace mixvoice {

// =============================================================================
// SynthesisClientFactory 实现
// =============================================================================

ErrorInfo SynthesisClientFactory::create(const SynthesisClientConfig& config,
                                         std::unique_ptr<ISynthesisClient>& client) {
    auto err = config.validate();
    if (!err.isOk()) {
        return err;
    }

    switch (config.type) {
        case ClientType::AZURE_SPEECH:
            client = std::make_unique<AzureSpeechClient>(config);
            return ErrorInfo::ok();

        case ClientType::EDGE_TTS_COMMAND:
            client = std::make_unique<EdgeTtsCommandClient>(config);
            return ErrorInfo::ok();

        default:
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Unsupported synthesis client");
    }
}

}  // namespace mixvoice

#ifndef MIXVOICE_AZURE_SPEECH_CLIENT_HPP
#define MIXVOICE_AZURE_SPEECH_CLIENT_HPP

#include <cstdint>

#include <string>
#include <vector>

#include "internal/synthesis/synthesis_client.hpp"

namespace mixvoice {

// =============================================================================
// AzureSpeechClient - Azure Speech REST 合成
// =============================================================================
//
// POST {endpoint}
//   Ocp-Apim-Subscription-Key: <key>
//   Content-Type: application/ssml+xml
//   X-Microsoft-OutputFormat: <output_format>
//   body: <speak><voice name='...'>text</voice></speak>
//
// 每次调用使用独立的 curl easy handle，可并发调用。
//

class AzureSpeechClient : public ISynthesisClient {
public:
    explicit AzureSpeechClient(const SynthesisClientConfig& config);
    ~AzureSpeechClient() override;

    AzureSpeechClient(const AzureSpeechClient&) = delete;
    AzureSpeechClient& operator=(const AzureSpeechClient&) = delete;

    ErrorInfo synthesize(const std::string& text,
                         const std::string& voice_id,
                         const std::string& scratch_dir,
                         const CancelToken& cancel,
                         std::vector<uint8_t>& audio) override;

    std::string getName() const override { return "AzureSpeech"; }

    /// @brief 构造 SSML 请求体
    /// @param text 片段文本 (会做 XML 转义)
    /// @param voice_id 音色 ID, xml:lang 取其前 5 个字符 (如 "zh-CN")
    static std::string buildSsml(const std::string& text, const std::string& voice_id);

    /// @brief XML 转义 & < > " '
    static std::string escapeXml(const std::string& text);

private:
    SynthesisClientConfig config_;
};

}  // namespace mixvoice

#endif  // MIXVOICE_AZURE_SPEECH_CLIENT_HPP

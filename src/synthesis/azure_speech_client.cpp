#include "internal/synthesis/azure_speech_client.hpp"

#include <curl/curl.h>

#include <iostream>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace mixvoice {

namespace {

// curl_global_init 不是线程安全的，进程内只调用一次
void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

// CURL write callback
size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* buffer = static_cast<std::vector<uint8_t>*>(userp);
    size_t total_size = size * nmemb;
    const auto* bytes = static_cast<const uint8_t*>(contents);
    buffer->insert(buffer->end(), bytes, bytes + total_size);
    return total_size;
}

// CURL progress callback, 返回非零即中止传输
int progressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                     curl_off_t ultotal, curl_off_t ulnow) {
    (void)dltotal;
    (void)dlnow;
    (void)ultotal;
    (void)ulnow;
    const auto* cancel = static_cast<const CancelToken*>(clientp);
    return cancel->isCancelled() ? 1 : 0;
}

}  // namespace

AzureSpeechClient::AzureSpeechClient(const SynthesisClientConfig& config)
    : config_(config) {
    ensureCurlGlobalInit();
}

AzureSpeechClient::~AzureSpeechClient() = default;

std::string AzureSpeechClient::escapeXml(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default:   out += c; break;
        }
    }
    return out;
}

std::string AzureSpeechClient::buildSsml(const std::string& text, const std::string& voice_id) {
    std::string lang = voice_id.size() >= 5 ? voice_id.substr(0, 5) : "en-US";

    std::string ssml;
    ssml.reserve(text.size() + voice_id.size() + 128);
    ssml += "<speak version='1.0' xml:lang='" + lang + "' ";
    ssml += "xmlns='http://www.w3.org/2001/10/synthesis'>";
    ssml += "<voice name='" + escapeXml(voice_id) + "'>";
    ssml += escapeXml(text);
    ssml += "</voice></speak>";
    return ssml;
}

ErrorInfo AzureSpeechClient::synthesize(const std::string& text,
                                        const std::string& voice_id,
                                        const std::string& /*scratch_dir*/,
                                        const CancelToken& cancel,
                                        std::vector<uint8_t>& audio) {
    if (cancel.isCancelled()) {
        return ErrorInfo::error(ErrorCode::CANCELLED, "Synthesis cancelled");
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        return ErrorInfo::error(ErrorCode::INTERNAL_ERROR, "Failed to initialize CURL");
    }

    std::string ssml = buildSsml(text, voice_id);
    std::string url = config_.getEndpoint();

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, ("Ocp-Apim-Subscription-Key: " + config_.api_key).c_str());
    headers = curl_slist_append(headers, "Content-Type: application/ssml+xml");
    headers = curl_slist_append(headers, ("X-Microsoft-OutputFormat: " + config_.output_format).c_str());
    headers = curl_slist_append(headers, "User-Agent: mixvoice");

    std::vector<uint8_t> body;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, ssml.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(ssml.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &cancel);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(config_.connect_timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(config_.request_timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);

    CURLcode res = curl_easy_perform(curl);
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        return ErrorInfo::error(ErrorCode::CANCELLED, "Synthesis cancelled");
    }
    if (res == CURLE_OPERATION_TIMEDOUT) {
        return ErrorInfo::error(ErrorCode::SYNTHESIS_TIMEOUT,
            "Azure request timed out", curl_easy_strerror(res));
    }
    if (res != CURLE_OK) {
        return ErrorInfo::error(ErrorCode::NETWORK_ERROR,
            "Azure request failed", curl_easy_strerror(res));
    }

    if (http_code == 401 || http_code == 403) {
        std::cerr << "[AzureSpeech] Authentication failed (HTTP " << http_code << ")" << std::endl;
        return ErrorInfo::error(ErrorCode::AUTH_FAILED,
            "Azure authentication failed", "HTTP " + std::to_string(http_code));
    }
    if (http_code != 200) {
        std::string detail = "HTTP " + std::to_string(http_code);
        if (!body.empty()) {
            detail += ": " + std::string(body.begin(), body.end());
        }
        return ErrorInfo::error(ErrorCode::SYNTHESIS_BACKEND_ERROR,
            "Azure synthesis failed", detail);
    }

    audio = std::move(body);
    return ErrorInfo::ok();
}

}  // namespace mixvoice

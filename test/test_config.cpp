#include <cstdlib>

#include <chrono>

#include <filesystem>  // NOLINT(build/c++17)
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config_loader.hpp"
#include "internal/mixvoice_config.hpp"
#include "internal/pipeline/pipeline_orchestrator.hpp"
#include "internal/synthesis/azure_speech_client.hpp"
#include "internal/synthesis/edge_tts_client.hpp"
#include "internal/synthesis/synthesis_client.hpp"
#include "mixvoice_api.hpp"
#include "test_utils.hpp"

namespace fs = std::filesystem;

using mixvoice::AzureSpeechClient;
using mixvoice::CancelToken;
using mixvoice::ClientType;
using mixvoice::ConfigLoader;
using mixvoice::EdgeTtsCommandClient;
using mixvoice::ErrorCode;
using mixvoice::FailurePolicy;
using mixvoice::PipelineConfig;
using mixvoice::PipelineOrchestrator;
using mixvoice::PipelineResult;
using mixvoice::SynthesisClientConfig;
using mixvoice::SynthesisClientFactory;

static std::string writeEnvFile(const std::string& dir, const std::string& content) {
    std::string path = (fs::path(dir) / "test.env").string();
    std::ofstream out(path);
    out << content;
    return path;
}

// 写出一个模拟 edge-tts 的 shell 脚本; body 中可用 $text 和 $out
static std::string writeFakeEdgeTts(const std::string& dir, const std::string& name,
                                    const std::string& body) {
    std::string path = (fs::path(dir) / name).string();
    {
        std::ofstream out(path);
        out << "#!/bin/sh\n"
            << "text=\"\"\n"
            << "out=\"\"\n"
            << "while [ $# -gt 0 ]; do\n"
            << "  case \"$1\" in\n"
            << "    --text) text=\"$2\"; shift 2 ;;\n"
            << "    --write-media) out=\"$2\"; shift 2 ;;\n"
            << "    *) shift ;;\n"
            << "  esac\n"
            << "done\n"
            << body;
    }
    fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace);
    return path;
}

static size_t countFilesRecursive(const std::string& path, const std::string& extension) {
    std::error_code ec;
    size_t count = 0;
    if (!fs::exists(path, ec)) return 0;
    for (auto it = fs::recursive_directory_iterator(path, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->path().extension() == extension) count++;
    }
    return count;
}

int main() {
    using mixvoice::test::runTest;

    const std::string dir = mixvoice::test::makeTempDir("mixvoice_config_test");

    // -------------------------------------------------------------------------
    // ConfigLoader
    // -------------------------------------------------------------------------

    runTest("EnvFileParsing", [&dir]() {
        std::string path = writeEnvFile(dir,
            "# comment line\n"
            "\n"
            "AZURE_SPEECH_KEY=\"secret-key\"\n"
            "export AZURE_SPEECH_REGION='westus2'\n"
            "MIXVOICE_MAX_CONCURRENCY = 8\n"
            "not a setting\n"
            "MIXVOICE_FAILURE_POLICY=best-effort\n"
            "MIXVOICE_VOICE_NARRATOR_EN=en-GB-RyanNeural\n"
            "MIXVOICE_VOICE_NARRATOR_ZH=zh-CN-YunjianNeural\n"
            "MIXVOICE_BACKEND=edge-tts\n");

        ConfigLoader loader;
        MV_CHECK(loader.loadEnvFile(path));
        MV_CHECK_EQ(loader.get("AZURE_SPEECH_KEY"), std::string("secret-key"));
        MV_CHECK_EQ(loader.get("AZURE_SPEECH_REGION"), std::string("westus2"));
        MV_CHECK(!loader.has("not a setting"));

        PipelineConfig pipeline;
        SynthesisClientConfig client;
        MV_CHECK_CODE(loader.apply(pipeline, client), ErrorCode::OK);
        MV_CHECK_EQ(pipeline.max_concurrency, 8);
        MV_CHECK(pipeline.failure_policy == FailurePolicy::BEST_EFFORT);
        MV_CHECK(client.type == ClientType::EDGE_TTS_COMMAND);
        MV_CHECK_EQ(client.api_key, std::string("secret-key"));
        MV_CHECK_EQ(client.region, std::string("westus2"));

        mixvoice::VoiceProfile narrator;
        MV_CHECK_CODE(pipeline.findVoiceProfile("narrator", narrator), ErrorCode::OK);
        MV_CHECK_EQ(narrator.en, std::string("en-GB-RyanNeural"));
        MV_CHECK_EQ(narrator.zh, std::string("zh-CN-YunjianNeural"));
        // 默认音色仍然存在
        MV_CHECK_CODE(pipeline.findVoiceProfile("female", narrator), ErrorCode::OK);
    });

    runTest("MissingEnvFile", [&dir]() {
        ConfigLoader loader;
        MV_CHECK(!loader.loadEnvFile((fs::path(dir) / "missing.env").string()));
        PipelineConfig pipeline;
        SynthesisClientConfig client;
        MV_CHECK_CODE(loader.apply(pipeline, client), ErrorCode::OK);
        MV_CHECK_EQ(pipeline.max_concurrency, 4);
        MV_CHECK_EQ(pipeline.synthesis_timeout_seconds, 30);
    });

    runTest("ProcessEnvOverridesFile", [&dir]() {
        std::string path = writeEnvFile(dir, "MIXVOICE_TIMEOUT_SECONDS=10\nMIXVOICE_MAX_CONCURRENCY=2\n");
        setenv("MIXVOICE_TIMEOUT_SECONDS", "45", 1);

        ConfigLoader loader;
        MV_CHECK(loader.loadEnvFile(path));
        loader.loadProcessEnv();
        unsetenv("MIXVOICE_TIMEOUT_SECONDS");

        PipelineConfig pipeline;
        SynthesisClientConfig client;
        MV_CHECK_CODE(loader.apply(pipeline, client), ErrorCode::OK);
        MV_CHECK_EQ(pipeline.synthesis_timeout_seconds, 45);
        MV_CHECK_EQ(pipeline.max_concurrency, 2);
    });

    runTest("InvalidValuesRejected", []() {
        PipelineConfig pipeline;
        SynthesisClientConfig client;

        ConfigLoader bad_int;
        bad_int.set("MIXVOICE_MAX_CONCURRENCY", "four");
        MV_CHECK_CODE(bad_int.apply(pipeline, client), ErrorCode::INVALID_CONFIG);

        ConfigLoader trailing;
        trailing.set("MIXVOICE_TIMEOUT_SECONDS", "30s");
        MV_CHECK_CODE(trailing.apply(pipeline, client), ErrorCode::INVALID_CONFIG);

        ConfigLoader bad_policy;
        bad_policy.set("MIXVOICE_FAILURE_POLICY", "sometimes");
        MV_CHECK_CODE(bad_policy.apply(pipeline, client), ErrorCode::INVALID_CONFIG);

        ConfigLoader bad_backend;
        bad_backend.set("MIXVOICE_BACKEND", "espeak");
        MV_CHECK_CODE(bad_backend.apply(pipeline, client), ErrorCode::INVALID_CONFIG);
    });

    // -------------------------------------------------------------------------
    // 配置校验
    // -------------------------------------------------------------------------

    runTest("PipelineConfigValidate", []() {
        MV_CHECK_CODE(PipelineConfig::Default().validate(), ErrorCode::OK);
        MV_CHECK_CODE(PipelineConfig::Default().withMaxConcurrency(0).validate(),
                      ErrorCode::INVALID_CONFIG);
        MV_CHECK_CODE(PipelineConfig::Default().withTimeout(0).validate(),
                      ErrorCode::INVALID_CONFIG);
        MV_CHECK_CODE(PipelineConfig::Default().withSegmentLengths(5, 3).validate(),
                      ErrorCode::INVALID_CONFIG);
        MV_CHECK_CODE(PipelineConfig::Default().withNumericContextWindow(-1).validate(),
                      ErrorCode::INVALID_CONFIG);
        MV_CHECK_CODE(PipelineConfig::Default().withVoice("half", {"en-US-JennyNeural", ""}).validate(),
                      ErrorCode::INVALID_CONFIG);
    });

    runTest("VoiceLookup", []() {
        auto config = PipelineConfig::Default();
        mixvoice::VoiceProfile profile;
        MV_CHECK_CODE(config.findVoiceProfile("male", profile), ErrorCode::OK);
        MV_CHECK_EQ(profile.voiceFor(mixvoice::LanguageTag::EN), std::string("en-US-ChristopherNeural"));
        MV_CHECK_EQ(profile.voiceFor(mixvoice::LanguageTag::ZH), std::string("zh-CN-YunxiNeural"));
        MV_CHECK_CODE(config.findVoiceProfile("robot", profile), ErrorCode::UNKNOWN_VOICE);
    });

    runTest("ClientConfigValidate", []() {
        SynthesisClientConfig azure;
        MV_CHECK_CODE(azure.validate(), ErrorCode::INVALID_CONFIG);
        azure.api_key = "key";
        MV_CHECK_CODE(azure.validate(), ErrorCode::OK);
        MV_CHECK_EQ(azure.getEndpoint(),
                    std::string("https://eastus.tts.speech.microsoft.com/cognitiveservices/v1"));
        azure.endpoint = "http://localhost:9/tts";
        MV_CHECK_EQ(azure.getEndpoint(), std::string("http://localhost:9/tts"));
        azure.request_timeout_seconds = 0;
        MV_CHECK_CODE(azure.validate(), ErrorCode::INVALID_CONFIG);

        SynthesisClientConfig edge;
        edge.type = ClientType::EDGE_TTS_COMMAND;
        MV_CHECK_CODE(edge.validate(), ErrorCode::OK);
        edge.command.clear();
        MV_CHECK_CODE(edge.validate(), ErrorCode::INVALID_CONFIG);
    });

    // -------------------------------------------------------------------------
    // 客户端工厂
    // -------------------------------------------------------------------------

    runTest("FactoryCreatesClients", []() {
        std::unique_ptr<mixvoice::ISynthesisClient> client;

        SynthesisClientConfig azure;
        MV_CHECK_CODE(SynthesisClientFactory::create(azure, client), ErrorCode::INVALID_CONFIG);
        MV_CHECK(client == nullptr);

        azure.api_key = "key";
        MV_CHECK_CODE(SynthesisClientFactory::create(azure, client), ErrorCode::OK);
        MV_CHECK(client != nullptr);
        if (client) MV_CHECK_EQ(client->getName(), std::string("AzureSpeech"));

        SynthesisClientConfig edge;
        edge.type = ClientType::EDGE_TTS_COMMAND;
        MV_CHECK_CODE(SynthesisClientFactory::create(edge, client), ErrorCode::OK);
        if (client) MV_CHECK_EQ(client->getName(), std::string("EdgeTts"));

        MV_CHECK_EQ(std::string(SynthesisClientFactory::getClientName(ClientType::AZURE_SPEECH)),
                    std::string("azure"));
        MV_CHECK_EQ(std::string(SynthesisClientFactory::getClientName(ClientType::EDGE_TTS_COMMAND)),
                    std::string("edge-tts"));
    });

    // -------------------------------------------------------------------------
    // Azure 请求体
    // -------------------------------------------------------------------------

    runTest("SsmlEscaping", []() {
        MV_CHECK_EQ(AzureSpeechClient::escapeXml("a<b & \"c\" 'd'>"),
                    std::string("a&lt;b &amp; &quot;c&quot; &apos;d&apos;&gt;"));
        MV_CHECK_EQ(AzureSpeechClient::escapeXml("你好"), std::string("你好"));
    });

    runTest("SsmlLanguageFromVoice", []() {
        std::string ssml = AzureSpeechClient::buildSsml("R&D 你好", "zh-CN-XiaoxiaoNeural");
        MV_CHECK_EQ(ssml, std::string(
            "<speak version='1.0' xml:lang='zh-CN' xmlns='http://www.w3.org/2001/10/synthesis'>"
            "<voice name='zh-CN-XiaoxiaoNeural'>R&amp;D 你好</voice></speak>"));

        // 音色名过短时退回 en-US
        std::string fallback = AzureSpeechClient::buildSsml("hi", "x");
        MV_CHECK(fallback.find("xml:lang='en-US'") != std::string::npos);
    });

    runTest("CancelledBeforeRequest", []() {
        SynthesisClientConfig config;
        config.api_key = "key";
        config.endpoint = "http://127.0.0.1:9/unused";
        AzureSpeechClient azure(config);
        CancelToken token;
        token.cancel();
        std::vector<uint8_t> audio;
        MV_CHECK_CODE(azure.synthesize("hello", "en-US-JennyNeural", "", token, audio),
                      ErrorCode::CANCELLED);
        MV_CHECK(audio.empty());
    });

    // -------------------------------------------------------------------------
    // edge-tts 命令行
    // -------------------------------------------------------------------------

    runTest("EdgeArgumentsAreNotShellParsed", []() {
        auto args = EdgeTtsCommandClient::buildArgs("edge-tts", "en-US-JennyNeural",
                                                    "it's $(rm -rf /)", "/tmp/out.mp3");
        MV_CHECK_EQ(args.size(), static_cast<size_t>(7));
        if (args.size() == 7) {
            MV_CHECK_EQ(args[0], std::string("edge-tts"));
            MV_CHECK_EQ(args[2], std::string("en-US-JennyNeural"));
            MV_CHECK_EQ(args[4], std::string("it's $(rm -rf /)"));
            MV_CHECK_EQ(args[5], std::string("--write-media"));
            MV_CHECK_EQ(args[6], std::string("/tmp/out.mp3"));
        }
    });

    runTest("EdgeCommandFailures", [&dir]() {
        CancelToken token;
        std::vector<uint8_t> audio;

        SynthesisClientConfig failing;
        failing.type = ClientType::EDGE_TTS_COMMAND;
        failing.command = "false";
        EdgeTtsCommandClient fails(failing);
        MV_CHECK_CODE(fails.synthesize("hello", "en-US-JennyNeural", dir, token, audio),
                      ErrorCode::SYNTHESIS_BACKEND_ERROR);

        SynthesisClientConfig missing;
        missing.type = ClientType::EDGE_TTS_COMMAND;
        missing.command = "mixvoice-no-such-command";
        EdgeTtsCommandClient absent(missing);
        MV_CHECK_CODE(absent.synthesize("hello", "en-US-JennyNeural", dir, token, audio),
                      ErrorCode::SYNTHESIS_BACKEND_ERROR);

        // 退出码为 0 但没有写出文件
        SynthesisClientConfig silent;
        silent.type = ClientType::EDGE_TTS_COMMAND;
        silent.command = "true";
        EdgeTtsCommandClient quiet(silent);
        MV_CHECK_CODE(quiet.synthesize("hello", "en-US-JennyNeural", dir, token, audio),
                      ErrorCode::EMPTY_SYNTHESIS);
        MV_CHECK(audio.empty());

        MV_CHECK_CODE(quiet.synthesize("hello", "en-US-JennyNeural", "", token, audio),
                      ErrorCode::WORKSPACE_ERROR);

        token.cancel();
        MV_CHECK_CODE(quiet.synthesize("hello", "en-US-JennyNeural", dir, token, audio),
                      ErrorCode::CANCELLED);
    });

    runTest("EdgeWritesIntoScratchDir", [&dir]() {
        std::string scratch = (fs::path(dir) / "edge_scratch").string();
        fs::create_directories(scratch);

        SynthesisClientConfig config;
        config.type = ClientType::EDGE_TTS_COMMAND;
        config.command = writeFakeEdgeTts(dir, "edge_ok.sh",
            "case \"$out\" in \"" + scratch + "\"/*) ;; *) exit 3 ;; esac\n"
            "printf '%s' \"$text\" > \"$out\"\n");
        EdgeTtsCommandClient client(config);

        CancelToken token;
        std::vector<uint8_t> audio;
        MV_CHECK_CODE(client.synthesize("it's $(echo hi)", "en-US-JennyNeural", scratch,
                                        token, audio),
                      ErrorCode::OK);
        MV_CHECK_EQ(mixvoice::test::bytesToString(audio), std::string("it's $(echo hi)"));
        MV_CHECK_EQ(mixvoice::test::countEntries(scratch), static_cast<size_t>(0));
    });

    runTest("EdgeCancelKillsChild", [&dir]() {
        std::string scratch = (fs::path(dir) / "edge_cancel").string();
        std::string markers = (fs::path(dir) / "edge_cancel_markers").string();
        fs::create_directories(scratch);
        fs::create_directories(markers);

        SynthesisClientConfig config;
        config.type = ClientType::EDGE_TTS_COMMAND;
        config.command = writeFakeEdgeTts(dir, "edge_slow.sh",
            "printf partial > \"$out\"\n"
            "sleep 2\n"
            "touch \"" + markers + "/finished_$$\"\n");
        EdgeTtsCommandClient client(config);

        auto token = std::make_shared<CancelToken>();
        std::thread canceller([token]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
            token->cancel();
        });
        std::vector<uint8_t> audio;
        auto start = std::chrono::steady_clock::now();
        auto err = client.synthesize("hello", "en-US-JennyNeural", scratch, *token, audio);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        canceller.join();

        MV_CHECK_CODE(err, ErrorCode::CANCELLED);
        MV_CHECK(elapsed < 1500);
        MV_CHECK(audio.empty());
        MV_CHECK_EQ(mixvoice::test::countEntries(scratch), static_cast<size_t>(0));

        std::this_thread::sleep_for(std::chrono::milliseconds(2500));
        MV_CHECK_EQ(mixvoice::test::countEntries(markers), static_cast<size_t>(0));
    });

    runTest("EdgeTimeoutsLeaveNothingBehind", [&dir]() {
        const char* original_tmp = std::getenv("TMPDIR");
        const std::string saved_tmp = original_tmp ? original_tmp : "";
        std::string tmp_root = (fs::path(dir) / "edge_tmp").string();
        std::string markers = (fs::path(dir) / "edge_timeout_markers").string();
        fs::create_directories(tmp_root);
        fs::create_directories(markers);
        mixvoice::test::setTmpDir(tmp_root);

        SynthesisClientConfig client_config;
        client_config.type = ClientType::EDGE_TTS_COMMAND;
        client_config.command = writeFakeEdgeTts(dir, "edge_late.sh",
            "sleep 2\n"
            "printf late > \"$out\"\n"
            "touch \"" + markers + "/finished_$$\"\n");
        auto client = std::make_shared<EdgeTtsCommandClient>(client_config);

        auto config = PipelineConfig::Default()
            .withTimeout(1)
            .withFailurePolicy(FailurePolicy::BEST_EFFORT)
            .withTempBaseDir((fs::path(tmp_root) / "fallback").string());
        PipelineOrchestrator pipeline(config, client);
        PipelineResult result;
        auto err = pipeline.run("Alpha one.\nBravo two.\nCharlie three.",
                                {"en-US-JennyNeural", "zh-CN-XiaoxiaoNeural"}, 1, result);
        MV_CHECK_CODE(err, ErrorCode::NO_ARTIFACTS);

        std::this_thread::sleep_for(std::chrono::milliseconds(2500));
        MV_CHECK_EQ(mixvoice::test::countEntries(markers), static_cast<size_t>(0));
        MV_CHECK_EQ(mixvoice::test::countEntries(tmp_root), static_cast<size_t>(0));
        MV_CHECK_EQ(countFilesRecursive(tmp_root, ".mp3"), static_cast<size_t>(0));

        if (saved_tmp.empty()) {
            unsetenv("TMPDIR");
        } else {
            mixvoice::test::setTmpDir(saved_tmp);
        }
    });

    // -------------------------------------------------------------------------
    // 公共 API 配置
    // -------------------------------------------------------------------------

    runTest("SpeechConfigFromEnvFile", [&dir]() {
        std::string path = writeEnvFile(dir,
            "MIXVOICE_BACKEND=edge\n"
            "MIXVOICE_MAX_SEGMENT_LENGTH=200\n"
            "MIXVOICE_VERBOSE=true\n");
        auto config = MixVoice::SpeechConfig::FromEnv(path);
        MV_CHECK(config.backend == MixVoice::BackendType::EDGE_TTS);
        MV_CHECK_EQ(config.max_segment_length, 200);
        MV_CHECK(config.verbose);
    });

    runTest("SpeechConfigFromBadEnvFallsBack", [&dir]() {
        std::string path = writeEnvFile(dir, "MIXVOICE_MAX_CONCURRENCY=lots\n");
        auto config = MixVoice::SpeechConfig::FromEnv(path);
        MV_CHECK_EQ(config.max_concurrency, 4);
        MV_CHECK(config.backend == MixVoice::BackendType::AZURE_SPEECH);
    });

    runTest("SpeechConfigChain", []() {
        auto config = MixVoice::SpeechConfig::Default()
            .withBackend(MixVoice::BackendType::EDGE_TTS)
            .withMaxConcurrency(8)
            .withTimeout(5)
            .withFailurePolicy(MixVoice::FailurePolicy::BEST_EFFORT)
            .withVoice("kid", {"en-US-AnaNeural", "zh-CN-XiaoyiNeural"});
        MV_CHECK_EQ(config.max_concurrency, 8);
        MV_CHECK_EQ(config.timeout_seconds, 5);
        MV_CHECK(config.failure_policy == MixVoice::FailurePolicy::BEST_EFFORT);
        MV_CHECK_EQ(config.voices.size(), static_cast<size_t>(3));
        MV_CHECK_EQ(config.voices["kid"].zh, std::string("zh-CN-XiaoyiNeural"));
    });

    mixvoice::test::removeDir(dir);
    return mixvoice::test::finish();
}

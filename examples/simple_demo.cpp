#include <cstdlib>
#include <cstring>

#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include "mixvoice_api.hpp"

void printUsage(const char* program) {
    std::cout << "用法: " << program << " [选项]\n"
        << "\n"
        << "选项:\n"
        << "  -p <text>       直接合成指定文本 (不指定时从标准输入读取)\n"
        << "  -g <voice>      音色 male / female (默认: male)\n"
        << "  -o <file>       输出文件 (默认: output.mp3)\n"
        << "  -c <n>          最大并发数 (默认: 4)\n"
        << "  -t <seconds>    单片段超时 (默认: 30)\n"
        << "  -b <backend>    合成后端 azure / edge-tts\n"
        << "  --env <file>    .env 配置文件 (默认: .env)\n"
        << "  --best-effort   跳过失败片段, 不中止整个任务\n"
        << "  --dry-run       只打印分段结果, 不合成\n"
        << "  -v              输出逐片段日志\n"
        << "  -h              显示帮助\n"
        << "\n"
        << "环境变量:\n"
        << "  AZURE_SPEECH_KEY, AZURE_SPEECH_REGION, MIXVOICE_BACKEND, MIXVOICE_MAX_CONCURRENCY ...\n"
        << "\n"
        << "示例:\n"
        << "  " << program << " -p \"今天学习Python 3.12，效率提升了50%。\" -g female\n"
        << "  " << program << " -p \"我有42个苹果and5个桔子\" --dry-run\n"
        << "  cat article.txt | " << program << " -o article.mp3 -c 8 --best-effort\n"
        << std::endl;
}

bool parseInt(const char* arg, int& out) {
    char* end = nullptr;
    long value = std::strtol(arg, &end, 10);
    if (end == arg || *end != '\0' || value <= 0) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

void printSegments(const std::vector<MixVoice::SegmentInfo>& segments) {
    std::cout << "共 " << segments.size() << " 个片段:" << std::endl;
    for (const auto& seg : segments) {
        std::cout << "  [" << seg.chunk_index << "," << seg.line_index << ","
                  << seg.segment_index << "] " << seg.language << ": " << seg.text << std::endl;
    }
}

int main(int argc, char* argv[]) {
    std::string text;
    std::string voice = "male";
    std::string output_file = "output.mp3";
    std::string env_file = ".env";
    std::string backend;
    int concurrency = 0;
    int timeout = 0;
    bool best_effort = false;
    bool dry_run = false;
    bool verbose = false;
    bool has_text = false;

    // 解析参数
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-p") == 0 && i + 1 < argc) {
            text = argv[++i];
            has_text = true;
        } else if (strcmp(argv[i], "-g") == 0 && i + 1 < argc) {
            voice = argv[++i];
        } else if (strcmp(argv[i], "-o") == 0 && i + 1 < argc) {
            output_file = argv[++i];
        } else if (strcmp(argv[i], "-c") == 0 && i + 1 < argc) {
            if (!parseInt(argv[++i], concurrency)) {
                std::cerr << "错误: 无效的并发数 '" << argv[i] << "'" << std::endl;
                return 1;
            }
        } else if (strcmp(argv[i], "-t") == 0 && i + 1 < argc) {
            if (!parseInt(argv[++i], timeout)) {
                std::cerr << "错误: 无效的超时 '" << argv[i] << "'" << std::endl;
                return 1;
            }
        } else if (strcmp(argv[i], "-b") == 0 && i + 1 < argc) {
            backend = argv[++i];
        } else if (strcmp(argv[i], "--env") == 0 && i + 1 < argc) {
            env_file = argv[++i];
        } else if (strcmp(argv[i], "--best-effort") == 0) {
            best_effort = true;
        } else if (strcmp(argv[i], "--dry-run") == 0) {
            dry_run = true;
        } else if (strcmp(argv[i], "-v") == 0) {
            verbose = true;
        } else {
            std::cerr << "错误: 未知参数 '" << argv[i] << "'" << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    if (!has_text) {
        text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }

    // 创建配置: .env < 环境变量 < 命令行
    auto config = MixVoice::SpeechConfig::FromEnv(env_file);
    if (backend == "azure") {
        config.backend = MixVoice::BackendType::AZURE_SPEECH;
    } else if (backend == "edge-tts" || backend == "edge") {
        config.backend = MixVoice::BackendType::EDGE_TTS;
    } else if (!backend.empty()) {
        std::cerr << "错误: 未知后端 '" << backend << "'\n"
            << "可用后端: azure, edge-tts" << std::endl;
        return 1;
    }
    if (concurrency > 0) config.max_concurrency = concurrency;
    if (timeout > 0) config.timeout_seconds = timeout;
    if (best_effort) config.failure_policy = MixVoice::FailurePolicy::BEST_EFFORT;
    if (verbose) config.verbose = true;

    MixVoice::SpeechService service(config);

    if (dry_run) {
        printSegments(service.PreviewSegments(text));
        return 0;
    }

    if (!service.IsInitialized()) {
        std::cerr << "服务初始化失败: " << service.GetInitError() << std::endl;
        return 1;
    }

    std::cout << "后端: " << service.GetClientName() << std::endl;
    std::cout << "音色: " << voice << std::endl;
    std::cout << "并发: " << config.max_concurrency << std::endl;

    auto result = service.Synthesize(text, voice);
    if (!result->IsSuccess()) {
        std::cerr << "合成失败 [" << result->GetCode() << "]: " << result->GetMessage();
        if (!result->GetDetail().empty()) {
            std::cerr << " (" << result->GetDetail() << ")";
        }
        std::cerr << std::endl;
        return 1;
    }

    std::cout << "片段数: " << result->GetSegmentCount() << std::endl;
    std::cout << "大小: " << result->GetAudioData().size() << " bytes" << std::endl;
    std::cout << "处理时间: " << result->GetProcessingTimeMs() << " ms" << std::endl;

    // 保存文件
    if (result->SaveToFile(output_file)) {
        std::cout << "已保存: " << output_file << std::endl;
        return 0;
    }
    std::cerr << "保存失败: " << output_file << std::endl;
    return 1;
}

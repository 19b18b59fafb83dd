#include "internal/config_loader.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

extern char** environ;

namespace mixvoice {

namespace {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\n\r");
    return str.substr(first, (last - first + 1));
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool isRecognizedKey(const std::string& key) {
    return key.rfind("MIXVOICE_", 0) == 0 || key.rfind("AZURE_SPEECH_", 0) == 0;
}

const std::string kVoicePrefix = "MIXVOICE_VOICE_";

}  // namespace

bool ConfigLoader::loadEnvFile(const std::string& env_file) {
    std::ifstream file(env_file);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        // 跳过注释和空行
        if (line.empty() || line[0] == '#') continue;

        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // 去除引号
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        if (!key.empty()) {
            values_[key] = value;
        }
    }

    std::cout << "[Config] Loaded settings from " << env_file << std::endl;
    return true;
}

void ConfigLoader::loadProcessEnv() {
    for (char** env = environ; env && *env; ++env) {
        std::string entry(*env);
        size_t eq_pos = entry.find('=');
        if (eq_pos == std::string::npos) continue;
        std::string key = entry.substr(0, eq_pos);
        if (isRecognizedKey(key)) {
            values_[key] = entry.substr(eq_pos + 1);
        }
    }
}

void ConfigLoader::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

bool ConfigLoader::has(const std::string& key) const {
    return values_.count(key) > 0;
}

std::string ConfigLoader::get(const std::string& key, const std::string& fallback) const {
    auto it = values_.find(key);
    return it != values_.end() ? it->second : fallback;
}

ErrorInfo ConfigLoader::readInt(const std::string& key, int& out) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return ErrorInfo::ok();
    }
    try {
        size_t consumed = 0;
        int value = std::stoi(it->second, &consumed);
        if (consumed != it->second.size()) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "Invalid integer for " + key, it->second);
        }
        out = value;
    } catch (const std::exception& e) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
            "Invalid integer for " + key, e.what());
    }
    return ErrorInfo::ok();
}

ErrorInfo ConfigLoader::apply(PipelineConfig& pipeline, SynthesisClientConfig& client) const {
    ErrorInfo err = readInt("MIXVOICE_MAX_SEGMENT_LENGTH", pipeline.max_segment_length);
    if (!err.isOk()) return err;
    err = readInt("MIXVOICE_MIN_SEGMENT_LENGTH", pipeline.min_segment_length);
    if (!err.isOk()) return err;
    err = readInt("MIXVOICE_MAX_CHUNK_LENGTH", pipeline.max_chunk_length);
    if (!err.isOk()) return err;
    err = readInt("MIXVOICE_NUMERIC_CONTEXT_WINDOW", pipeline.numeric_context_window);
    if (!err.isOk()) return err;
    err = readInt("MIXVOICE_MAX_CONCURRENCY", pipeline.max_concurrency);
    if (!err.isOk()) return err;
    err = readInt("MIXVOICE_TIMEOUT_SECONDS", pipeline.synthesis_timeout_seconds);
    if (!err.isOk()) return err;
    err = readInt("AZURE_SPEECH_CONNECT_TIMEOUT", client.connect_timeout_seconds);
    if (!err.isOk()) return err;
    err = readInt("AZURE_SPEECH_REQUEST_TIMEOUT", client.request_timeout_seconds);
    if (!err.isOk()) return err;

    if (has("MIXVOICE_MAX_INPUT_BYTES")) {
        try {
            pipeline.max_input_bytes = std::stoull(get("MIXVOICE_MAX_INPUT_BYTES"));
        } catch (const std::exception& e) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "Invalid integer for MIXVOICE_MAX_INPUT_BYTES", e.what());
        }
    }

    if (has("MIXVOICE_FAILURE_POLICY")) {
        std::string policy = toLower(get("MIXVOICE_FAILURE_POLICY"));
        if (policy == "fail-fast" || policy == "fail_fast") {
            pipeline.failure_policy = FailurePolicy::FAIL_FAST;
        } else if (policy == "best-effort" || policy == "best_effort") {
            pipeline.failure_policy = FailurePolicy::BEST_EFFORT;
        } else {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "Unknown failure policy: " + policy);
        }
    }

    if (has("MIXVOICE_TEMP_DIR")) {
        pipeline.temp_base_dir = get("MIXVOICE_TEMP_DIR");
    }

    if (has("MIXVOICE_VERBOSE")) {
        std::string v = toLower(get("MIXVOICE_VERBOSE"));
        pipeline.verbose = (v == "1" || v == "true" || v == "yes" || v == "on");
    }

    // 音色表: MIXVOICE_VOICE_<NAME>_EN / MIXVOICE_VOICE_<NAME>_ZH
    for (const auto& entry : values_) {
        const std::string& key = entry.first;
        if (key.rfind(kVoicePrefix, 0) != 0 || key.size() <= kVoicePrefix.size() + 3) {
            continue;
        }
        std::string rest = key.substr(kVoicePrefix.size());
        std::string suffix = rest.substr(rest.size() - 3);
        std::string name = toLower(rest.substr(0, rest.size() - 3));
        if (name.empty()) continue;
        if (suffix == "_EN") {
            pipeline.voice_table[name].en = entry.second;
        } else if (suffix == "_ZH") {
            pipeline.voice_table[name].zh = entry.second;
        }
    }

    if (has("MIXVOICE_BACKEND")) {
        std::string backend = toLower(get("MIXVOICE_BACKEND"));
        if (backend == "azure") {
            client.type = ClientType::AZURE_SPEECH;
        } else if (backend == "edge-tts" || backend == "edge") {
            client.type = ClientType::EDGE_TTS_COMMAND;
        } else {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Unknown backend: " + backend);
        }
    }

    if (has("AZURE_SPEECH_KEY")) client.api_key = get("AZURE_SPEECH_KEY");
    if (has("AZURE_SPEECH_REGION")) client.region = get("AZURE_SPEECH_REGION");
    if (has("AZURE_SPEECH_ENDPOINT")) client.endpoint = get("AZURE_SPEECH_ENDPOINT");
    if (has("AZURE_SPEECH_OUTPUT_FORMAT")) client.output_format = get("AZURE_SPEECH_OUTPUT_FORMAT");
    if (has("MIXVOICE_EDGE_TTS_COMMAND")) client.command = get("MIXVOICE_EDGE_TTS_COMMAND");

    return ErrorInfo::ok();
}

}  // namespace mixvoice

#ifndef MIXVOICE_CONFIG_LOADER_HPP
#define MIXVOICE_CONFIG_LOADER_HPP

#include <map>
#include <string>

#include "internal/mixvoice_config.hpp"
#include "internal/mixvoice_types.hpp"

namespace mixvoice {

// =============================================================================
// ConfigLoader - 配置加载
// =============================================================================
//
// 从 .env 风格文件 (KEY=VALUE) 和进程环境变量读取配置，
// 环境变量覆盖文件中的同名项。
//
// 识别的键:
//   MIXVOICE_MAX_SEGMENT_LENGTH      MIXVOICE_MIN_SEGMENT_LENGTH
//   MIXVOICE_MAX_CHUNK_LENGTH        MIXVOICE_NUMERIC_CONTEXT_WINDOW
//   MIXVOICE_MAX_CONCURRENCY         MIXVOICE_TIMEOUT_SECONDS
//   MIXVOICE_FAILURE_POLICY          (fail-fast | best-effort)
//   MIXVOICE_MAX_INPUT_BYTES         MIXVOICE_TEMP_DIR
//   MIXVOICE_VERBOSE                 MIXVOICE_VOICE_<NAME>_EN / _ZH
//   MIXVOICE_BACKEND                 (azure | edge-tts)
//   MIXVOICE_EDGE_TTS_COMMAND
//   AZURE_SPEECH_KEY  AZURE_SPEECH_REGION  AZURE_SPEECH_ENDPOINT
//   AZURE_SPEECH_OUTPUT_FORMAT  AZURE_SPEECH_CONNECT_TIMEOUT  AZURE_SPEECH_REQUEST_TIMEOUT
//

class ConfigLoader {
public:
    ConfigLoader() = default;
    ~ConfigLoader() = default;

    /// @brief 读取 .env 文件
    /// @param env_file 文件路径
    /// @return 文件无法打开时返回 false
    bool loadEnvFile(const std::string& env_file);

    /// @brief 读取进程环境变量中 MIXVOICE_ / AZURE_SPEECH_ 前缀的项
    void loadProcessEnv();

    /// @brief 直接设置一项 (测试和命令行覆盖使用)
    void set(const std::string& key, const std::string& value);

    /// @brief 是否存在某项
    bool has(const std::string& key) const;

    /// @brief 读取某项，不存在时返回默认值
    std::string get(const std::string& key, const std::string& fallback = "") const;

    /// @brief 将已读取的配置应用到配置结构体
    /// @param pipeline [in,out] 流水线配置
    /// @param client [in,out] 合成客户端配置
    /// @return 错误信息 (数值格式错误等)
    ErrorInfo apply(PipelineConfig& pipeline, SynthesisClientConfig& client) const;

private:
    ErrorInfo readInt(const std::string& key, int& out) const;

    std::map<std::string, std::string> values_;
};

}  // namespace mixvoice

#endif  // MIXVOICE_CONFIG_LOADER_HPP

#ifndef MIXVOICE_EDGE_TTS_CLIENT_HPP
#define MIXVOICE_EDGE_TTS_CLIENT_HPP

#include <cstdint>

#include <string>
#include <vector>

#include "internal/synthesis/synthesis_client.hpp"

namespace mixvoice {

// =============================================================================
// EdgeTtsCommandClient - edge-tts 命令行合成
// =============================================================================
//
// 执行: <command> --voice <voice> --text <text> --write-media <scratch_dir>/edge_<rand>.mp3
// 直接 fork/execvp，不经过 shell; 子进程独占一个进程组。
// 等待期间每 20ms 检查取消标记，取消时先 SIGTERM 再 SIGKILL 整个进程组并回收。
// 输出文件读回后删除; 残留文件随工作目录一起删除。
//

class EdgeTtsCommandClient : public ISynthesisClient {
public:
    explicit EdgeTtsCommandClient(const SynthesisClientConfig& config);

    ErrorInfo synthesize(const std::string& text,
                         const std::string& voice_id,
                         const std::string& scratch_dir,
                         const CancelToken& cancel,
                         std::vector<uint8_t>& audio) override;

    std::string getName() const override { return "EdgeTts"; }

    /// @brief 构造命令行参数 (argv[0] 为 command)
    static std::vector<std::string> buildArgs(const std::string& command,
                                              const std::string& voice_id,
                                              const std::string& text,
                                              const std::string& output_path);

private:
    SynthesisClientConfig config_;
};

}  // namespace mixvoice

#endif  // MIXVOICE_EDGE_TTS_CLIENT_HPP

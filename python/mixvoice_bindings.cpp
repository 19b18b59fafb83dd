#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <memory>
#include <string>
#include <vector>

#include "mixvoice_api.hpp"

namespace py = pybind11;

// =============================================================================
// pybind11 模块定义
// =============================================================================

PYBIND11_MODULE(_mixvoice, m) {
    m.doc() = "MixVoice - mixed Chinese/English speech synthesis Python bindings";

    // =========================================================================
    // 枚举类型
    // =========================================================================

    py::enum_<MixVoice::BackendType>(m, "BackendType", "Synthesis backend types")
        .value("AZURE_SPEECH", MixVoice::BackendType::AZURE_SPEECH, "Azure Speech REST")
        .value("EDGE_TTS", MixVoice::BackendType::EDGE_TTS, "edge-tts command line")
        .export_values();

    py::enum_<MixVoice::FailurePolicy>(m, "FailurePolicy", "Per-segment failure policy")
        .value("FAIL_FAST", MixVoice::FailurePolicy::FAIL_FAST,
            "Abort on the first failed segment")
        .value("BEST_EFFORT", MixVoice::FailurePolicy::BEST_EFFORT,
            "Skip failed segments")
        .export_values();

    // =========================================================================
    // VoicePair / SpeechConfig - 配置结构
    // =========================================================================

    py::class_<MixVoice::VoicePair>(m, "VoicePair", "English and Chinese voice ids")
        .def(py::init<>())
        .def(py::init([](const std::string& en, const std::string& zh) {
            return MixVoice::VoicePair{en, zh};
        }), py::arg("en"), py::arg("zh"))
        .def_readwrite("en", &MixVoice::VoicePair::en)
        .def_readwrite("zh", &MixVoice::VoicePair::zh);

    py::class_<MixVoice::SpeechConfig>(m, "SpeechConfig", "Speech service configuration")
        .def(py::init<>(), "Create default configuration")

        // 字段（readwrite）
        .def_readwrite("backend", &MixVoice::SpeechConfig::backend)
        .def_readwrite("azure_key", &MixVoice::SpeechConfig::azure_key)
        .def_readwrite("azure_region", &MixVoice::SpeechConfig::azure_region)
        .def_readwrite("azure_endpoint", &MixVoice::SpeechConfig::azure_endpoint)
        .def_readwrite("output_format", &MixVoice::SpeechConfig::output_format)
        .def_readwrite("edge_tts_command", &MixVoice::SpeechConfig::edge_tts_command)
        .def_readwrite("max_segment_length", &MixVoice::SpeechConfig::max_segment_length)
        .def_readwrite("min_segment_length", &MixVoice::SpeechConfig::min_segment_length)
        .def_readwrite("max_chunk_length", &MixVoice::SpeechConfig::max_chunk_length)
        .def_readwrite("numeric_context_window", &MixVoice::SpeechConfig::numeric_context_window)
        .def_readwrite("max_concurrency", &MixVoice::SpeechConfig::max_concurrency)
        .def_readwrite("timeout_seconds", &MixVoice::SpeechConfig::timeout_seconds)
        .def_readwrite("failure_policy", &MixVoice::SpeechConfig::failure_policy)
        .def_readwrite("temp_dir", &MixVoice::SpeechConfig::temp_dir)
        .def_readwrite("verbose", &MixVoice::SpeechConfig::verbose)
        .def_readwrite("voices", &MixVoice::SpeechConfig::voices)

        // 静态工厂方法
        .def_static("Default", &MixVoice::SpeechConfig::Default,
                    "Create default configuration")
        .def_static("FromEnv", &MixVoice::SpeechConfig::FromEnv,
                    py::arg("env_file") = ".env",
                    "Create configuration from .env file and environment")

        // Builder 方法（链式调用）
        .def("withBackend", &MixVoice::SpeechConfig::withBackend, py::arg("type"))
        .def("withAzure", &MixVoice::SpeechConfig::withAzure,
            py::arg("key"), py::arg("region"))
        .def("withMaxConcurrency", &MixVoice::SpeechConfig::withMaxConcurrency, py::arg("n"))
        .def("withTimeout", &MixVoice::SpeechConfig::withTimeout, py::arg("seconds"))
        .def("withFailurePolicy", &MixVoice::SpeechConfig::withFailurePolicy, py::arg("policy"))
        .def("withVoice", &MixVoice::SpeechConfig::withVoice,
            py::arg("name"), py::arg("pair"))
        .def("withVerbose", &MixVoice::SpeechConfig::withVerbose, py::arg("on"))

        .def("__repr__", [](const MixVoice::SpeechConfig& config) {
            return std::string("<SpeechConfig backend=") +
                (config.backend == MixVoice::BackendType::EDGE_TTS ? "edge-tts" : "azure") +
                " max_concurrency=" + std::to_string(config.max_concurrency) +
                " timeout=" + std::to_string(config.timeout_seconds) + "s>";
        });

    // =========================================================================
    // SegmentInfo - 分段预览
    // =========================================================================

    py::class_<MixVoice::SegmentInfo>(m, "SegmentInfo", "One planned synthesis segment")
        .def_readonly("text", &MixVoice::SegmentInfo::text)
        .def_readonly("language", &MixVoice::SegmentInfo::language)
        .def_readonly("chunk_index", &MixVoice::SegmentInfo::chunk_index)
        .def_readonly("line_index", &MixVoice::SegmentInfo::line_index)
        .def_readonly("segment_index", &MixVoice::SegmentInfo::segment_index)
        .def("__repr__", [](const MixVoice::SegmentInfo& s) {
            return "<SegmentInfo " + s.language + " '" + s.text + "'>";
        });

    // =========================================================================
    // SpeechResult - 合成结果
    // =========================================================================

    py::class_<MixVoice::SpeechResult, std::shared_ptr<MixVoice::SpeechResult>>(
        m, "SpeechResult", "Synthesis result")

        .def("get_audio_data", [](const MixVoice::SpeechResult& r) {
            const auto& audio = r.GetAudioData();
            return py::bytes(reinterpret_cast<const char*>(audio.data()), audio.size());
        }, "Get encoded audio as bytes")

        // 状态检查
        .def("is_success", &MixVoice::SpeechResult::IsSuccess)
        .def("get_code", &MixVoice::SpeechResult::GetCode, "Get error code name")
        .def("get_error_code", &MixVoice::SpeechResult::GetErrorCode, "Get numeric error code")
        .def("get_message", &MixVoice::SpeechResult::GetMessage)
        .def("get_detail", &MixVoice::SpeechResult::GetDetail)
        .def("is_empty", &MixVoice::SpeechResult::IsEmpty)
        .def("get_segment_count", &MixVoice::SpeechResult::GetSegmentCount)
        .def("get_processing_time_ms", &MixVoice::SpeechResult::GetProcessingTimeMs)

        // 文件操作
        .def("save_to_file", &MixVoice::SpeechResult::SaveToFile,
            py::arg("file_path"),
            "Save audio to file")

        // Python 魔术方法
        .def("__bool__", [](const MixVoice::SpeechResult& r) {
            return r.IsSuccess() && !r.IsEmpty();
        })
        .def("__repr__", [](const MixVoice::SpeechResult& r) {
            return "<SpeechResult " + r.GetCode() +
                " segments=" + std::to_string(r.GetSegmentCount()) +
                " bytes=" + std::to_string(r.GetAudioData().size()) + ">";
        });

    // =========================================================================
    // SpeechService - 合成服务
    // =========================================================================

    py::class_<MixVoice::SpeechService>(m, "SpeechService", "Mixed-language speech synthesis service")
        .def(py::init<const MixVoice::SpeechConfig&>(),
            py::arg("config") = MixVoice::SpeechConfig::Default(),
            "Create service with configuration")

        // 阻塞调用 - 释放 GIL
        .def("synthesize", [](MixVoice::SpeechService& self,
            const std::string& text,
            const std::string& voice) {
            py::gil_scoped_release release;
            return self.Synthesize(text, voice);
        }, py::arg("text"), py::arg("voice") = "male",
            "Synthesize text (blocking, releases GIL)")

        .def("synthesize_to_file", [](MixVoice::SpeechService& self,
            const std::string& text,
            const std::string& file_path,
            const std::string& voice) {
            py::gil_scoped_release release;
            return self.SynthesizeToFile(text, file_path, voice);
        }, py::arg("text"), py::arg("file_path"), py::arg("voice") = "male",
            "Synthesize text and save to file (blocking, releases GIL)")

        .def("preview_segments", &MixVoice::SpeechService::PreviewSegments,
            py::arg("text"),
            "Segment text without synthesizing")

        // 辅助方法
        .def("is_initialized", &MixVoice::SpeechService::IsInitialized)
        .def("get_init_error", &MixVoice::SpeechService::GetInitError)
        .def("get_client_name", &MixVoice::SpeechService::GetClientName)
        .def("get_voice_names", &MixVoice::SpeechService::GetVoiceNames)
        .def("get_config", &MixVoice::SpeechService::GetConfig)

        .def("__repr__", [](const MixVoice::SpeechService& service) {
            return "<SpeechService client=" + service.GetClientName() +
                " initialized=" + (service.IsInitialized() ? "true" : "false") + ">";
        });

    // =========================================================================
    // 模块级属性
    // =========================================================================

    m.attr("__version__") = "0.1.0";
}

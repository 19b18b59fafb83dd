#include "internal/pipeline/assembler.hpp"

#include <cstdint>

#include <fstream>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace mixvoice {

ErrorInfo Assembler::assemble(const std::vector<AudioArtifact>& ordered, PipelineResult& result) {
    if (ordered.empty()) {
        return ErrorInfo::error(ErrorCode::ASSEMBLY_ERROR, "No artifacts to assemble");
    }

    uint64_t expected = 0;
    for (const auto& artifact : ordered) {
        expected += artifact.size_bytes;
    }

    std::vector<uint8_t> audio;
    audio.reserve(static_cast<size_t>(expected));

    for (const auto& artifact : ordered) {
        std::ifstream file(artifact.path, std::ios::binary);
        if (!file) {
            return ErrorInfo::error(ErrorCode::ASSEMBLY_ERROR,
                "Failed to open artifact", artifact.path);
        }
        audio.insert(audio.end(),
                     std::istreambuf_iterator<char>(file),
                     std::istreambuf_iterator<char>());
        if (file.bad()) {
            return ErrorInfo::error(ErrorCode::ASSEMBLY_ERROR,
                "Failed to read artifact", artifact.path);
        }
    }

    if (static_cast<uint64_t>(audio.size()) != expected) {
        return ErrorInfo::error(ErrorCode::ASSEMBLY_ERROR,
            "Assembled size mismatch",
            "expected " + std::to_string(expected) + " bytes, got " + std::to_string(audio.size()));
    }

    result.audio = std::move(audio);
    result.segment_count = static_cast<int>(ordered.size());
    return ErrorInfo::ok();
}

}  // namespace mixvoice

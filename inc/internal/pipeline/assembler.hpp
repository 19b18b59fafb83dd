#ifndef MIXVOICE_ASSEMBLER_HPP
#define MIXVOICE_ASSEMBLER_HPP

#include <vector>

#include "internal/mixvoice_types.hpp"

namespace mixvoice {

// =============================================================================
// Assembler - 产物拼接
// =============================================================================
//
// 按给定顺序逐字节拼接，不重新编码、不插入静音。
// 依赖可直接拼接的编码格式 (mp3 帧流)。
//

class Assembler {
public:
    /// @brief 拼接产物
    /// @param ordered 已按 (chunk, line, segment) 排序的产物
    /// @param result [out] 拼接结果, segment_count = ordered.size()
    /// @return 错误信息: 空列表、读取失败或总长度不等于各产物之和时为 ASSEMBLY_ERROR
    static ErrorInfo assemble(const std::vector<AudioArtifact>& ordered, PipelineResult& result);
};

}  // namespace mixvoice

#endif  // MIXVOICE_ASSEMBLER_HPP

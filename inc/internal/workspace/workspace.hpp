#ifndef MIXVOICE_WORKSPACE_HPP
#define MIXVOICE_WORKSPACE_HPP

#include <string>

#include "internal/mixvoice_types.hpp"

namespace mixvoice {

// =============================================================================
// WorkspaceScope - 单次请求的临时目录
// =============================================================================
//
// 析构时删除目录及其中所有文件; release() 可重复调用。
// 只可移动，不可拷贝。
//

class WorkspaceScope {
public:
    WorkspaceScope() = default;
    WorkspaceScope(const std::string& path, const std::string& session_id);
    ~WorkspaceScope();

    WorkspaceScope(const WorkspaceScope&) = delete;
    WorkspaceScope& operator=(const WorkspaceScope&) = delete;
    WorkspaceScope(WorkspaceScope&& other) noexcept;
    WorkspaceScope& operator=(WorkspaceScope&& other) noexcept;

    /// @brief 删除目录, 已释放时直接返回
    /// @return 删除失败时返回 WORKSPACE_ERROR (调用方只记录日志)
    ErrorInfo release();

    bool isActive() const { return !path_.empty() && !released_; }
    const std::string& path() const { return path_; }
    const std::string& sessionId() const { return session_id_; }

    /// @brief 片段产物路径: segment_<chunk>_<line>_<seg>_<session>.<ext>
    std::string artifactPath(const Segment& segment, const std::string& extension) const;

private:
    std::string path_;
    std::string session_id_;
    bool released_ = false;
};

// =============================================================================
// WorkspaceManager - 临时目录管理
// =============================================================================

class WorkspaceManager {
public:
    /// @param fallback_base_dir 系统临时目录不可用时的备用目录
    explicit WorkspaceManager(const std::string& fallback_base_dir = "./temp");

    /// @brief 创建新的工作目录
    /// @param scope [out] 工作目录
    /// @return 错误信息 (两种方式都失败时为 WORKSPACE_ERROR)
    ErrorInfo newScope(WorkspaceScope& scope) const;

    /// @brief 释放工作目录 (幂等)
    void release(WorkspaceScope& scope) const;

    /// @brief 生成会话 ID (16 位十六进制)
    static std::string generateSessionId();

private:
    std::string fallback_base_dir_;
};

}  // namespace mixvoice

#endif  // MIXVOICE_WORKSPACE_HPP

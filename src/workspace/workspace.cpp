#include "internal/workspace/workspace.hpp"

#include <cstdlib>
#include <filesystem>  // NOLINT(build/c++17)
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace mixvoice {

// =============================================================================
// WorkspaceScope 实现
// =============================================================================

WorkspaceScope::WorkspaceScope(const std::string& path, const std::string& session_id)
    : path_(path), session_id_(session_id) {
}

WorkspaceScope::~WorkspaceScope() {
    auto err = release();
    if (!err.isOk()) {
        std::cerr << "[Workspace] " << err.message << ": " << err.detail << std::endl;
    }
}

WorkspaceScope::WorkspaceScope(WorkspaceScope&& other) noexcept
    : path_(std::move(other.path_)),
      session_id_(std::move(other.session_id_)),
      released_(other.released_) {
    other.path_.clear();
    other.released_ = true;
}

WorkspaceScope& WorkspaceScope::operator=(WorkspaceScope&& other) noexcept {
    if (this != &other) {
        auto err = release();
        if (!err.isOk()) {
            std::cerr << "[Workspace] " << err.message << ": " << err.detail << std::endl;
        }
        path_ = std::move(other.path_);
        session_id_ = std::move(other.session_id_);
        released_ = other.released_;
        other.path_.clear();
        other.released_ = true;
    }
    return *this;
}

ErrorInfo WorkspaceScope::release() {
    if (released_ || path_.empty()) {
        released_ = true;
        return ErrorInfo::ok();
    }
    released_ = true;

    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        return ErrorInfo::error(ErrorCode::WORKSPACE_ERROR,
            "Failed to remove workspace " + path_, ec.message());
    }
    return ErrorInfo::ok();
}

std::string WorkspaceScope::artifactPath(const Segment& segment,
                                         const std::string& extension) const {
    std::ostringstream name;
    name << "segment_" << segment.chunk_index
         << "_" << segment.line_index
         << "_" << segment.segment_index
         << "_" << session_id_
         << "." << extension;
    return (fs::path(path_) / name.str()).string();
}

// =============================================================================
// WorkspaceManager 实现
// =============================================================================

WorkspaceManager::WorkspaceManager(const std::string& fallback_base_dir)
    : fallback_base_dir_(fallback_base_dir) {
}

std::string WorkspaceManager::generateSessionId() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << rng();
    return oss.str();
}

ErrorInfo WorkspaceManager::newScope(WorkspaceScope& scope) const {
    std::string session_id = generateSessionId();

    // 首选系统临时目录
    std::error_code ec;
    fs::path sys_tmp = fs::temp_directory_path(ec);
    if (!ec) {
        std::string tmpl = (sys_tmp / "mixvoice_XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (mkdtemp(buf.data()) != nullptr) {
            scope = WorkspaceScope(std::string(buf.data()), session_id);
            return ErrorInfo::ok();
        }
        std::cerr << "[Workspace] mkdtemp failed in " << sys_tmp
                  << ", falling back to " << fallback_base_dir_ << std::endl;
    }

    // 备用: <base>/<session>
    fs::path fallback = fs::path(fallback_base_dir_) / ("mixvoice_" + session_id);
    fs::create_directories(fallback, ec);
    if (ec) {
        return ErrorInfo::error(ErrorCode::WORKSPACE_ERROR,
            "Failed to create workspace directory", fallback.string() + ": " + ec.message());
    }
    scope = WorkspaceScope(fallback.string(), session_id);
    return ErrorInfo::ok();
}

void WorkspaceManager::release(WorkspaceScope& scope) const {
    auto err = scope.release();
    if (!err.isOk()) {
        std::cerr << "[Workspace] " << err.message << ": " << err.detail << std::endl;
    }
}

}  // namespace mixvoice

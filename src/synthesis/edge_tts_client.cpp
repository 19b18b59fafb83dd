#include "internal/synthesis/edge_tts_client.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>  // NOLINT(build/c++17)
#include <fstream>
#include <iostream>
#include <iterator>
#include <random>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace mixvoice {

namespace {

constexpr std::chrono::milliseconds kPollInterval(20);
constexpr std::chrono::milliseconds kTermGrace(100);

std::string randomSuffix() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    std::ostringstream oss;
    oss << std::hex << rng();
    return oss.str();
}

// 结束整个进程组并回收子进程
void stopProcessGroup(pid_t pid) {
    int status = 0;
    kill(-pid, SIGTERM);
    std::this_thread::sleep_for(kTermGrace);
    if (waitpid(pid, &status, WNOHANG) == pid) {
        return;
    }
    kill(-pid, SIGKILL);
    waitpid(pid, &status, 0);
}

void removeQuietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        std::cerr << "[EdgeTts] Failed to remove " << path << ": " << ec.message() << std::endl;
    }
}

}  // namespace

EdgeTtsCommandClient::EdgeTtsCommandClient(const SynthesisClientConfig& config)
    : config_(config) {
}

std::vector<std::string> EdgeTtsCommandClient::buildArgs(const std::string& command,
                                                         const std::string& voice_id,
                                                         const std::string& text,
                                                         const std::string& output_path) {
    return {command, "--voice", voice_id, "--text", text, "--write-media", output_path};
}

ErrorInfo EdgeTtsCommandClient::synthesize(const std::string& text,
                                           const std::string& voice_id,
                                           const std::string& scratch_dir,
                                           const CancelToken& cancel,
                                           std::vector<uint8_t>& audio) {
    if (cancel.isCancelled()) {
        return ErrorInfo::error(ErrorCode::CANCELLED, "Synthesis cancelled");
    }
    if (scratch_dir.empty() || !fs::is_directory(scratch_dir)) {
        return ErrorInfo::error(ErrorCode::WORKSPACE_ERROR,
            "edge-tts needs a scratch directory", scratch_dir);
    }

    fs::path out_path = fs::path(scratch_dir) / ("edge_" + randomSuffix() + ".mp3");

    // fork 之前准备好 argv, 子进程中只做 async-signal-safe 调用
    std::vector<std::string> args = buildArgs(config_.command, voice_id, text, out_path.string());
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(&arg[0]);
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        return ErrorInfo::error(ErrorCode::SYNTHESIS_BACKEND_ERROR,
            "Failed to fork edge-tts", std::strerror(errno));
    }

    if (pid == 0) {
        // 子进程: 独立进程组, 丢弃输出
        setpgid(0, 0);
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            close(devnull);
        }
        execvp(argv[0], argv.data());
        _exit(127);
    }

    // 父进程也设置一次, 避免子进程 exec 前收到 kill 时进程组尚不存在
    setpgid(pid, pid);

    int status = 0;
    while (true) {
        pid_t done = waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            break;
        }
        if (done < 0 && errno != EINTR) {
            stopProcessGroup(pid);
            removeQuietly(out_path);
            return ErrorInfo::error(ErrorCode::SYNTHESIS_BACKEND_ERROR,
                "Failed to wait for edge-tts", std::strerror(errno));
        }
        if (cancel.isCancelled()) {
            stopProcessGroup(pid);
            removeQuietly(out_path);
            return ErrorInfo::error(ErrorCode::CANCELLED, "edge-tts cancelled");
        }
        std::this_thread::sleep_for(kPollInterval);
    }

    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        removeQuietly(out_path);
        std::string detail = WIFEXITED(status)
            ? "exit status " + std::to_string(WEXITSTATUS(status))
            : "terminated by signal " + std::to_string(WTERMSIG(status));
        if (WIFEXITED(status) && WEXITSTATUS(status) == 127) {
            detail += " (command not found: " + config_.command + ")";
        }
        return ErrorInfo::error(ErrorCode::SYNTHESIS_BACKEND_ERROR, "edge-tts command failed", detail);
    }

    std::ifstream file(out_path, std::ios::binary);
    if (!file) {
        return ErrorInfo::error(ErrorCode::EMPTY_SYNTHESIS,
            "edge-tts produced no output", out_path.string());
    }
    audio.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    file.close();
    removeQuietly(out_path);

    return ErrorInfo::ok();
}

}  // namespace mixvoice

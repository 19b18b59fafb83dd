#ifndef MIXVOICE_SYNTHESIS_WORKER_POOL_HPP
#define MIXVOICE_SYNTHESIS_WORKER_POOL_HPP

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace mixvoice {

// =============================================================================
// SynthesisWorkerPool - 固定大小的合成线程池
// =============================================================================
//
// 每次请求创建一个，线程数 = min(max_concurrency, 片段数)。
// 任务按提交顺序出队，完成顺序不确定。
//

class SynthesisWorkerPool {
public:
    using Task = std::function<void()>;

    explicit SynthesisWorkerPool(size_t num_threads = 4);
    ~SynthesisWorkerPool();

    SynthesisWorkerPool(const SynthesisWorkerPool&) = delete;
    SynthesisWorkerPool& operator=(const SynthesisWorkerPool&) = delete;

    // Start/stop the thread pool
    void start();
    void stop();

    /// @brief 提交任务, 未启动时返回 false
    bool submit(Task task);

    /// @brief 阻塞直到队列为空且没有正在执行的任务
    void waitIdle();

    size_t getQueueSize() const;
    size_t getNumThreads() const { return num_threads_; }

private:
    void workerThread();

    std::vector<std::thread> workers_;
    size_t num_threads_;

    std::queue<Task> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    size_t pending_ = 0;    // 排队 + 执行中

    std::atomic<bool> running_{false};
    bool stop_requested_ = false;
};

}  // namespace mixvoice

#endif  // MIXVOICE_SYNTHESIS_WORKER_POOL_HPP

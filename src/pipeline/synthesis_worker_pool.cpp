#include "internal/pipeline/synthesis_worker_pool.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace mixvoice {

SynthesisWorkerPool::SynthesisWorkerPool(size_t num_threads)
    : num_threads_(num_threads == 0 ? 1 : num_threads) {
    workers_.reserve(num_threads_);
}

SynthesisWorkerPool::~SynthesisWorkerPool() {
    stop();
}

void SynthesisWorkerPool::start() {
    if (running_) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_requested_ = false;
    }
    running_ = true;

    for (size_t i = 0; i < num_threads_; ++i) {
        workers_.emplace_back(&SynthesisWorkerPool::workerThread, this);
    }
}

void SynthesisWorkerPool::stop() {
    if (!running_) {
        return;
    }

    // 已排队的任务仍会被执行完
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_requested_ = true;
    }
    queue_cv_.notify_all();

    for (auto& thread : workers_) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    workers_.clear();
    running_ = false;
}

bool SynthesisWorkerPool::submit(Task task) {
    if (!running_) {
        std::cerr << "[WorkerPool] Pool not running, task rejected" << std::endl;
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        task_queue_.push(std::move(task));
        pending_++;
    }
    queue_cv_.notify_one();
    return true;
}

void SynthesisWorkerPool::waitIdle() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_cv_.wait(lock, [this] { return pending_ == 0; });
}

size_t SynthesisWorkerPool::getQueueSize() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return task_queue_.size();
}

void SynthesisWorkerPool::workerThread() {
    while (true) {
        Task task;

        // Wait for a task
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] {
                return !task_queue_.empty() || stop_requested_;
            });

            if (stop_requested_ && task_queue_.empty()) {
                break;
            }

            task = std::move(task_queue_.front());
            task_queue_.pop();
        }

        try {
            task();
        } catch (const std::exception& e) {
            std::cerr << "[WorkerPool] Task failed: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "[WorkerPool] Task failed with unknown exception" << std::endl;
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            pending_--;
        }
        idle_cv_.notify_all();
    }
}

}  // namespace mixvoice

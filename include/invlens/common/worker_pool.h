#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <thread>
#include <vector>
#include "invlens/common/bounded_queue.h"

namespace invlens {

// ================================
// WorkerPool: 固定线程数的任务池
// 所有 worker 共享一个 FIFO 队列, 任务按提交顺序被领取
// ================================

template<typename Job>
class WorkerPool {
public:
    struct Config {
        size_t num_workers = 4;
        size_t queue_size = 1024;
    };

    explicit WorkerPool(Config config)
        : config_(config),
          queue_(std::make_unique<BoundedQueue<Job>>(config.queue_size)) {
        if (config_.num_workers == 0) {
            config_.num_workers = 1;
        }
    }

    ~WorkerPool() { stop(); }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void start() {
        if (running_.exchange(true)) return;
        for (size_t i = 0; i < config_.num_workers; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    }

    // 不再接受新任务, 等待已提交任务执行完毕
    void stop() {
        if (!running_.exchange(false)) return;
        queue_->close();
        for (auto& w : workers_) {
            if (w.joinable()) w.join();
        }
        workers_.clear();
    }

    bool submit(Job job) {
        if (!running_) return false;
        return queue_->enqueue(std::move(job));
    }

private:
    void worker_loop() {
        while (auto job = queue_->dequeue()) {
            (*job)();
        }
    }

    Config config_;
    std::atomic<bool> running_{false};
    std::unique_ptr<BoundedQueue<Job>> queue_;
    std::vector<std::thread> workers_;
};

// 便捷类型别名
using TaskPool = WorkerPool<std::function<void()>>;

} // namespace invlens

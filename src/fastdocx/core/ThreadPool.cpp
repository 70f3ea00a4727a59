#include "fastdocx/core/ThreadPool.hpp"
#include "fastdocx/utils/ModuleLoggers.hpp"

namespace fastdocx {
namespace core {

ThreadPool::ThreadPool(size_t threads)
    : stop_(false) {

    if (threads == 0) {
        threads = std::thread::hardware_concurrency();
        if (threads == 0) threads = 4; // 默认4个线程
    }

    CORE_DEBUG("Creating ThreadPool with {} threads", threads);

    workers_.reserve(threads);

    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] {
            for (;;) {
                std::function<void()> task;

                {
                    std::unique_lock<std::mutex> lock(this->queue_mutex_);

                    // 等待任务或停止信号
                    this->condition_.wait(lock, [this] {
                        return this->stop_ || !this->tasks_.empty();
                    });

                    if (this->stop_ && this->tasks_.empty()) {
                        return;
                    }

                    task = std::move(this->tasks_.front());
                    this->tasks_.pop();
                }

                // packaged_task把异常存入future，这里不会抛出
                task();
            }
        });
    }
}

ThreadPool::~ThreadPool() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }

    condition_.notify_all();

    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    CORE_DEBUG("ThreadPool destroyed, {} threads joined", workers_.size());
}

}} // namespace fastdocx::core

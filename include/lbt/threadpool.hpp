/**
 * @file threadpool.hpp
 * @brief 线程池 - 批量回测时并行跑互不相关的任务
 *
 * - 固定大小线程池
 * - 任务队列 + std::future 取结果（任务中的异常由 future.get() 重新抛出）
 * - 析构时执行完队列中剩余任务再退出
 */

#pragma once

#include "lbt/common.hpp"
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace lbt {

class ThreadPool {
public:
    /**
     * @param numThreads 工作线程数量，0 表示硬件线程数
     */
    explicit ThreadPool(Size numThreads = 0) {
        Size threads = numThreads > 0 ? numThreads
                                      : static_cast<Size>(std::thread::hardware_concurrency());
        if (threads == 0) threads = 1;  // 至少一个线程

        workers_.reserve(threads);
        for (Size i = 0; i < threads; ++i) {
            workers_.emplace_back([this] { workerLoop(); });
        }
    }

    ~ThreadPool() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        condition_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable()) worker.join();
        }
    }

    LBT_DISABLE_COPY(ThreadPool)

    /**
     * @brief 提交任务
     * @throws std::runtime_error 线程池已停止
     */
    template<typename F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using ReturnType = std::invoke_result_t<std::decay_t<F>>;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(f));
        std::future<ReturnType> result = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_) {
                throw std::runtime_error("ThreadPool has been stopped");
            }
            tasks_.emplace([task]() { (*task)(); });
        }
        condition_.notify_one();
        return result;
    }

    /**
     * @brief 并行 map，结果顺序与输入一致
     */
    template<typename F, typename Container>
    auto map(F f, const Container& inputs)
        -> std::vector<std::invoke_result_t<F, const typename Container::value_type&>> {
        using ReturnType = std::invoke_result_t<F, const typename Container::value_type&>;

        std::vector<std::future<ReturnType>> futures;
        futures.reserve(inputs.size());
        for (const auto& input : inputs) {
            futures.push_back(submit([f, &input]() { return f(input); }));
        }

        std::vector<ReturnType> results;
        results.reserve(futures.size());
        for (auto& future : futures) {
            results.push_back(future.get());
        }
        return results;
    }

    Size size() const { return workers_.size(); }

    Size pendingTasks() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.size();
    }

private:
    void workerLoop() {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
                if (stop_ && tasks_.empty()) {
                    return;
                }
                task = std::move(tasks_.front());
                tasks_.pop();
            }
            task();
        }
    }

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    bool stop_ = false;
};

} // namespace lbt

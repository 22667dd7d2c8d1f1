//
// Created by gregorian-rayne on 12/28/25.
//

#ifndef COVA_PARALLEL_HPP
#define COVA_PARALLEL_HPP

/**
 * @file parallel.hpp
 * @brief Thread pool and fan-out helper used by the test runner.
 *
 * Each task's result travels back through its own future, which acts as a
 * write-once slot. Nothing else is shared between workers.
 */

#include <vector>
#include <future>
#include <thread>
#include <queue>
#include <functional>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <stdexcept>
#include <algorithm>

namespace cova::parallel {

    inline unsigned int hardware_concurrency() noexcept {
        unsigned int n = std::thread::hardware_concurrency();
        return n > 0 ? n : 1;
    }

    /**
     * Number of workers to start for @p task_count tasks.
     *
     * @param task_count Number of tasks that will be submitted.
     * @param cap Upper bound on workers; 0 means one worker per task.
     */
    inline unsigned int worker_count(std::size_t task_count, unsigned int cap) noexcept {
        if (task_count == 0) {
            return 1;
        }
        auto n = static_cast<unsigned int>(task_count);
        if (cap > 0) {
            n = std::min(n, cap);
        }
        return n;
    }

    /**
     * A simple thread pool for parallel task execution.
     */
    class ThreadPool {
    public:
        /**
         * @param num_threads Number of worker threads (0 = auto-detect).
         */
        explicit ThreadPool(unsigned int num_threads = 0)
            : stop_(false) {
            if (num_threads == 0) {
                num_threads = hardware_concurrency();
            }

            workers_.reserve(num_threads);
            for (unsigned int i = 0; i < num_threads; ++i) {
                workers_.emplace_back([this] {
                    worker_loop();
                });
            }
        }

        ~ThreadPool() {
            {
                std::unique_lock lock(queue_mutex_);
                stop_ = true;
            }
            condition_.notify_all();

            for (auto& worker : workers_) {
                if (worker.joinable()) {
                    worker.join();
                }
            }
        }

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        template<typename F>
        auto submit(F&& f) -> std::future<std::invoke_result_t<F>> {
            using return_type = std::invoke_result_t<F>;

            auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
            std::future<return_type> result = task->get_future();

            {
                std::unique_lock lock(queue_mutex_);
                if (stop_) {
                    throw std::runtime_error("Cannot submit to stopped thread pool");
                }
                tasks_.emplace([task]() { (*task)(); });
            }

            condition_.notify_one();
            return result;
        }

        [[nodiscard]] std::size_t size() const noexcept {
            return workers_.size();
        }

    private:
        void worker_loop() {
            while (true) {
                std::function<void()> task;

                {
                    std::unique_lock lock(queue_mutex_);
                    condition_.wait(lock, [this] {
                        return stop_ || !tasks_.empty();
                    });

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
        std::mutex queue_mutex_;
        std::condition_variable condition_;
        bool stop_;
    };

    /**
     * Runs @p f over @p items on the pool.
     *
     * Results come back in input order. The call returns, or rethrows the
     * first exception in input order, only after every task has settled,
     * so no task outlives @p items or @p f.
     */
    template<typename T, typename F>
    auto map(const std::vector<T>& items, F&& f, ThreadPool& pool)
        -> std::vector<std::invoke_result_t<F, const T&>> {
        using ResultType = std::invoke_result_t<F, const T&>;

        std::vector<std::future<ResultType>> pending;
        pending.reserve(items.size());
        for (const auto& item : items) {
            pending.push_back(pool.submit([&f, &item] { return f(item); }));
        }

        for (const auto& task : pending) {
            task.wait();
        }

        std::vector<ResultType> results;
        results.reserve(items.size());
        for (auto& task : pending) {
            results.push_back(task.get());
        }
        return results;
    }

}  // namespace cova::parallel

#endif //COVA_PARALLEL_HPP

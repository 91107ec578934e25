#pragma once

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace optionlab::utils {

class ThreadPool {
public:
    explicit ThreadPool(std::size_t num_threads = default_concurrency())
        : stop_flag_(false) {

        num_threads = std::max<std::size_t>(num_threads, 1);
        workers_.reserve(num_threads);

        for (std::size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this] { worker_thread(); });
        }
    }

    ~ThreadPool() {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            stop_flag_ = true;
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
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    static std::size_t default_concurrency() noexcept {
        return std::max<std::size_t>(std::thread::hardware_concurrency(), 1);
    }

    // Exceptions thrown by the task surface from the returned future's get().
    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
        using ReturnType = std::invoke_result_t<F, Args...>;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<ReturnType> result = task->get_future();

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);

            if (stop_flag_) {
                throw std::runtime_error("enqueue on stopped ThreadPool");
            }

            tasks_.emplace([task]() { (*task)(); });
        }

        condition_.notify_one();
        return result;
    }

    std::size_t size() const {
        return workers_.size();
    }

private:
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;

    bool stop_flag_;

    void worker_thread() {
        while (true) {
            std::function<void()> task;

            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                condition_.wait(lock, [this] { return stop_flag_ || !tasks_.empty(); });

                if (stop_flag_ && tasks_.empty()) {
                    return;
                }

                task = std::move(tasks_.front());
                tasks_.pop();
            }

            task();
        }
    }
};

class ParallelExecutor {
public:
    // Calls func(begin, end) on contiguous index chunks. With a single chunk
    // the call runs inline on the caller's thread.
    template<typename Function>
    static void parallel_for(ThreadPool* pool, std::size_t count, std::size_t min_chunk, Function func) {
        if (count == 0) return;

        const std::size_t workers = pool ? pool->size() : 1;
        const std::size_t chunk_size = std::max<std::size_t>(
            std::max<std::size_t>(min_chunk, 1), (count + workers - 1) / workers);

        if (!pool || workers == 1 || chunk_size >= count) {
            func(std::size_t{0}, count);
            return;
        }

        std::vector<std::future<void>> futures;
        futures.reserve((count + chunk_size - 1) / chunk_size);

        for (std::size_t begin = 0; begin < count; begin += chunk_size) {
            const std::size_t end = std::min(begin + chunk_size, count);
            futures.push_back(pool->enqueue([&func, begin, end]() { func(begin, end); }));
        }

        // Every chunk must finish before rethrowing: the tasks reference func.
        for (auto& future : futures) {
            future.wait();
        }
        for (auto& future : futures) {
            future.get();
        }
    }

    // Applies func to every element of input; result order follows input order.
    template<typename Container, typename Function>
    static auto parallel_transform(ThreadPool* pool, const Container& input, Function func) {
        using ResultType = std::invoke_result_t<Function, typename Container::value_type>;
        std::vector<ResultType> result(input.size());

        parallel_for(pool, input.size(), 1, [&input, &result, &func](std::size_t begin, std::size_t end) {
            for (std::size_t j = begin; j < end; ++j) {
                result[j] = func(input[j]);
            }
        });

        return result;
    }
};

}

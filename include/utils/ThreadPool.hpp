#pragma once

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace ivsurf::utils {

inline std::size_t default_thread_count() noexcept {
    const unsigned int hardware = std::thread::hardware_concurrency();
    return hardware == 0 ? 1 : static_cast<std::size_t>(hardware);
}

// Fixed set of workers draining a FIFO of tasks. The destructor finishes the
// queued tasks before joining.
class ThreadPool {
public:
    explicit ThreadPool(std::size_t num_threads) {
        const std::size_t count = std::max<std::size_t>(num_threads, 1);
        workers_.reserve(count);

        for (std::size_t i = 0; i < count; ++i) {
            workers_.emplace_back([this] { worker_thread(); });
        }
    }

    ~ThreadPool() {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            stop_flag_ = true;
        }

        condition_.notify_all();

        for (auto& worker : workers_) {
            worker.join();
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<typename F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<F>> {
        using ReturnType = std::invoke_result_t<F>;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(f));
        std::future<ReturnType> result = task->get_future();

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (stop_flag_) {
                throw std::runtime_error("enqueue on stopped ThreadPool");
            }
            tasks_.emplace([task]() { (*task)(); });
        }

        condition_.notify_one();
        return result;
    }

private:
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable condition_;
    bool stop_flag_ = false;

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
    // Maps func over input, preserving order. Each element is an independent
    // unit; once `cancel` is raised no further unit starts and the slots of
    // units that never ran stay empty. Exceptions from func propagate.
    template<typename Container, typename Function>
    static auto parallel_transform_until(const Container& input, Function func,
                                         const std::atomic<bool>* cancel,
                                         std::size_t num_threads = default_thread_count()) {

        using ResultType = std::invoke_result_t<Function, typename Container::value_type>;
        std::vector<std::optional<ResultType>> result(input.size());

        if (input.empty()) {
            return result;
        }

        const auto cancelled = [cancel] {
            return cancel != nullptr && cancel->load(std::memory_order_relaxed);
        };

        if (num_threads <= 1 || input.size() == 1) {
            for (std::size_t i = 0; i < input.size() && !cancelled(); ++i) {
                result[i].emplace(func(input[i]));
            }
            return result;
        }

        const std::size_t workers = std::min(num_threads, input.size());
        const std::size_t chunk_size = (input.size() + workers - 1) / workers;

        ThreadPool pool(workers);
        std::vector<std::future<void>> futures;
        futures.reserve(workers);

        for (std::size_t i = 0; i < input.size(); i += chunk_size) {
            const std::size_t end_idx = std::min(i + chunk_size, input.size());

            futures.push_back(pool.enqueue([&input, &result, &func, &cancelled, i, end_idx]() {
                for (std::size_t j = i; j < end_idx && !cancelled(); ++j) {
                    result[j].emplace(func(input[j]));
                }
            }));
        }

        for (auto& future : futures) {
            future.get();
        }

        return result;
    }

    template<typename Container, typename Function>
    static auto parallel_transform(const Container& input, Function func,
                                   std::size_t num_threads = default_thread_count()) {

        using ResultType = std::invoke_result_t<Function, typename Container::value_type>;
        auto partial = parallel_transform_until(input, func, nullptr, num_threads);

        std::vector<ResultType> result;
        result.reserve(partial.size());
        for (auto& slot : partial) {
            result.push_back(std::move(*slot));
        }
        return result;
    }
};

}

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace gifrgb::concurrency {

class ThreadPool {
public:
    // threadCount 0 picks the hardware concurrency; never more workers than
    // expectedTasks when that is known.
    explicit ThreadPool(std::size_t threadCount = 0, std::size_t expectedTasks = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    template <class Callable>
    auto enqueue(Callable&& task) -> std::future<std::invoke_result_t<std::decay_t<Callable>>>;

    // Runs the queued tasks to completion and joins the workers.
    void shutdown();

    std::size_t size() const noexcept;

private:
    void workerLoop();

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ {false};
};

template <class Callable>
auto ThreadPool::enqueue(Callable&& task) -> std::future<std::invoke_result_t<std::decay_t<Callable>>>
{
    using Result = std::invoke_result_t<std::decay_t<Callable>>;

    auto packaged = std::make_shared<std::packaged_task<Result()>>(std::forward<Callable>(task));
    auto future = packaged->get_future();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("ThreadPool no longer accepts tasks");
        }
        tasks_.emplace_back([packaged]() { (*packaged)(); });
    }

    cv_.notify_one();
    return future;
}

} // namespace gifrgb::concurrency

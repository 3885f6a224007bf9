//===----------------------------------------------------------------------===//
//                         SQLGate
//
// executor/executor_pool.hpp
//
// Worker thread pool that runs statements off the caller's thread
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <queue>
#include <future>
#include <stdexcept>
#include <type_traits>

namespace sqlgate {

class ExecutorPool {
public:
    using Task = std::function<void()>;

    explicit ExecutorPool(size_t thread_count = 0);
    ~ExecutorPool();

    ExecutorPool(const ExecutorPool&) = delete;
    ExecutorPool& operator=(const ExecutorPool&) = delete;

    void Start();

    // Waits for running tasks, drops queued ones
    void Stop();

    // Returns false if the pool is stopping and the task was not queued
    bool Submit(Task task);

    // Throws std::runtime_error if the pool is not accepting work
    template<typename F, typename... Args>
    auto SubmitWithFuture(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type> {
        using return_type = typename std::invoke_result<F, Args...>::type;

        auto task = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<return_type> result = task->get_future();

        if (!Submit([task]() { (*task)(); })) {
            throw std::runtime_error("Executor pool is not accepting tasks");
        }

        return result;
    }

    size_t Size() const { return thread_count_; }
    size_t PendingTasks() const;
    bool IsRunning() const { return running_; }

private:
    void Worker();

private:
    size_t thread_count_;
    std::vector<std::thread> workers_;

    std::queue<Task> tasks_;
    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;

    std::atomic<bool> running_;
    std::atomic<bool> stop_requested_;
};

} // namespace sqlgate

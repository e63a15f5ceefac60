// include/thread_pool.hpp
#pragma once

#include <vector>
#include <queue>
#include <string>
#include <thread>
#include <mutex>
#include <atomic>
#include <condition_variable>
#include <future> // For std::future, std::packaged_task
#include <functional> // For std::function
#include <stdexcept> // For std::runtime_error
#include <type_traits>

namespace MediaVault {
namespace Concurrency {

// Fixed-size worker pool. The number of workers is the concurrency bound
// for whatever kind of work is queued on it; extra tasks wait in FIFO order.
class ThreadPool {
public:
    ThreadPool(std::string name, size_t num_threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Enqueue a task to be executed by a thread in the pool.
    // Returns a std::future that will hold the result of the task.
    template<class F, class... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    // Finishes queued tasks, then joins the workers. Later enqueues throw.
    void shutdown();

    size_t size() const { return workers.size(); }
    size_t queued();
    size_t active() const { return active_tasks.load(); }
    const std::string& name() const { return pool_name; }

private:
    std::string pool_name;
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;

    std::mutex queue_mutex;
    std::condition_variable condition;
    bool stop_all; // Flag to signal threads to stop
    std::atomic<size_t> active_tasks;
};

template<class F, class... Args>
auto ThreadPool::enqueue(F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type>
{
    using return_type = typename std::invoke_result<F, Args...>::type;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> res = task->get_future();

    {
        std::unique_lock<std::mutex> lock(queue_mutex);

        // Don't allow enqueueing after stopping the pool
        if (stop_all)
            throw std::runtime_error("enqueue on stopped ThreadPool " + pool_name);

        tasks.emplace([task]() { (*task)(); });
    }
    condition.notify_one();
    return res;
}

} // namespace Concurrency
} // namespace MediaVault

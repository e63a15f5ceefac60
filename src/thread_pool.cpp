// src/thread_pool.cpp
#include "thread_pool.hpp"
#include <iostream> // For logging

namespace MediaVault
{
    namespace Concurrency
    {

        ThreadPool::ThreadPool(std::string name, size_t num_threads)
            : pool_name(std::move(name)), stop_all(false), active_tasks(0)
        {
            if (num_threads == 0)
            {
                throw std::runtime_error("ThreadPool " + pool_name + " cannot be initialized with 0 threads.");
            }
            for (size_t i = 0; i < num_threads; ++i)
            {
                workers.emplace_back(
                    [this]
                    {
                        for (;;)
                        {
                            std::function<void()> task;
                            {
                                std::unique_lock<std::mutex> lock(this->queue_mutex);
                                this->condition.wait(lock,
                                                     [this]
                                                     { return this->stop_all || !this->tasks.empty(); });

                                // If stopping and no more tasks, exit the loop
                                if (this->stop_all && this->tasks.empty())
                                    return;

                                task = std::move(this->tasks.front());
                                this->tasks.pop();
                                ++this->active_tasks;
                            }
                            // Exceptions land in the task's future.
                            task();
                            --this->active_tasks;
                        }
                    });
            }
            std::cout << "ThreadPool " << pool_name << " initialized with " << num_threads << " threads." << std::endl;
        }

        ThreadPool::~ThreadPool()
        {
            shutdown();
        }

        void ThreadPool::shutdown()
        {
            {
                std::unique_lock<std::mutex> lock(queue_mutex);
                if (stop_all)
                    return;
                stop_all = true;
            }
            condition.notify_all();
            for (std::thread &worker : workers)
            {
                if (worker.joinable())
                {
                    worker.join();
                }
            }
            std::cout << "ThreadPool " << pool_name << " stopped." << std::endl;
        }

        size_t ThreadPool::queued()
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            return tasks.size();
        }

    } // namespace Concurrency
} // namespace MediaVault

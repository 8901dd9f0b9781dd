/**
 * @file thread_pool.cpp
 * @brief ThreadPool实现
 */
#include "thread_pool.h"
#include "logger.h"
#include <exception>
#include <string>

ThreadPool::ThreadPool(size_t threads) : pending(0), stop(false) {
    if (threads == 0) {
        threads = 1;
    }
    for (size_t i = 0; i < threads; ++i) {
        workers.emplace_back([this] { workerLoop(); });
    }
}

ThreadPool::~ThreadPool() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex);
        stop = true;
    }
    condition.notify_all();
    for (auto& worker : workers) {
        worker.join();
    }
}

void ThreadPool::workerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            condition.wait(lock, [this] {
                return stop || !tasks.empty();
            });

            if (stop && tasks.empty()) {
                return;
            }

            task = std::move(tasks.front());
            tasks.pop();
        }

        try {
            task();
        } catch (const std::exception& e) {
            // 任务异常不能让工作线程退出
            Logger::error(std::string("Task failed: ") + e.what());
        }

        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            if (--pending == 0) {
                idle.notify_all();
            }
        }
    }
}

void ThreadPool::waitIdle() {
    std::unique_lock<std::mutex> lock(queue_mutex);
    idle.wait(lock, [this] { return pending == 0; });
}

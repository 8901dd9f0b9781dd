/**
 * @file thread_pool.h
 * @brief 固定大小的线程池
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

/**
 * @class ThreadPool
 * @brief 线程池实现，用于并发地向停车场提交入场/出场请求
 *
 * 特性：
 * 1. 固定数量的工作线程
 * 2. 任务队列
 * 3. 等待全部任务完成（waitIdle）
 * 4. 优雅关闭：析构时执行完队列中剩余任务再退出
 */
class ThreadPool {
public:
    /**
     * @brief 构造函数
     * @param threads 工作线程数量，为0时按1处理
     */
    explicit ThreadPool(size_t threads);

    /**
     * @brief 析构函数，确保所有线程正确关闭
     */
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief 提交任务到线程池
     * @param f 要执行的任务
     * @return 是否成功提交（已停止时返回false）
     */
    template<class F>
    bool enqueue(F&& f) {
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            if (stop) return false;
            tasks.emplace(std::forward<F>(f));
            ++pending;
        }
        condition.notify_one();
        return true;
    }

    /**
     * @brief 阻塞直到队列为空且没有正在执行的任务
     */
    void waitIdle();

    size_t size() const { return workers.size(); }

private:
    void workerLoop();

    std::vector<std::thread> workers;        // 工作线程集合
    std::queue<std::function<void()>> tasks; // 任务队列

    std::mutex queue_mutex;                  // 队列互斥锁
    std::condition_variable condition;       // 有新任务或停止
    std::condition_variable idle;            // 全部任务完成
    size_t pending;                          // 未完成的任务数（含执行中）
    std::atomic<bool> stop;                  // 停止标志
};

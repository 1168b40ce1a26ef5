#ifndef SIMPLETHREADPOOL_HPP
#define SIMPLETHREADPOOL_HPP

#include "PCH.h"

#include "BS_thread_pool.hpp"

// BS::thread_pool 的薄封装，线程数至少为 2
class SimpleThreadPool
{
public:
    // threads 为 0 时按 CPU 核数
    explicit SimpleThreadPool(size_t threads)
        : pool_(resolveThreadCount(threads))
    {
        spdlog::debug("[ThreadPool] started with {} workers", pool_.get_thread_count());
    }

    SimpleThreadPool(const SimpleThreadPool &) = delete;
    SimpleThreadPool &operator=(const SimpleThreadPool &) = delete;

    static size_t resolveThreadCount(size_t requested)
    {
        size_t threads = requested == 0 ? std::thread::hardware_concurrency() : requested;
        return threads < 2 ? 2 : threads;
    }

    /**
     * @brief 提交任务
     *
     * submit_task 只接受无参可调用对象，参数用 std::bind 绑定。
     * @return std::future<返回值类型>
     */
    template <class F, class... Args>
    auto enqueue(F &&f, Args &&...args)
    {
        return pool_.submit_task(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...));
    }

    size_t size() const
    {
        return pool_.get_thread_count();
    }

    // 等待所有已提交的任务完成
    void shutdown()
    {
        pool_.wait();
    }

    ~SimpleThreadPool()
    {
        shutdown();
    }

private:
    BS::thread_pool<> pool_;
};

#endif

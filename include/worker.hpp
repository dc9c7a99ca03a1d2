#pragma once

#include <atomic>
#include <functional>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"

/**
 * 后台 worker 线程池
 * 提交执行的请求线程只负责校验、检查配额和入队，沙箱运行、等待容器结束、评分
 * 都在 worker 线程上完成，请求线程可以通过 execution_service::wait_for 等待结果。
 *
 * 每个 worker 循环从任务队列取任务执行，任务之间互不影响：
 * 一个任务抛出的异常只会被记录下来，不会导致 worker 退出。
 */
namespace sandbox {

struct worker_pool {
    using job = std::function<void()>;

    /**
     * @brief 启动 threads 个 worker 线程
     */
    explicit worker_pool(std::size_t threads);

    /**
     * @brief 等待队列中的任务完成后停止所有 worker
     */
    ~worker_pool();

    void submit(job task);

    /**
     * @brief 停止所有的 worker
     * 调用该函数后，worker 在任务队列为空时退出。已经入队的任务仍然会被执行。
     * 可以重复调用。
     */
    void stop();

    /**
     * @brief 队列中尚未开始的任务数
     */
    std::size_t pending();

private:
    concurrent_queue<job> jobs;
    std::vector<std::thread> threads;
    std::atomic<bool> stopping{false};

    void worker_loop(std::size_t worker_id);
};

}  // namespace sandbox

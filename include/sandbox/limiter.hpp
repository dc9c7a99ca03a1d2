#pragma once

#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace sandbox {

struct concurrency_limiter;

/**
 * @brief 并发名额，析构时归还
 */
struct concurrency_slot {
    concurrency_slot(concurrency_limiter *limiter, const std::string &environment_id);
    concurrency_slot(concurrency_slot &&other);
    ~concurrency_slot();

    concurrency_slot(const concurrency_slot &) = delete;
    concurrency_slot &operator=(const concurrency_slot &) = delete;
    concurrency_slot &operator=(concurrency_slot &&) = delete;

private:
    concurrency_limiter *limiter;
    std::string environment_id;
};

/**
 * @brief 限制同时运行的容器数量
 * 同时受全局上限和每个运行环境的上限约束，避免一个热门的运行环境占满所有名额。
 */
struct concurrency_limiter {
    /**
     * @param global_limit 全局同时运行的执行数上限
     * @param default_environment_limit 运行环境没有单独配置上限时使用的上限
     */
    concurrency_limiter(int global_limit, int default_environment_limit);

    /**
     * @brief 阻塞直到获得名额
     * @param environment_limit 运行环境的上限，0 表示使用默认上限
     * @param cancelled 等待期间周期性检查，返回 true 时放弃等待
     * @return 名额，放弃等待时返回 nullopt
     */
    std::optional<concurrency_slot> acquire(const std::string &environment_id, int environment_limit, const std::function<bool()> &cancelled = {});

    /**
     * @brief 不等待，立即尝试获得名额
     */
    std::optional<concurrency_slot> try_acquire(const std::string &environment_id, int environment_limit);

    int running() const;
    int running(const std::string &environment_id) const;

private:
    friend struct concurrency_slot;

    mutable std::mutex mut;
    std::condition_variable cond;
    int global_limit, default_environment_limit;
    int total = 0;
    std::map<std::string, int> per_environment;

    bool has_room(const std::string &environment_id, int environment_limit) const;
    void release(const std::string &environment_id);
};

}  // namespace sandbox

#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "environment/environment.hpp"

namespace sandbox {

/**
 * @brief 用户的订阅等级，决定每日配额
 */
enum class user_tier {
    FREE,
    PREMIUM,
    INSTRUCTOR,
    ADMIN
};

/**
 * @brief 一个等级的每日配额，-1 表示不限制
 */
struct quota_limits {
    int64_t executions = -1;
    double cpu_seconds = -1;

    /**
     * @brief 每日累计的内存使用量（各次执行的内存峰值之和），单位为 MB
     */
    int64_t memory_mb = -1;
};

/**
 * @brief 各等级的配额，从 quota.json 加载
 */
struct quota_policy {
    std::map<user_tier, quota_limits> tiers;

    /**
     * @brief 默认配额：free 100 次，premium 1000 次，instructor 5000 次，admin 不限制
     */
    static quota_policy defaults();

    const quota_limits &limits(user_tier tier) const;
};

/**
 * @brief 用户某一天的配额使用情况
 */
struct quota_snapshot {
    std::string user_id;
    user_tier tier = user_tier::FREE;

    /**
     * @brief 配额周期，格式为 YYYY-MM-DD（UTC）
     */
    std::string period;

    int64_t executions_used = 0;
    int64_t executions_limit = -1;
    double cpu_seconds_used = 0;
    double cpu_seconds_limit = -1;
    int64_t memory_used_mb = 0;
    int64_t memory_limit_mb = -1;
    bool exceeded = false;

    /**
     * @brief 下一次重置的时间，即下一个 UTC 零点
     */
    std::chrono::system_clock::time_point reset_at;

    /**
     * @brief 距离重置还有多久
     */
    std::chrono::seconds seconds_until_reset{0};
};

/**
 * @brief 每日配额管理
 * 每个用户每天一条配额记录，跨天后第一次访问时惰性重置。
 * 同一用户的并发请求通过记录上的锁串行化，检查和占用是原子的，
 * 因此每日上限为 N 时第 N+1 次 admit 一定失败。
 */
struct quota_manager {
    using clock_function = std::function<std::chrono::system_clock::time_point()>;

    explicit quota_manager(quota_policy policy = quota_policy::defaults(), clock_function clock = std::chrono::system_clock::now);

    /**
     * @brief 检查配额并占用一次执行名额
     * 同时检查运行环境的每日执行上限，该上限由所有用户共享
     * @return 是否允许执行，拒绝时不会占用任何名额
     */
    bool admit(const std::string &user_id, user_tier tier, const execution_environment &env);

    /**
     * @brief 执行结束后记录实际使用的 CPU 时间和内存
     */
    void commit(const std::string &user_id, double cpu_seconds, int64_t memory_bytes);

    quota_snapshot status(const std::string &user_id, user_tier tier);

    /**
     * @brief 运行环境今天已经执行的次数
     */
    int64_t environment_usage(const std::string &environment_id);

    /**
     * @brief 距离下一次配额重置还有多久
     */
    std::chrono::seconds until_reset() const;

    /**
     * @brief 导出所有用户的配额记录和运行环境的计数器，守护进程重启后用 restore 恢复
     * 格式为 {"users": {user_id: {...}}, "environments": {environment_id: {...}}}
     */
    nlohmann::json snapshot();

    /**
     * @brief 用快照替换当前的配额记录，过期的周期会在下一次访问时重置
     * @throw std::invalid_argument 快照格式不正确
     */
    void restore(const nlohmann::json &j);

private:
    struct quota_record {
        std::mutex mut;
        int64_t period = 0;
        int64_t executions_used = 0;
        double cpu_seconds_used = 0;
        int64_t memory_used_mb = 0;
        bool exceeded = false;

        /**
         * @brief 跨天时重置计数器，同一天内重复调用没有效果
         * 调用方必须持有 mut
         */
        void roll(int64_t today);
    };

    struct environment_counter {
        int64_t period = 0;
        int64_t executions = 0;
    };

    quota_policy policy;
    clock_function clock;

    std::mutex records_mutex;
    std::map<std::string, std::shared_ptr<quota_record>> records;

    std::mutex environments_mutex;
    std::map<std::string, environment_counter> environments;

    std::shared_ptr<quota_record> record_of(const std::string &user_id);
    int64_t today() const;
};

const char *get_display_message(user_tier tier);

void to_json(nlohmann::json &j, const user_tier &tier);
void from_json(const nlohmann::json &j, user_tier &tier);
void from_json(const nlohmann::json &j, quota_limits &limits);
void from_json(const nlohmann::json &j, quota_policy &policy);
void to_json(nlohmann::json &j, const quota_snapshot &snapshot);

}  // namespace sandbox

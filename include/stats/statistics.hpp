#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "execution/store.hpp"

namespace sandbox {

/**
 * @brief 一天（UTC）的执行统计，以执行的创建日期归档
 * 评分派生的 TEST 执行不计入统计
 */
struct daily_statistics {
    /**
     * @brief 自 1970-01-01 起的天数
     */
    int64_t day = 0;

    /**
     * @brief YYYY-MM-DD
     */
    std::string date;

    int64_t total = 0;

    /**
     * @brief 正常结束且退出码为 0
     */
    int64_t successful = 0;

    /**
     * @brief 其余所有终止状态，包括非零退出码、超时和内存超限
     */
    int64_t failed = 0;

    int64_t timeouts = 0;
    int64_t memory_exceeded = 0;

    double total_execution_time = 0;
    double average_execution_time = 0;
    double total_cpu_time = 0;
    int64_t total_memory_used = 0;

    /**
     * @brief 各语言的执行次数
     */
    std::map<std::string, int64_t> per_language;

    int64_t distinct_users = 0;

    /**
     * @brief 当天执行过的用户，区间汇总时按用户去重
     */
    std::set<std::string> users;

    /**
     * @return 成功率百分比，没有执行时为 0
     */
    double success_rate() const;
};

/**
 * @brief 离线统计每日执行情况
 * 只读取执行记录，不修改。同一天重复统计会重新计算并覆盖之前的结果。
 */
struct statistics_collector {
    explicit statistics_collector(const execution_store &store);

    /**
     * @brief 统计某一天已经结束的执行，写入（或覆盖）当天的统计行
     */
    daily_statistics collect_daily(int64_t day);

    std::optional<daily_statistics> get(int64_t day) const;

    /**
     * @brief 汇总 [from, to] 之间已经统计过的每日数据，用于周报等区间视图
     * 平均执行时间按执行次数加权，distinct_users 为区间内去重后的用户数
     */
    daily_statistics summarize(int64_t from, int64_t to) const;

    /**
     * @brief 所有统计行，按日期升序
     */
    std::vector<daily_statistics> rows() const;

    void restore(const std::vector<daily_statistics> &rows);

private:
    const execution_store &store;
    mutable std::mutex mut;
    std::map<int64_t, daily_statistics> statistics;
};

void to_json(nlohmann::json &j, const daily_statistics &stats);
void from_json(const nlohmann::json &j, daily_statistics &stats);

}  // namespace sandbox

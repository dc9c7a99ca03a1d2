#pragma once

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "environment/registry.hpp"
#include "execution/store.hpp"
#include "grading/grader.hpp"
#include "quota/quota.hpp"
#include "sandbox/runner.hpp"
#include "service/catalog.hpp"
#include "service/code_filter.hpp"
#include "stats/statistics.hpp"
#include "worker.hpp"

namespace sandbox {

/**
 * @brief 一次执行请求
 */
struct submission {
    std::string user_id;

    /**
     * @brief 运行环境 id，也可以是 "language" 或 "language:version"。
     * 练习题提交可以留空，使用练习题的运行环境
     */
    std::string environment_id;

    std::string source_code;
    std::string stdin_input;
    std::vector<std::string> argv;
    std::map<std::string, std::string> env_vars;
    std::optional<std::string> exercise_id;

    /**
     * @brief 有 exercise_id 的 playground 提交会被视为 exercise
     */
    execution_kind kind = execution_kind::PLAYGROUND;

    /**
     * @brief 同步等待结果的最长时间，为空时立即返回 QUEUED 的执行记录供轮询。
     * 等待超时不是错误，返回当时的执行记录
     */
    std::optional<std::chrono::milliseconds> wait;

    /**
     * @brief 评分时每产生一个测试结果调用一次，在 worker 线程上调用
     */
    grader::result_callback on_test_result;
};

/**
 * @brief 用户的执行历史
 */
struct execution_history {
    /**
     * @brief 最近的执行，按创建时间降序
     */
    std::vector<execution> executions;

    int64_t total = 0;
    int64_t successful = 0;
    int64_t failed = 0;
    double total_time = 0;
    double average_time = 0;
};

/**
 * @brief 沙箱引擎对外的接口
 * 请求线程只做校验、配额检查和入队，沙箱运行和评分在 worker 线程上完成。
 */
struct execution_service {
    execution_service(execution_store &store,
                      environment_registry &environments,
                      sandbox_runner &runner,
                      quota_manager &quota,
                      grader &grading,
                      statistics_collector &statistics,
                      const exercise_catalog &exercises,
                      const user_directory &users,
                      worker_pool &workers,
                      code_filter filter = code_filter());

    /**
     * @brief 提交一次执行
     * 所有校验都在创建容器之前完成，被拒绝的请求不消耗任何资源。
     * @throw validation_error 源代码为空或过大、命中危险代码、运行环境不支持标准输入、练习题不存在
     * @throw environment_not_found 运行环境不存在或不可用
     * @throw quota_exceeded 用户或运行环境的当日配额已用完
     * @throw sandbox_launch_error 服务正在关闭
     */
    execution submit_execution(const submission &request);

    /**
     * @brief 停止执行
     * 正在评分的执行会停止当前的测试点，剩余的测试点标记为 SKIPPED，执行最终为 CANCELLED 并附带已有的评分报告。
     * @return 是否停止了执行，已经结束或已经在停止中的执行返回 false
     * @throw not_found 执行不存在
     * @throw permission_denied 用户不拥有这个执行（管理员除外）
     */
    bool stop_execution(const std::string &user_id, const std::string &execution_id);

    /**
     * @brief 查询执行记录和评分报告
     * @throw not_found 执行不存在
     * @throw permission_denied 用户不拥有这个执行（管理员除外）
     */
    execution get_execution_result(const std::string &user_id, const std::string &execution_id);

    quota_snapshot get_quota_status(const std::string &user_id);

    /**
     * @brief 等待执行（包括评分）结束
     * @throw not_found 执行不存在
     * @throw execution_timeout 超过 timeout 仍未结束
     */
    execution wait_for(const std::string &execution_id, std::chrono::milliseconds timeout);

    /**
     * @param limit 最多返回多少条最近的执行，统计数据总是覆盖全部执行
     */
    execution_history history(const std::string &user_id, std::size_t limit = 20);

    /**
     * @brief 清理超过保留期的执行记录
     * 超过 RETENTION_DAYS 天的终止执行清除容器句柄，超过两倍保留期的执行被删除
     * @return 删除的执行记录数
     */
    std::size_t purge_expired(std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    daily_statistics collect_statistics(int64_t day);

    /**
     * @brief 停止接受新的请求，正在排队的执行被取消，等待 worker 完成手上的任务
     */
    void shutdown();

private:
    execution_store &store;
    environment_registry &environments;
    sandbox_runner &runner;
    quota_manager &quota;
    grader &grading;
    statistics_collector &statistics;
    const exercise_catalog &exercises;
    const user_directory &users;
    worker_pool &workers;
    code_filter filter;

    std::mutex mut;
    std::condition_variable finished;

    /**
     * @brief 已经入队但还没有完成（包括评分）的执行
     */
    std::set<std::string> inflight;
    bool stopping = false;

    /**
     * @brief 正在评分的执行
     */
    struct grading_state {
        /**
         * @brief 当前测试点的派生执行
         */
        std::string child_id;
        bool stop_requested = false;
    };
    std::map<std::string, grading_state> grading_executions;

    void validate(const submission &request) const;
    execution owned(const std::string &user_id, const std::string &execution_id) const;
    void run(const std::string &execution_id, const grader::result_callback &on_test_result);
    void grade(const execution &e, execution_status status, const grader::result_callback &on_test_result);

    /**
     * @return 是否在 timeout 内结束
     */
    bool wait_until_done(const std::string &execution_id, std::chrono::milliseconds timeout);
};

}  // namespace sandbox

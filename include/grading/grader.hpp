#pragma once

#include <functional>
#include <vector>
#include "execution/store.hpp"
#include "grading/compare.hpp"
#include "grading/test_case.hpp"
#include "sandbox/runner.hpp"

namespace sandbox {

/**
 * @brief 测试点评分器
 * 对每个启用的测试点，按 order 依次派生一个独立的 TEST 执行：
 * 源代码为 setup_code、用户代码、test_code、teardown_code 的拼接，标准输入为测试点的输入。
 * 派生执行和普通执行一样经过运行器，因此同样受并发上限约束。
 * 评分结束后派生执行会被删除，只保留 test_result。
 */
struct grader {
    using result_callback = std::function<void(const test_result &)>;

    /**
     * @brief 派生执行入队后、运行前调用，返回 false 表示评分已被停止，这个测试点和之后的都不再运行
     */
    using child_callback = std::function<bool(const std::string &child_id)>;

    grader(execution_store &store, sandbox_runner &runner, grading_policy policy = {});

    /**
     * @brief 用所有启用的测试点为一次提交评分
     * 测试点依次运行。某个派生执行被取消或 on_child 返回 false 后，剩余的测试点标记为 SKIPPED。
     * @param submission 被评分的执行，只使用其中的请求字段
     * @param on_result 每产生一个测试结果就调用一次，用于逐步展示，最终以返回的报告为准
     * @param on_child 调用者通过它得知正在运行的派生执行，以便停止评分
     */
    grade_report grade_all(const execution &submission, std::vector<test_case> tests,
                           const result_callback &on_result = {}, const child_callback &on_child = {});

    /**
     * @brief 为某个测试点拼接派生执行的源代码
     */
    static std::string compose_source(const test_case &tc, const std::string &source);

    const grading_policy &policy() const;

private:
    execution_store &store;
    sandbox_runner &runner;
    grading_policy grading;

    test_result run_test(const execution &submission, const test_case &tc, const child_callback &on_child);
};

}  // namespace sandbox

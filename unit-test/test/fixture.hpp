#pragma once

#include <string>
#include <vector>
#include "environment/registry.hpp"
#include "execution/store.hpp"
#include "grading/test_case.hpp"
#include "sandbox/limiter.hpp"
#include "sandbox/runner.hpp"
#include "sandbox/workspace.hpp"
#include "test/fake_runtime.hpp"

/**
 * 测试用的沙箱
 * 用法：
 * 1. sandbox_fixture sb;
 * 2. sb.runtime.set_program(...) 决定容器的表现
 * 3. string id = sb.enqueue("print(1)");
 * 4. sb.runner.execute(id)
 * 5. check sb.store.get(id)
 */
namespace sandbox::test {

/**
 * @brief python:3.11 测试环境，时间限制 5 秒
 */
execution_environment python_environment();

/**
 * @brief c:12 测试环境，编译型
 */
execution_environment c_environment();

/**
 * @brief 模拟"读入两个整数并输出"的程序
 * 源代码包含 a + b 时输出和，包含 a - b 时输出差，包含 exit(1) 时以 1 退出，否则没有输出。
 */
fake_program sum_program(const container_spec &spec);

/**
 * @brief sum-two-numbers 练习的测试用例：small, negative, large（隐藏）
 */
std::vector<test_case> sum_tests();

struct sandbox_fixture {
    memory_store store;
    environment_registry environments;
    fake_runtime runtime;
    concurrency_limiter limiter;
    workspace_builder builder;
    sandbox_runner runner;

    explicit sandbox_fixture(int global_limit = 4, int environment_limit = 4);

    /**
     * @brief 插入一个 QUEUED 状态的执行
     * @return 执行 id
     */
    std::string enqueue(const std::string &source, const std::string &stdin_input = "",
                        const std::string &user_id = "alice", const std::string &environment_id = "python:3.11");
};

void setup_test_environment();

}  // namespace sandbox::test

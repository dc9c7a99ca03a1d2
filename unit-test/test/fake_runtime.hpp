#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "sandbox/container.hpp"

namespace sandbox::test {

/**
 * @brief 假容器里"运行"的程序的表现
 */
struct fake_program {
    std::string out;
    std::string err;
    int exit_code = 0;

    /**
     * @brief 程序运行多久后退出
     */
    std::chrono::milliseconds duration{0};

    /**
     * @brief 程序永远不会自己退出，只能被 stop
     */
    bool hang = false;

    bool oom_killed = false;
    int64_t memory_peak = 8 << 20;
    double cpu_seconds = 0.01;

    bool fail_create = false;
    bool fail_start = false;
};

/**
 * @brief 按脚本运行的容器运行时
 * 不需要容器守护进程，使得运行器、评分器和服务的测试是确定的。
 * 脚本在 create 时调用，此时工作区已经准备好，脚本可以读取其中的源代码和 .stdin。
 */
struct fake_runtime : container_runtime {
    using script_function = std::function<fake_program(const container_spec &)>;

    fake_runtime();

    /**
     * @brief 之后创建的容器都按 program 运行
     */
    void set_program(const fake_program &program);
    void set_script(script_function script);

    bool available() override;
    std::string create(const container_spec &spec) override;
    void start(const std::string &id) override;
    std::optional<int> wait(const std::string &id, std::chrono::milliseconds timeout) override;
    void stop(const std::string &id, std::chrono::seconds grace) override;
    container_state inspect(const std::string &id) override;
    container_output logs(const std::string &id, std::size_t limit) override;
    container_usage usage(const std::string &id) override;
    bool remove(const std::string &id) override;

    std::vector<container_spec> created() const;
    std::size_t live_containers() const;
    int stop_calls() const;
    int remove_calls() const;

private:
    struct container {
        container_spec spec;
        fake_program program;
        bool started = false;
        bool stopped = false;
        std::chrono::steady_clock::time_point started_at;
    };

    mutable std::mutex mut;
    script_function script;
    std::map<std::string, container> containers;
    std::vector<container_spec> specs;
    int next_id = 0;
    int stops = 0;
    int removes = 0;

    /**
     * @brief 调用方必须持有 mut
     */
    std::optional<int> exit_code_of(const container &c) const;
};

/**
 * @brief 按 limit 截断输出
 */
std::string truncate_to(const std::string &text, std::size_t limit, bool &truncated);

}  // namespace sandbox::test

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include "environment/registry.hpp"
#include "execution/store.hpp"
#include "sandbox/container.hpp"
#include "sandbox/limiter.hpp"
#include "sandbox/workspace.hpp"

namespace sandbox {

/**
 * @brief 一次沙箱运行的结果
 */
struct execution_result {
    std::string stdout_output;
    std::string stderr_output;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    std::optional<int> exit_code;
    double wall_time = 0;
    double cpu_time = 0;
    int64_t memory_used = 0;
    execution_status status = execution_status::PENDING;
    std::string error_message;

    static execution_result of(const execution &e);
};

/**
 * @brief 沙箱运行器
 * 负责一次执行从 QUEUED 到终止状态的全部过程：
 * 1. 等待并发名额，期间保持 QUEUED，可以被停止
 * 2. 转移到 RUNNING，准备工作区
 * 3. 创建容器并立即记录容器 id，启动容器
 * 4. 在 worker 线程上等待容器结束，超时则先 SIGTERM 后 SIGKILL，标记为 TIMEOUT
 * 5. 收集退出码、stdout/stderr（分别截断并追加截断标记）、内存峰值和 CPU 时间
 * 6. 无论结果如何都删除容器和工作区
 * 7. 将所有结果写回执行记录
 *
 * 用户程序崩溃不是错误，只是非零退出码；只有宿主侧的故障才会进入 FAILED 或 ERROR。
 */
struct sandbox_runner {
    sandbox_runner(execution_store &store,
                   const environment_registry &environments,
                   container_runtime &runtime,
                   concurrency_limiter &limiter,
                   const workspace_builder &builder);

    /**
     * @brief 运行一个处于 QUEUED 状态的执行
     * 这个函数会阻塞直到执行进入终止状态，必须在 worker 线程上调用。
     * 不会抛出异常，所有错误都记录在执行记录的状态和 error_message 中。
     * @param finalize 为 false 时，容器正常结束后结果写入记录但状态保持 RUNNING，
     * 返回的 status 是应当转移到的终止状态，调用者负责完成转移。宿主侧故障和停止仍然直接进入终止状态
     * @return 执行结束后的结果，如果执行不是 QUEUED 状态，直接返回当前记录的结果
     */
    execution_result execute(const std::string &execution_id, bool finalize = true);

    /**
     * @brief 停止执行
     * 只有 QUEUED 和 RUNNING 状态的执行可以被停止。可以和 execute 的超时处理并发调用，
     * 可以重复调用：容器已经被删除不是错误。
     * @return 是否由这次调用把执行转移到了 CANCELLED
     */
    bool stop(const std::string &execution_id);

    /**
     * @brief 根据执行记录和运行环境生成容器配置
     */
    container_spec make_spec(const execution &e, const execution_environment &env, const std::filesystem::path &workspace) const;

private:
    execution_store &store;
    const environment_registry &environments;
    container_runtime &runtime;
    concurrency_limiter &limiter;
    const workspace_builder &builder;

    void teardown(const std::string &execution_id, const std::string &container_id);
    void fail(const std::string &execution_id, execution_status status, const std::string &message);
    execution_status current_status(const std::string &execution_id) const;
    execution_result result_of(const std::string &execution_id) const;
};

}  // namespace sandbox

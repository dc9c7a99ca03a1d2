#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <chrono>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace sandbox {

/**
 * @brief 沙箱引擎所有系统级错误的基类
 * 用户程序崩溃、超时、内存超限都不是异常，而是 execution_status，
 * 只有引擎自己无法完成请求时才抛出 sandbox_exception
 */
struct sandbox_exception : std::exception {
    sandbox_exception();
    explicit sandbox_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const sandbox_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 请求不合法：源代码为空，或者命中了危险代码模式
 * 在创建任何容器之前就会被拒绝，不消耗资源
 */
struct validation_error : public sandbox_exception {
    explicit validation_error(const std::string &message);
};

/**
 * @brief 找不到可用的运行环境（不存在或者不是 active 状态）
 * 用户可以通过更换语言或版本来修正
 */
struct environment_not_found : public sandbox_exception {
    explicit environment_not_found(const std::string &message);
};

/**
 * @brief 工作目录准备失败，通常是磁盘写满或者权限问题
 * 属于基础设施故障，调用方可以重试
 */
struct workspace_error : public sandbox_exception {
    explicit workspace_error(const std::string &message);
};

/**
 * @brief 用户或运行环境的当日配额已用完
 * 在配额重置前重试没有意义
 */
struct quota_exceeded : public sandbox_exception {
    quota_exceeded(const std::string &message, std::chrono::seconds retry_after);

    /**
     * @brief 距离配额重置还有多久
     */
    std::chrono::seconds retry_after;
};

/**
 * @brief 容器无法启动（比如容器守护进程不可用）
 * 不会自动重试，因为用户代码可能已经部分执行
 */
struct sandbox_launch_error : public sandbox_exception {
    explicit sandbox_launch_error(const std::string &message);
};

/**
 * @brief 调用方等待执行结果时超过了自己的截止时间
 * 沙箱自身的超时通过 execution_status::TIMEOUT 表示，不会抛出这个异常
 */
struct execution_timeout : public sandbox_exception {
    explicit execution_timeout(const std::string &message);
};

/**
 * @brief 宿主侧的执行逻辑出现未预期的错误
 * 和用户程序崩溃不同，用户程序崩溃只是非零的退出码
 */
struct execution_error : public sandbox_exception {
    explicit execution_error(const std::string &message);
};

/**
 * @brief 调用方不是该执行记录的所有者
 */
struct permission_denied : public sandbox_exception {
    explicit permission_denied(const std::string &message);
};

/**
 * @brief 执行记录处于不允许该操作的状态，比如停止一个已经结束的执行
 */
struct invalid_state : public sandbox_exception {
    explicit invalid_state(const std::string &message);
};

/**
 * @brief 找不到对应的执行记录
 */
struct not_found : public sandbox_exception {
    explicit not_found(const std::string &message);
};

}  // namespace sandbox

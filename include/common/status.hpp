#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace sandbox {

/**
 * @brief 一次代码执行的生命周期状态
 * 状态只能沿着 PENDING -> QUEUED -> RUNNING -> 终止状态 单向转移，
 * 进入终止状态后执行记录除了清理字段外不再改变。
 */
enum class execution_status {
    /**
     * @brief 执行记录刚刚创建，还未通过配额检查
     */
    PENDING = 0,

    /**
     * @brief 已经通过配额检查，正在等待空闲的 worker 和并发名额
     */
    QUEUED = 1,

    /**
     * @brief 容器已经启动，用户程序正在运行
     */
    RUNNING = 2,

    /**
     * @brief 用户程序正常结束
     * 注意退出码可以非零，用户程序崩溃也是 COMPLETED，崩溃信息保存在 stderr 中
     */
    COMPLETED = 3,

    /**
     * @brief 容器无法启动
     */
    FAILED = 4,

    /**
     * @brief 超出时钟时间限制或者 CPU 时间限制
     */
    TIMEOUT = 5,

    /**
     * @brief 容器因为内存超限被内核杀死
     */
    MEMORY_LIMIT_EXCEEDED = 6,

    /**
     * @brief 调用方主动停止
     */
    CANCELLED = 7,

    /**
     * @brief 宿主侧逻辑出现内部错误
     */
    ERROR = 8
};

/**
 * @brief 单个测试点的评测结果
 */
enum class test_status {
    PASSED = 0,
    FAILED = 1,
    ERROR = 2,
    TIMEOUT = 3,
    MEMORY_EXCEEDED = 4,
    SKIPPED = 5
};

bool is_terminal(execution_status status);

/**
 * @brief 检查状态转移是否合法
 * 合法的转移只有 PENDING->QUEUED, QUEUED->RUNNING, QUEUED->CANCELLED,
 * QUEUED->FAILED, QUEUED->ERROR，以及 RUNNING->任意终止状态
 */
bool can_transition(execution_status from, execution_status to);

const char *get_display_message(execution_status status);

const char *get_display_message(test_status status);

/**
 * @brief 面向学习者的提示信息
 * 超时和崩溃要区分开，不能都显示成“程序出错”
 */
std::string get_user_message(execution_status status, int exit_code);

void to_json(nlohmann::json &j, const execution_status &status);
void from_json(const nlohmann::json &j, execution_status &status);
void to_json(nlohmann::json &j, const test_status &status);
void from_json(const nlohmann::json &j, test_status &status);

}  // namespace sandbox

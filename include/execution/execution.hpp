#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "grading/test_case.hpp"

namespace sandbox {

/**
 * @brief 执行的来源
 */
enum class execution_kind {
    /**
     * @brief 代码练习场的临时运行
     */
    PLAYGROUND,

    /**
     * @brief 练习题的提交，需要评分
     */
    EXERCISE,

    /**
     * @brief 测验中的运行
     */
    ASSESSMENT,

    /**
     * @brief 评分时为每个测试点派生的执行，评分结束后删除
     */
    TEST,

    DEBUG
};

/**
 * @brief 一次代码执行请求及其结果
 * 状态只能单向转移，进入终止状态后除了 container_id 外不再修改。
 */
struct execution {
    std::string id;

    /**
     * @brief 提交这次执行的用户，只有该用户能查看和停止这次执行
     */
    std::string user_id;

    std::string environment_id;

    /**
     * @brief 运行环境的语言，用于统计
     */
    std::string language;

    execution_kind kind = execution_kind::PLAYGROUND;

    std::string source_code;
    std::string stdin_input;
    std::vector<std::string> argv;
    std::map<std::string, std::string> env_vars;

    /**
     * @brief 如果是练习题提交，为练习题 id
     */
    std::optional<std::string> exercise_id;

    /**
     * @brief 对于评分派生的执行，为被评分的执行 id
     */
    std::optional<std::string> parent_id;

    /**
     * @brief 覆盖运行环境的时间限制（秒）和内存限制（MB）
     */
    std::optional<int> timeout_override;
    std::optional<int> memory_override;

    std::string stdout_output;
    std::string stderr_output;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    std::optional<int> exit_code;

    /**
     * @brief 墙上时钟时间，单位为秒
     */
    double execution_time = 0;

    /**
     * @brief CPU 时间，单位为秒
     */
    double cpu_time = 0;

    /**
     * @brief 内存使用峰值，单位为字节
     */
    int64_t memory_used = 0;

    execution_status status = execution_status::PENDING;

    /**
     * @brief 容器 id，容器启动后立即记录，以便并发的停止请求能找到容器
     */
    std::string container_id;

    /**
     * @brief 宿主侧错误信息，用户程序的错误在 stderr_output 中
     */
    std::string error_message;

    /**
     * @brief 评分报告，只有练习题提交才有
     */
    std::optional<grade_report> grade;

    std::chrono::system_clock::time_point created_at;
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::optional<std::chrono::system_clock::time_point> completed_at;

    /**
     * @brief 用户程序是否正常结束并返回 0
     */
    bool success() const;
};

const char *get_display_message(execution_kind kind);

void to_json(nlohmann::json &j, const execution_kind &kind);
void from_json(const nlohmann::json &j, execution_kind &kind);
void to_json(nlohmann::json &j, const execution &e);
void from_json(const nlohmann::json &j, execution &e);

}  // namespace sandbox

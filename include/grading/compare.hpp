#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include "grading/test_case.hpp"
#include "sandbox/runner.hpp"

namespace sandbox {

/**
 * @brief 评分策略参数，从 grading.json 加载
 */
struct grading_policy {
    /**
     * @brief similarity 模式下，相似度达到该值即通过
     */
    double pass_threshold = 0.9;

    /**
     * @brief 未通过但相似度超过该值时按相似度给部分分
     */
    double partial_credit_cutoff = 0.5;
};

/**
 * @brief 按 Ratcliff/Obershelp 算法计算两个字符串的相似度
 * 结果为 2 * M / (|a| + |b|)，M 为递归找到的最长公共子串的总长度。
 * 两个字符串都为空时返回 1。
 * 字符串很长时退化为按行比较，避免平方级别的开销。
 */
double similarity_ratio(std::string_view a, std::string_view b);

/**
 * @brief 按比较方式规范化输出
 * strict 保持原样；ignore_whitespace 将连续空白合并为一个空格并去掉首尾空白；
 * ignore_case 转为小写并去掉首尾空白；similarity 合并空白。
 */
std::string normalize(const std::string &text, matching_mode mode);

/**
 * @brief 生成期望输出和实际输出的逐行差异
 * 格式为 unified diff 的行体："  " 表示相同，"- " 表示期望有而实际没有，"+ " 表示实际多出
 * @param max_lines 两边行数乘积超过该值的平方时，只比较前 max_lines 行
 */
std::string line_diff(const std::string &expected, const std::string &actual, std::size_t max_lines = 500);

/**
 * @brief 根据一次测试运行的结果为测试点评分
 * 依次检查：运行状态、退出码、stderr 子串、输出比较。
 * 不会抛出异常，也不修改执行记录。
 */
test_result evaluate(const test_case &tc, const execution_result &result, const grading_policy &policy);

void from_json(const nlohmann::json &j, grading_policy &policy);
void to_json(nlohmann::json &j, const grading_policy &policy);

}  // namespace sandbox

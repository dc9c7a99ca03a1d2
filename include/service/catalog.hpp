#pragma once

#include <nlohmann/json.hpp>
#include <filesystem>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include "grading/test_case.hpp"
#include "quota/quota.hpp"

namespace sandbox {

/**
 * @brief 练习题：运行环境和一组测试点
 */
struct exercise {
    std::string id;
    std::string title;

    /**
     * @brief 提交时未指定运行环境则使用这个环境
     */
    std::string environment_id;

    std::vector<test_case> tests;
};

/**
 * @brief 练习题目录，由课程子系统提供
 */
struct exercise_catalog {
    virtual ~exercise_catalog();

    virtual std::optional<exercise> find(const std::string &exercise_id) const = 0;
};

/**
 * @brief 用户目录，由用户子系统提供，决定用户的配额等级
 */
struct user_directory {
    virtual ~user_directory();

    /**
     * @brief 未知用户为 free 等级
     */
    virtual user_tier tier_of(const std::string &user_id) const = 0;
};

/**
 * @brief 从 exercises.json 加载的练习题目录
 * 格式为 [{"id": ..., "environment": ..., "tests": [...]}]
 */
struct json_exercise_catalog : exercise_catalog {
    json_exercise_catalog() = default;
    explicit json_exercise_catalog(const std::filesystem::path &path);

    /**
     * @throw std::invalid_argument 如果测试点名称在同一个练习题内重复
     */
    void add(exercise ex);
    void load(const nlohmann::json &j);

    std::optional<exercise> find(const std::string &exercise_id) const override;

private:
    mutable std::shared_mutex mut;
    std::map<std::string, exercise> exercises;
};

/**
 * @brief 从 users.json 加载的用户等级，格式为 {"user id": "tier"}
 */
struct json_user_directory : user_directory {
    json_user_directory() = default;
    explicit json_user_directory(const std::filesystem::path &path);

    void set_tier(const std::string &user_id, user_tier tier);
    void load(const nlohmann::json &j);

    user_tier tier_of(const std::string &user_id) const override;

private:
    mutable std::shared_mutex mut;
    std::map<std::string, user_tier> tiers;
};

void from_json(const nlohmann::json &j, exercise &ex);
void to_json(nlohmann::json &j, const exercise &ex);

}  // namespace sandbox

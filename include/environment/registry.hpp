#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>
#include "environment/environment.hpp"
#include "environment/language_strategy.hpp"

namespace sandbox {

/**
 * @brief 运行环境目录
 * 只读为主，管理员可以在运行时修改运行环境的状态。
 * 查询接口都返回副本，调用方持有的运行环境不受后续修改影响。
 */
struct environment_registry {
    explicit environment_registry(std::shared_ptr<strategy_registry> strategies = std::make_shared<strategy_registry>());

    /**
     * @brief 添加运行环境
     * @throw std::invalid_argument 如果 (language, version) 或 id 已经存在，
     * 或者语言没有注册构建运行策略，或者命令模板不合法
     */
    void add(const execution_environment &env);

    /**
     * @brief 从 environments.json 加载运行环境，文件内容为运行环境的数组
     */
    void load(const nlohmann::json &j);
    void load(const std::filesystem::path &path);

    /**
     * @brief 查找最匹配的运行环境
     * 如果指定了版本并且该版本可用，返回该版本；否则返回该语言可用的默认环境中 priority 最高的。
     * 没有默认环境时，退化为该语言可用环境中 priority 最高的。
     * @throw environment_not_found 如果该语言没有可用的运行环境
     */
    execution_environment resolve(const std::string &language, const std::optional<std::string> &version = std::nullopt) const;

    /**
     * @brief 根据运行环境 id 查找
     * id 可以是完整的 id（比如 python:3.11），也可以只有语言名（比如 python），此时等价于 resolve(language)
     * @throw environment_not_found 如果找不到或者运行环境不可用
     */
    execution_environment get(const std::string &environment_id) const;

    std::set<feature> list_features(const execution_environment &env) const;

    /**
     * @brief 所有可用运行环境的语言，按字典序排列
     */
    std::vector<std::string> languages() const;

    /**
     * @brief 每种语言的默认运行环境
     */
    std::vector<execution_environment> defaults() const;

    /**
     * @brief 可用的运行环境，按 priority 降序、语言、版本排序
     * @param required 如果指定，只返回支持该特性的运行环境
     */
    std::vector<execution_environment> list(const std::optional<feature> &required = std::nullopt) const;

    /**
     * @brief 修改运行环境状态，比如维护时暂时下线
     * @throw environment_not_found 如果运行环境不存在
     */
    void set_status(const std::string &environment_id, environment_status status);

    /**
     * @brief 运行环境对应的构建运行策略
     * @throw environment_not_found 如果语言没有注册策略
     */
    std::shared_ptr<const language_strategy> strategy_for(const execution_environment &env) const;

private:
    std::shared_ptr<strategy_registry> strategies;
    mutable std::shared_mutex mut;
    std::map<std::string, execution_environment> environments;

    std::vector<execution_environment> active_of(const std::string &language) const;
};

}  // namespace sandbox

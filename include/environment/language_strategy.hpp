#pragma once

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include "environment/environment.hpp"

namespace sandbox {

/**
 * @brief 表示一种语言的构建和运行方式
 * 具体的命令由运行环境的命令模板提供，策略只决定需要哪些步骤。
 * 新增语言只需要注册一个策略，不需要修改沙箱运行器。
 */
struct language_strategy {
    virtual ~language_strategy();

    /**
     * @brief 策略名称，用于日志
     */
    virtual std::string name() const = 0;

    /**
     * @brief 构建步骤的命令
     * @return 渲染好的编译命令，不需要编译时返回 nullopt
     * @throw std::invalid_argument 如果命令模板不合法
     */
    virtual std::optional<std::string> build_step(const execution_environment &env) const = 0;

    /**
     * @brief 运行步骤的命令，用户的 argv 会追加在这个命令之后
     * @throw std::invalid_argument 如果命令模板不合法
     */
    virtual std::string run_step(const execution_environment &env) const = 0;

    /**
     * @brief 生成容器入口脚本 run.sh 的内容
     * 脚本先执行构建步骤，构建失败时以编译器的退出码退出，
     * 然后将 .stdin 重定向为用户程序的标准输入并执行运行步骤。
     */
    std::string entry_script(const execution_environment &env) const;
};

/**
 * @brief 解释型语言，直接运行源代码
 */
struct interpreted_strategy : language_strategy {
    std::string name() const override;
    std::optional<std::string> build_step(const execution_environment &env) const override;
    std::string run_step(const execution_environment &env) const override;
};

/**
 * @brief 编译型语言，先编译再运行编译产物
 */
struct compiled_strategy : language_strategy {
    std::string name() const override;
    std::optional<std::string> build_step(const execution_environment &env) const override;
    std::string run_step(const execution_environment &env) const override;
};

/**
 * @brief 渲染命令模板，替换 {source}、{binary}、{workdir} 占位符
 * @throw std::invalid_argument 如果模板中有未知的占位符或者括号不匹配
 */
std::string render_command(const std::string &tmpl, const execution_environment &env);

/**
 * @brief 语言到构建运行策略的映射
 * 内置了常见语言的策略，可以通过 register_strategy 追加新的语言。
 * 这个类可以并发访问。
 */
struct strategy_registry {
    strategy_registry();

    void register_strategy(const std::string &language, std::shared_ptr<const language_strategy> strategy);

    /**
     * @brief 查找语言对应的策略
     * @return 策略，语言没有注册时返回空指针
     */
    std::shared_ptr<const language_strategy> find(const std::string &language) const;

private:
    mutable std::shared_mutex mut;
    std::map<std::string, std::shared_ptr<const language_strategy>> strategies;
};

}  // namespace sandbox

#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

/**
 * 这个头文件包含运行环境的描述
 * 运行环境由管理员通过 environments.json 配置，运行时基本只读。
 * 一个运行环境对应一个容器镜像，以及这个镜像里编译、运行用户代码的命令模板，
 * 命令模板中可以使用以下占位符：
 * {source}: 用户代码的文件名，比如 main.py
 * {binary}: 编译产物的文件名，为 source 去掉扩展名，比如 main
 * {workdir}: 工作区在容器内的挂载路径
 */
namespace sandbox {

enum class environment_status {
    ACTIVE,
    MAINTENANCE,
    DEPRECATED,
    DISABLED
};

/**
 * @brief 运行环境支持的特性
 */
enum class feature {
    STDIN,
    NETWORKING,
    FILE_IO,
    GRAPHICS
};

struct execution_environment {
    /**
     * @brief 运行环境的 id，未配置时为 language:version，比如 python:3.11
     */
    std::string id;

    /**
     * @brief 显示给用户的名称，比如 Python 3.11
     */
    std::string name;

    std::string language, version;

    /**
     * @brief 容器镜像，比如 python:3.11-slim
     */
    std::string image;

    /**
     * @brief 墙上时钟时间限制，单位为秒
     */
    int default_timeout = 30;

    /**
     * @brief 内存限制，单位为 MB
     */
    int max_memory = 128;

    /**
     * @brief CPU 时间限制，单位为秒
     */
    int max_cpu_time = 10;

    /**
     * @brief 用户程序能写出的单个文件的大小上限，单位为 MB
     */
    int max_file_size = 10;

    /**
     * @brief stdout 和 stderr 各自保留的最大字节数
     */
    std::size_t max_output_size = 64 * 1024;

    /**
     * @brief 容器能使用的 CPU 核心数，换算为 CFS 的 quota/period
     */
    double cpu_cores = 1.0;

    bool supports_input = true;
    bool supports_networking = false;
    bool supports_file_operations = true;
    bool supports_graphics = false;

    /**
     * @brief 编译命令模板，解释型语言为空
     */
    std::string compile_command;

    /**
     * @brief 运行命令模板
     */
    std::string run_command;

    /**
     * @brief 用户代码保存的文件名，比如 main.py，Java 需要 Main.java
     */
    std::string source_file;

    /**
     * @brief 需要一起放进工作区的脚手架文件，文件名到文件内容
     * 比如 Node.js 的 package.json
     */
    std::map<std::string, std::string> scaffold_files;

    /**
     * @brief 白名单中的模块即使出现在 blocked_imports 中也允许使用
     */
    std::vector<std::string> allowed_imports;
    std::vector<std::string> blocked_imports;
    std::vector<std::string> blocked_functions;

    environment_status status = environment_status::ACTIVE;

    /**
     * @brief 是否为该语言的默认版本
     */
    bool is_default = false;

    /**
     * @brief 同一语言有多个默认版本时，选择 priority 最高的
     */
    int priority = 0;

    /**
     * @brief 该运行环境每天最多执行多少次（所有用户共享），-1 表示不限制
     */
    int64_t daily_execution_cap = -1;

    /**
     * @brief 该运行环境同时运行的执行数上限，0 表示使用全局配置 MAX_CONCURRENT_PER_ENVIRONMENT
     */
    int max_concurrent = 0;

    /**
     * @brief 编译产物的文件名，为 source_file 去掉扩展名
     */
    std::string binary_file() const;

    std::set<feature> features() const;

    bool is_active() const;
};

const char *get_display_message(environment_status status);
const char *get_display_message(feature f);

void to_json(nlohmann::json &j, const environment_status &status);
void from_json(const nlohmann::json &j, environment_status &status);
void to_json(nlohmann::json &j, const feature &f);
void from_json(const nlohmann::json &j, feature &f);

void to_json(nlohmann::json &j, const execution_environment &env);
void from_json(const nlohmann::json &j, execution_environment &env);

}  // namespace sandbox

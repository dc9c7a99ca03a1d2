#pragma once

#include <filesystem>
#include <string>
#include "environment/environment.hpp"
#include "environment/language_strategy.hpp"
#include "execution/execution.hpp"

namespace sandbox {

/**
 * @brief 一次执行独占的工作区
 * 工作区是容器唯一能看到的宿主机目录。句柄析构时无条件删除工作区，
 * 无论执行成功、失败还是被取消。
 */
struct workspace_handle {
    workspace_handle();
    explicit workspace_handle(const std::filesystem::path &dir);
    workspace_handle(workspace_handle &&other);
    workspace_handle &operator=(workspace_handle &&other);
    ~workspace_handle();

    workspace_handle(const workspace_handle &) = delete;
    workspace_handle &operator=(const workspace_handle &) = delete;

    const std::filesystem::path &path() const;

    /**
     * @brief 立即删除工作区，可以重复调用
     */
    void release();

private:
    std::filesystem::path dir;
};

/**
 * @brief 准备工作区
 *
 * 工作区的文件结构：
 * WORK_DIR/[uuid]
 * ├── main.py // 用户代码，文件名为运行环境的 source_file
 * ├── .stdin // 用户程序的标准输入
 * ├── run.sh // 容器入口脚本
 * └── ... // 运行环境的脚手架文件
 */
struct workspace_builder {
    /**
     * @param root 存放所有工作区的目录
     * @param owner_uid 工作区交给沙箱用户，容器内的非 root 用户才能写入编译产物
     */
    workspace_builder(const std::filesystem::path &root, int owner_uid, int owner_gid);

    /**
     * @brief 为执行创建工作区并写入源代码、标准输入、入口脚本和脚手架文件
     * @throw workspace_error 如果磁盘已满或者无法写入
     */
    workspace_handle prepare(const execution &e, const execution_environment &env, const language_strategy &strategy) const;

private:
    std::filesystem::path root;
    int owner_uid, owner_gid;
};

}  // namespace sandbox

#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "sandbox/container.hpp"

namespace sandbox {

/**
 * @brief 通过 docker 命令行管理容器
 * 每个操作都是一次 docker 子命令调用，参数直接传给 execvp，不经过 shell 转义。
 * 资源使用情况直接从 cgroup 文件系统读取，同时支持 cgroup v1 和 v2。
 */
struct docker_runtime : container_runtime {
    /**
     * @param binary docker 命令行程序，可以是 podman 等兼容的程序
     * @param cgroup_root cgroup 文件系统的挂载点
     */
    explicit docker_runtime(const std::string &binary = "docker", const std::filesystem::path &cgroup_root = "/sys/fs/cgroup");

    bool available() override;
    std::string create(const container_spec &spec) override;
    void start(const std::string &id) override;
    std::optional<int> wait(const std::string &id, std::chrono::milliseconds timeout) override;
    void stop(const std::string &id, std::chrono::seconds grace) override;
    container_state inspect(const std::string &id) override;
    container_output logs(const std::string &id, std::size_t limit) override;
    container_usage usage(const std::string &id) override;
    bool remove(const std::string &id) override;

    /**
     * @brief 生成 docker create 的参数列表（不含 docker 本身）
     */
    static std::vector<std::string> create_arguments(const container_spec &spec);

private:
    std::string binary;
    std::filesystem::path cgroup_root;
};

}  // namespace sandbox

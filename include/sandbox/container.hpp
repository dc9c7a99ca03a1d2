#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sandbox {

/**
 * @brief 创建容器所需的全部配置
 */
struct container_spec {
    std::string image;

    /**
     * @brief 容器的启动命令
     */
    std::vector<std::string> command;

    /**
     * @brief 宿主机上的工作区，以读写方式挂载到 mount_path
     */
    std::filesystem::path workspace;
    std::string mount_path;

    std::map<std::string, std::string> env;
    std::map<std::string, std::string> labels;

    /**
     * @brief 内存硬上限，单位为字节，同时作为内存加交换分区的上限
     */
    int64_t memory_bytes = 0;

    /**
     * @brief CFS 调度周期和配额（微秒），quota / period 为可用的核心数
     */
    int64_t cpu_period = 100000;
    int64_t cpu_quota = 100000;

    /**
     * @brief CPU 时间上限（秒），超出后内核发送 SIGXCPU
     */
    int cpu_time_limit = 0;

    /**
     * @brief 单个文件大小上限，单位为字节
     */
    int64_t file_size_bytes = 0;

    int pids_limit = 64;

    /**
     * @brief /tmp 的 tmpfs 大小，单位为 MB
     */
    int tmpfs_mb = 10;

    /**
     * @brief 是否允许访问网络，不允许时容器位于独立的网络命名空间中
     */
    bool network = false;

    /**
     * @brief 容器内运行的用户，格式为 uid:gid
     */
    std::string user;

    /**
     * @brief 保留的能力，其余全部丢弃
     */
    std::vector<std::string> capabilities;
};

/**
 * @brief 容器结束后的状态
 */
struct container_state {
    bool running = false;
    bool oom_killed = false;
    std::optional<int> exit_code;
};

/**
 * @brief 容器的输出，stdout 和 stderr 分别截断
 */
struct container_output {
    std::string out, err;
    bool out_truncated = false;
    bool err_truncated = false;
};

/**
 * @brief 容器的资源使用情况
 */
struct container_usage {
    /**
     * @brief 内存使用峰值，单位为字节
     */
    int64_t memory_peak = 0;

    /**
     * @brief 累计 CPU 时间，单位为秒
     */
    double cpu_seconds = 0;
};

/**
 * @brief 容器运行时
 * 沙箱运行器通过这个接口管理容器的生命周期，生产环境使用 docker_runtime，
 * 单元测试使用脚本化的假运行时。
 * 所有操作都可以并发调用；停止和删除是幂等的，容器已经不存在不是错误。
 */
struct container_runtime {
    virtual ~container_runtime();

    /**
     * @brief 检查容器运行时是否可用
     */
    virtual bool available() = 0;

    /**
     * @brief 创建容器但不启动
     * @return 容器 id
     * @throw sandbox_launch_error 如果容器无法创建，比如镜像不存在或者守护进程不可用
     */
    virtual std::string create(const container_spec &spec) = 0;

    /**
     * @throw sandbox_launch_error 如果容器无法启动
     */
    virtual void start(const std::string &id) = 0;

    /**
     * @brief 等待容器结束
     * @param timeout 最多等待多久
     * @return 容器的退出码，如果超过 timeout 仍未结束则返回 nullopt
     * @throw execution_error 如果无法查询容器状态
     */
    virtual std::optional<int> wait(const std::string &id, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief 停止容器，先发送 SIGTERM，grace 之后仍未结束则发送 SIGKILL
     * 容器已经结束或者不存在时什么也不做
     */
    virtual void stop(const std::string &id, std::chrono::seconds grace) = 0;

    /**
     * @throw execution_error 如果无法查询容器状态
     */
    virtual container_state inspect(const std::string &id) = 0;

    /**
     * @brief 读取容器的 stdout 和 stderr
     * @param limit stdout 和 stderr 各自最多保留的字节数
     * @throw execution_error 如果无法读取容器输出
     */
    virtual container_output logs(const std::string &id, std::size_t limit) = 0;

    /**
     * @brief 读取容器当前的资源使用情况，读不到时返回 0
     */
    virtual container_usage usage(const std::string &id) = 0;

    /**
     * @brief 强制删除容器
     * @return 容器是否真的被删除，容器已经不存在时返回 false
     */
    virtual bool remove(const std::string &id) = 0;
};

}  // namespace sandbox

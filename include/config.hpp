#pragma once

#include <filesystem>
#include <string>

namespace sandbox {

/**
 * @brief 每次执行的工作区根目录
 * 每个执行记录独占一个子目录，执行结束后无论结果如何都会被删除
 *
 * WORK_DIR
 * ├── 6f1c... // 随机生成的 uuid
 * │   ├── main.py // 用户代码，文件名由执行环境的 source_file 决定
 * │   ├── .stdin // 用户程序的标准输入
 * │   ├── run.sh // 容器的入口脚本，先编译（如果需要）再运行
 * │   └── ... // 执行环境要求的脚手架文件，比如 package.json
 * └── ...
 */
extern std::filesystem::path WORK_DIR;

/**
 * @brief 容器运行时的命令行程序，默认为 PATH 中的 docker
 */
extern std::string CONTAINER_RUNTIME;

/**
 * @brief 工作区在容器内的挂载路径
 */
extern std::string CONTAINER_WORKDIR;

/**
 * @brief 容器内运行用户程序的非特权用户，默认为 nobody
 */
extern int SANDBOX_UID;
extern int SANDBOX_GID;

/**
 * @brief 停止容器时，发送 SIGTERM 之后等待多少秒再发送 SIGKILL
 */
extern int STOP_GRACE_PERIOD;

/**
 * @brief 容器内最多允许同时存在的进程数
 * 编译型语言需要 shell、编译器和用户程序同时存在，因此不能设置为 1
 */
extern int PIDS_LIMIT;

/**
 * @brief /tmp 的 tmpfs 大小（MB）
 */
extern int TMPFS_SIZE;

/**
 * @brief 全局同时运行的执行数上限
 */
extern int MAX_CONCURRENT_EXECUTIONS;

/**
 * @brief 执行环境没有单独配置时，单个执行环境同时运行的执行数上限
 */
extern int MAX_CONCURRENT_PER_ENVIRONMENT;

/**
 * @brief 后台 worker 线程数
 */
extern int WORKER_THREADS;

/**
 * @brief 输出被截断时追加在末尾的标记
 */
extern std::string TRUNCATION_MARKER;

/**
 * @brief 执行记录保留天数
 * 超过保留期的终止执行会清除容器句柄，超过两倍保留期的执行记录会被删除
 */
extern int RETENTION_DAYS;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，守护进程将输出完整的容器命令行。
 */
extern bool DEBUG;

}  // namespace sandbox

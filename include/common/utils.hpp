#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sandbox {

/**
 * @brief 外部命令的执行结果
 */
struct process_result {
    /**
     * @brief 外部命令的返回值，如果外部命令因为信号崩溃而没有返回码，则为 -1
     */
    int exit_code = -1;

    /**
     * @brief 外部命令的标准输出，最多保留 output_limit 字节
     */
    std::string out;

    /**
     * @brief 外部命令的标准错误输出，最多保留 output_limit 字节
     */
    std::string err;

    bool out_truncated = false;
    bool err_truncated = false;

    /**
     * @brief 外部命令是否因为超出 timeout 而被杀死
     */
    bool timed_out = false;
};

/**
 * @brief 执行外部命令并收集 stdout 和 stderr
 * @param argv 外部命令的路径 (argv[0]) 和 参数 (argv)
 * @param input 写入外部命令 stdin 的内容
 * @param timeout 外部命令运行的最长时间，超过后会发送 SIGKILL
 * @param output_limit stdout/stderr 各自最多保留多少字节，超出部分会被读出并丢弃
 * @throw std::system_error 如果 fork 或者 pipe 失败
 */
process_result capture_process(const std::vector<std::string> &argv,
                               const std::string &input = "",
                               std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                               std::size_t output_limit = 16 << 20);

struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

    double seconds() const;

private:
    std::chrono::steady_clock::time_point start;
};

/**
 * @brief 生成随机的 uuid 字符串，用作执行记录、测试结果的 id
 */
std::string generate_uuid();

/**
 * @brief 自 1970-01-01 起的天数（UTC），配额周期和每日统计都以此为键
 */
int64_t day_of(std::chrono::system_clock::time_point time);

/**
 * @brief 某一天（UTC）零点的时间点
 */
std::chrono::system_clock::time_point start_of_day(int64_t day);

/**
 * @brief 将天数格式化为 YYYY-MM-DD
 */
std::string format_date(int64_t day);

/**
 * @brief 解析 YYYY-MM-DD 格式的日期
 * @throw std::invalid_argument 如果日期格式不正确
 */
int64_t parse_date(const std::string &date);

/**
 * @brief 时间点与毫秒时间戳之间的转换，用于 json 序列化
 */
int64_t to_millis(std::chrono::system_clock::time_point time);
std::chrono::system_clock::time_point from_millis(int64_t millis);

}  // namespace sandbox

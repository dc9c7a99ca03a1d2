#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "execution/execution.hpp"

namespace sandbox {

/**
 * @brief 执行记录的存储
 * 执行记录是多个 worker 共享的可变状态，所有修改都以执行 id 为键，
 * 在存储内部加锁完成，调用方拿到的都是副本。
 */
struct execution_store {
    virtual ~execution_store();

    /**
     * @brief 插入新的执行记录
     * @throw std::invalid_argument 如果 id 已经存在
     */
    virtual void insert(const execution &e) = 0;

    virtual std::optional<execution> find(const std::string &id) const = 0;

    /**
     * @throw not_found 如果执行记录不存在
     */
    execution get(const std::string &id) const;

    /**
     * @brief 按状态机转移执行记录的状态
     * 检查转移是否合法和修改状态是原子的，因此停止请求和运行器的超时处理并发时，
     * 只有一方能把执行记录转移到终止状态。
     * @param fill 转移成功时，在同一个临界区内修改其他字段
     * @return 转移是否成功，执行记录不存在或者转移不合法时返回 false
     */
    virtual bool transition(const std::string &id, execution_status to, const std::function<void(execution &)> &fill = {}) = 0;

    /**
     * @brief 修改执行记录的非状态字段
     * @throw not_found 如果执行记录不存在
     * @throw invalid_state 如果 mutator 修改了状态，状态只能通过 transition 修改
     */
    virtual void update(const std::string &id, const std::function<void(execution &)> &mutator) = 0;

    /**
     * @return 是否真的删除了记录
     */
    virtual bool remove(const std::string &id) = 0;

    /**
     * @brief 用户最近的执行记录，按创建时间降序
     * @param limit 最多返回多少条，0 表示不限制
     */
    virtual std::vector<execution> list_by_user(const std::string &user_id, std::size_t limit = 0) const = 0;

    /**
     * @brief 创建时间在 [from, to) 之间的执行记录
     */
    virtual std::vector<execution> list_between(std::chrono::system_clock::time_point from, std::chrono::system_clock::time_point to) const = 0;

    /**
     * @brief 对所有执行记录调用 callback，callback 返回 false 时删除该记录
     * 用于保留期清理
     */
    virtual void retain(const std::function<bool(execution &)> &callback) = 0;

    virtual std::size_t size() const = 0;
};

/**
 * @brief 内存中的执行记录存储，可以保存为 json 快照
 */
struct memory_store : execution_store {
    void insert(const execution &e) override;
    std::optional<execution> find(const std::string &id) const override;
    bool transition(const std::string &id, execution_status to, const std::function<void(execution &)> &fill = {}) override;
    void update(const std::string &id, const std::function<void(execution &)> &mutator) override;
    bool remove(const std::string &id) override;
    std::vector<execution> list_by_user(const std::string &user_id, std::size_t limit = 0) const override;
    std::vector<execution> list_between(std::chrono::system_clock::time_point from, std::chrono::system_clock::time_point to) const override;
    void retain(const std::function<bool(execution &)> &callback) override;
    std::size_t size() const override;

    nlohmann::json snapshot() const;

    /**
     * @brief 从快照恢复执行记录
     * 守护进程重启后，快照中未结束的执行已经没有 worker 处理了，将它们标记为 ERROR
     */
    void restore(const nlohmann::json &j);

private:
    mutable std::mutex mut;
    std::map<std::string, execution> executions;
};

}  // namespace sandbox

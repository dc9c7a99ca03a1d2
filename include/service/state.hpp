#pragma once

#include <filesystem>
#include "execution/store.hpp"
#include "quota/quota.hpp"
#include "stats/statistics.hpp"

namespace sandbox {

/**
 * @brief 将执行记录、每日统计和配额使用情况保存为 json 快照
 * 先写入临时文件再重命名，守护进程在写入过程中崩溃不会损坏已有的快照
 * 格式为 {"executions": [...], "statistics": [...], "quota": {...}}
 */
void save_state(const std::filesystem::path &path, const memory_store &store, const statistics_collector &statistics, quota_manager &quota);

/**
 * @brief 从快照恢复执行记录、每日统计和配额使用情况，快照不存在时什么也不做
 * @return 是否读取到了快照
 * @throw std::invalid_argument 快照格式不正确
 */
bool load_state(const std::filesystem::path &path, memory_store &store, statistics_collector &statistics, quota_manager &quota);

}  // namespace sandbox

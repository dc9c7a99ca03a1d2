#include "stats/statistics.hpp"
#include <glog/logging.h>
#include <algorithm>
#include "common/json_utils.hpp"
#include "common/utils.hpp"

namespace sandbox {
using namespace std;

double daily_statistics::success_rate() const {
    return total == 0 ? 0 : (double)successful / total * 100;
}

statistics_collector::statistics_collector(const execution_store &store) : store(store) {}

daily_statistics statistics_collector::collect_daily(int64_t day) {
    daily_statistics stats;
    stats.day = day;
    stats.date = format_date(day);

    for (const execution &e : store.list_between(start_of_day(day), start_of_day(day + 1))) {
        if (e.kind == execution_kind::TEST || !is_terminal(e.status)) continue;

        ++stats.total;
        if (e.success())
            ++stats.successful;
        else
            ++stats.failed;
        if (e.status == execution_status::TIMEOUT) ++stats.timeouts;
        if (e.status == execution_status::MEMORY_LIMIT_EXCEEDED) ++stats.memory_exceeded;

        stats.total_execution_time += e.execution_time;
        stats.total_cpu_time += e.cpu_time;
        stats.total_memory_used += e.memory_used;
        ++stats.per_language[e.language];
        stats.users.insert(e.user_id);
    }
    stats.distinct_users = stats.users.size();
    stats.average_execution_time = stats.total == 0 ? 0 : stats.total_execution_time / stats.total;

    {
        scoped_lock guard(mut);
        statistics[day] = stats;
    }
    LOG(INFO) << "Collected statistics of " << stats.date << ": " << stats.total << " executions, "
              << stats.successful << " successful, " << stats.distinct_users << " users";
    return stats;
}

optional<daily_statistics> statistics_collector::get(int64_t day) const {
    scoped_lock guard(mut);
    auto it = statistics.find(day);
    if (it == statistics.end()) return nullopt;
    return it->second;
}

daily_statistics statistics_collector::summarize(int64_t from, int64_t to) const {
    daily_statistics sum;
    sum.day = from;
    sum.date = format_date(from) + ".." + format_date(to);

    scoped_lock guard(mut);
    for (auto it = statistics.lower_bound(from); it != statistics.end() && it->first <= to; ++it) {
        const daily_statistics &row = it->second;
        sum.total += row.total;
        sum.successful += row.successful;
        sum.failed += row.failed;
        sum.timeouts += row.timeouts;
        sum.memory_exceeded += row.memory_exceeded;
        sum.total_execution_time += row.total_execution_time;
        sum.total_cpu_time += row.total_cpu_time;
        sum.total_memory_used += row.total_memory_used;
        sum.users.insert(row.users.begin(), row.users.end());
        // 没有用户列表的统计行只能提供下界
        sum.distinct_users = max<int64_t>(sum.distinct_users, row.distinct_users);
        for (auto &[language, count] : row.per_language)
            sum.per_language[language] += count;
    }
    sum.distinct_users = max<int64_t>(sum.distinct_users, sum.users.size());
    sum.average_execution_time = sum.total == 0 ? 0 : sum.total_execution_time / sum.total;
    return sum;
}

vector<daily_statistics> statistics_collector::rows() const {
    scoped_lock guard(mut);
    vector<daily_statistics> result;
    for (auto &[day, row] : statistics) result.push_back(row);
    return result;
}

void statistics_collector::restore(const vector<daily_statistics> &rows) {
    scoped_lock guard(mut);
    for (auto &row : rows) statistics[row.day] = row;
}

void to_json(nlohmann::json &j, const daily_statistics &stats) {
    j = {{"date", stats.date},
         {"total_executions", stats.total},
         {"successful_executions", stats.successful},
         {"failed_executions", stats.failed},
         {"timeouts", stats.timeouts},
         {"memory_exceeded", stats.memory_exceeded},
         {"total_execution_time", stats.total_execution_time},
         {"average_execution_time", stats.average_execution_time},
         {"total_cpu_time", stats.total_cpu_time},
         {"total_memory_used", stats.total_memory_used},
         {"per_language", stats.per_language},
         {"distinct_users", stats.distinct_users},
         {"users", stats.users},
         {"success_rate", stats.success_rate()}};
}

void from_json(const nlohmann::json &j, daily_statistics &stats) {
    using namespace nlohmann;
    stats.date = get_value<string>(j, "date");
    stats.day = parse_date(stats.date);
    stats.total = get_value_def<int64_t>(j, 0, "total_executions");
    stats.successful = get_value_def<int64_t>(j, 0, "successful_executions");
    stats.failed = get_value_def<int64_t>(j, 0, "failed_executions");
    stats.timeouts = get_value_def<int64_t>(j, 0, "timeouts");
    stats.memory_exceeded = get_value_def<int64_t>(j, 0, "memory_exceeded");
    stats.total_execution_time = get_value_def(j, 0.0, "total_execution_time");
    stats.average_execution_time = get_value_def(j, 0.0, "average_execution_time");
    stats.total_cpu_time = get_value_def(j, 0.0, "total_cpu_time");
    stats.total_memory_used = get_value_def<int64_t>(j, 0, "total_memory_used");
    stats.per_language = get_value_def(j, map<string, int64_t>(), "per_language");
    stats.users = get_value_def(j, set<string>(), "users");
    stats.distinct_users = get_value_def<int64_t>(j, stats.users.size(), "distinct_users");
}

}  // namespace sandbox

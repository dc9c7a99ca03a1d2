#include "quota/quota.hpp"
#include <glog/logging.h>
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>
#include "common/json_utils.hpp"
#include "common/utils.hpp"

namespace sandbox {
using namespace std;

// clang-format off
static const unordered_map<user_tier, const char *> user_tier_string = boost::assign::map_list_of
    (user_tier::FREE, "free")
    (user_tier::PREMIUM, "premium")
    (user_tier::INSTRUCTOR, "instructor")
    (user_tier::ADMIN, "admin");
// clang-format on

const char *get_display_message(user_tier tier) {
    return user_tier_string.at(tier);
}

quota_policy quota_policy::defaults() {
    quota_policy policy;
    policy.tiers[user_tier::FREE] = {100, 300, 50 * 1024};
    policy.tiers[user_tier::PREMIUM] = {1000, 3000, 500 * 1024};
    policy.tiers[user_tier::INSTRUCTOR] = {5000, 15000, -1};
    policy.tiers[user_tier::ADMIN] = {-1, -1, -1};
    return policy;
}

const quota_limits &quota_policy::limits(user_tier tier) const {
    static const quota_limits unlimited;
    auto it = tiers.find(tier);
    return it == tiers.end() ? unlimited : it->second;
}

void quota_manager::quota_record::roll(int64_t today) {
    if (period == today) return;
    period = today;
    executions_used = 0;
    cpu_seconds_used = 0;
    memory_used_mb = 0;
    exceeded = false;
}

quota_manager::quota_manager(quota_policy policy, clock_function clock)
    : policy(move(policy)), clock(move(clock)) {}

int64_t quota_manager::today() const {
    return day_of(clock());
}

chrono::seconds quota_manager::until_reset() const {
    auto now = clock();
    auto next = start_of_day(day_of(now) + 1);
    return chrono::duration_cast<chrono::seconds>(next - now);
}

shared_ptr<quota_manager::quota_record> quota_manager::record_of(const string &user_id) {
    scoped_lock guard(records_mutex);
    auto &record = records[user_id];
    if (!record) record = make_shared<quota_record>();
    return record;
}

bool quota_manager::admit(const string &user_id, user_tier tier, const execution_environment &env) {
    int64_t day = today();
    const quota_limits &limits = policy.limits(tier);
    auto record = record_of(user_id);

    scoped_lock guard(record->mut);
    record->roll(day);

    if ((limits.executions >= 0 && record->executions_used >= limits.executions) ||
        (limits.cpu_seconds >= 0 && record->cpu_seconds_used >= limits.cpu_seconds) ||
        (limits.memory_mb >= 0 && record->memory_used_mb >= limits.memory_mb)) {
        record->exceeded = true;
        LOG(INFO) << "User " << user_id << " (" << get_display_message(tier) << ") exceeded the daily quota";
        return false;
    }

    {
        scoped_lock env_guard(environments_mutex);
        auto &counter = environments[env.id];
        if (counter.period != day) {
            counter.period = day;
            counter.executions = 0;
        }
        if (env.daily_execution_cap >= 0 && counter.executions >= env.daily_execution_cap) {
            LOG(INFO) << "Environment " << env.id << " reached its daily cap of " << env.daily_execution_cap << " executions";
            return false;
        }
        ++counter.executions;
    }

    ++record->executions_used;
    return true;
}

void quota_manager::commit(const string &user_id, double cpu_seconds, int64_t memory_bytes) {
    auto record = record_of(user_id);
    scoped_lock guard(record->mut);
    record->roll(today());
    record->cpu_seconds_used += max(0.0, cpu_seconds);
    // 向上取整到 MB
    record->memory_used_mb += max<int64_t>(0, (memory_bytes + 1024 * 1024 - 1) / (1024 * 1024));
}

quota_snapshot quota_manager::status(const string &user_id, user_tier tier) {
    int64_t day = today();
    const quota_limits &limits = policy.limits(tier);
    auto record = record_of(user_id);

    quota_snapshot snapshot;
    snapshot.user_id = user_id;
    snapshot.tier = tier;
    snapshot.period = format_date(day);
    snapshot.executions_limit = limits.executions;
    snapshot.cpu_seconds_limit = limits.cpu_seconds;
    snapshot.memory_limit_mb = limits.memory_mb;
    snapshot.reset_at = start_of_day(day + 1);
    snapshot.seconds_until_reset = chrono::duration_cast<chrono::seconds>(snapshot.reset_at - clock());

    scoped_lock guard(record->mut);
    record->roll(day);
    snapshot.executions_used = record->executions_used;
    snapshot.cpu_seconds_used = record->cpu_seconds_used;
    snapshot.memory_used_mb = record->memory_used_mb;
    snapshot.exceeded = record->exceeded ||
                        (limits.executions >= 0 && record->executions_used >= limits.executions);
    return snapshot;
}

int64_t quota_manager::environment_usage(const string &environment_id) {
    int64_t day = today();
    scoped_lock guard(environments_mutex);
    auto it = environments.find(environment_id);
    if (it == environments.end() || it->second.period != day) return 0;
    return it->second.executions;
}

nlohmann::json quota_manager::snapshot() {
    nlohmann::json users = nlohmann::json::object();
    {
        scoped_lock guard(records_mutex);
        for (auto &[user_id, record] : records) {
            scoped_lock record_guard(record->mut);
            if (record->period == 0) continue;
            users[user_id] = {{"period", format_date(record->period)},
                              {"executions_used", record->executions_used},
                              {"cpu_seconds_used", record->cpu_seconds_used},
                              {"memory_used_mb", record->memory_used_mb},
                              {"exceeded", record->exceeded}};
        }
    }

    nlohmann::json counters = nlohmann::json::object();
    {
        scoped_lock guard(environments_mutex);
        for (auto &[environment_id, counter] : environments)
            counters[environment_id] = {{"period", format_date(counter.period)},
                                        {"executions", counter.executions}};
    }
    return {{"users", users}, {"environments", counters}};
}

void quota_manager::restore(const nlohmann::json &j) {
    using namespace nlohmann;
    if (!j.is_object())
        throw invalid_argument("Quota snapshot must be an object");

    map<string, shared_ptr<quota_record>> restored_records;
    for (auto &item : get_value_def(j, json::object(), "users").items()) {
        auto record = make_shared<quota_record>();
        record->period = parse_date(get_value<string>(item.value(), "period"));
        record->executions_used = get_value_def<int64_t>(item.value(), 0, "executions_used");
        record->cpu_seconds_used = get_value_def(item.value(), 0.0, "cpu_seconds_used");
        record->memory_used_mb = get_value_def<int64_t>(item.value(), 0, "memory_used_mb");
        record->exceeded = get_value_def(item.value(), false, "exceeded");
        restored_records[item.key()] = record;
    }

    map<string, environment_counter> restored_counters;
    for (auto &item : get_value_def(j, json::object(), "environments").items()) {
        environment_counter &counter = restored_counters[item.key()];
        counter.period = parse_date(get_value<string>(item.value(), "period"));
        counter.executions = get_value_def<int64_t>(item.value(), 0, "executions");
    }

    size_t users = restored_records.size();
    {
        scoped_lock guard(records_mutex);
        records = move(restored_records);
    }
    {
        scoped_lock guard(environments_mutex);
        environments = move(restored_counters);
    }
    LOG(INFO) << "Restored quota records of " << users << " users";
}

void to_json(nlohmann::json &j, const user_tier &tier) {
    j = get_display_message(tier);
}

void from_json(const nlohmann::json &j, user_tier &tier) {
    string text = j.get<string>();
    for (auto &[value, name] : user_tier_string)
        if (text == name) {
            tier = value;
            return;
        }
    throw invalid_argument("Unrecognized user tier " + text);
}

void from_json(const nlohmann::json &j, quota_limits &limits) {
    using namespace nlohmann;
    limits.executions = get_value_def<int64_t>(j, -1, "executions");
    limits.cpu_seconds = get_value_def(j, -1.0, "cpu_seconds");
    limits.memory_mb = get_value_def<int64_t>(j, -1, "memory_mb");
}

void from_json(const nlohmann::json &j, quota_policy &policy) {
    if (!j.is_object())
        throw invalid_argument("Quota policy must be an object of tier name to limits");
    policy = quota_policy::defaults();
    for (auto &item : j.items()) {
        user_tier tier = nlohmann::json(item.key()).get<user_tier>();
        policy.tiers[tier] = item.value().get<quota_limits>();
    }
}

void to_json(nlohmann::json &j, const quota_snapshot &snapshot) {
    j = {{"user_id", snapshot.user_id},
         {"tier", snapshot.tier},
         {"period", snapshot.period},
         {"executions_used", snapshot.executions_used},
         {"executions_limit", snapshot.executions_limit},
         {"cpu_seconds_used", snapshot.cpu_seconds_used},
         {"cpu_seconds_limit", snapshot.cpu_seconds_limit},
         {"memory_used_mb", snapshot.memory_used_mb},
         {"memory_limit_mb", snapshot.memory_limit_mb},
         {"exceeded", snapshot.exceeded},
         {"reset_at", to_millis(snapshot.reset_at)},
         {"seconds_until_reset", snapshot.seconds_until_reset.count()}};
}

}  // namespace sandbox

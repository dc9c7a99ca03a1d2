#include <set>
#include "common/utils.hpp"
#include "gtest/gtest.h"
#include "stats/statistics.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace sandbox;

class StatisticsTest : public ::testing::Test {
protected:
    memory_store store;
    statistics_collector collector{store};
    int64_t day = parse_date("2024-03-01");
    int next_id = 0;

    void add(execution_status status, const string &user, const string &language, int64_t on_day,
             int exit_code = 0, execution_kind kind = execution_kind::PLAYGROUND) {
        execution e;
        e.id = to_string(next_id++);
        e.user_id = user;
        e.language = language;
        e.environment_id = language;
        e.kind = kind;
        e.status = status;
        e.exit_code = exit_code;
        e.execution_time = 0.5;
        e.cpu_time = 0.25;
        e.memory_used = 1 << 20;
        e.created_at = start_of_day(on_day) + chrono::hours(10);
        store.insert(e);
    }

    void SetUp() override {
        add(execution_status::COMPLETED, "alice", "python", day);
        add(execution_status::COMPLETED, "alice", "python", day, 1);
        add(execution_status::TIMEOUT, "bob", "c", day);
        add(execution_status::MEMORY_LIMIT_EXCEEDED, "bob", "python", day);
        // 不计入统计
        add(execution_status::RUNNING, "carol", "python", day);
        add(execution_status::COMPLETED, "alice", "python", day, 0, execution_kind::TEST);
        add(execution_status::COMPLETED, "alice", "python", day + 1);
    }
};

TEST_F(StatisticsTest, CollectDaily) {
    auto stats = collector.collect_daily(day);
    EXPECT_EQ("2024-03-01", stats.date);
    EXPECT_EQ(4, stats.total);
    EXPECT_EQ(1, stats.successful);
    EXPECT_EQ(3, stats.failed);
    EXPECT_EQ(1, stats.timeouts);
    EXPECT_EQ(1, stats.memory_exceeded);
    EXPECT_DOUBLE_EQ(2.0, stats.total_execution_time);
    EXPECT_DOUBLE_EQ(0.5, stats.average_execution_time);
    EXPECT_DOUBLE_EQ(1.0, stats.total_cpu_time);
    EXPECT_EQ(4 << 20, stats.total_memory_used);
    EXPECT_EQ(3, stats.per_language["python"]);
    EXPECT_EQ(1, stats.per_language["c"]);
    EXPECT_EQ(2, stats.distinct_users);
    EXPECT_DOUBLE_EQ(25, stats.success_rate());
}

TEST_F(StatisticsTest, CollectIsIdempotent) {
    auto first = collector.collect_daily(day);
    auto second = collector.collect_daily(day);
    EXPECT_JSON_EQ(nlohmann::json(first), nlohmann::json(second));
    EXPECT_EQ(1u, collector.rows().size());
    EXPECT_EQ(4, collector.get(day)->total);
    EXPECT_EQ(nullopt, collector.get(day + 5));
}

TEST_F(StatisticsTest, EmptyDay) {
    auto stats = collector.collect_daily(day - 1);
    EXPECT_EQ(0, stats.total);
    EXPECT_DOUBLE_EQ(0, stats.average_execution_time);
    EXPECT_DOUBLE_EQ(0, stats.success_rate());
}

TEST_F(StatisticsTest, Summarize) {
    collector.collect_daily(day);
    collector.collect_daily(day + 1);
    auto sum = collector.summarize(day, day + 1);
    EXPECT_EQ("2024-03-01..2024-03-02", sum.date);
    EXPECT_EQ(5, sum.total);
    EXPECT_EQ(2, sum.successful);
    EXPECT_EQ(4, sum.per_language["python"]);
    EXPECT_EQ(2, sum.distinct_users);
}

TEST_F(StatisticsTest, SummarizeCountsEachUserOnce) {
    add(execution_status::COMPLETED, "alice", "python", day + 2);
    for (int64_t d = day; d <= day + 2; ++d) collector.collect_daily(d);

    EXPECT_EQ(1, collector.get(day + 1)->distinct_users);
    EXPECT_EQ(1, collector.summarize(day + 1, day + 2).distinct_users);
    EXPECT_EQ((set<string>{"alice", "bob"}), collector.summarize(day, day + 2).users);
    EXPECT_EQ(2, collector.summarize(day, day + 2).distinct_users);
}

TEST_F(StatisticsTest, JsonRoundTrip) {
    auto stats = collector.collect_daily(day);
    nlohmann::json j = stats;
    EXPECT_EQ("2024-03-01", j["date"].get<string>());
    EXPECT_EQ(4, j["total_executions"].get<int64_t>());

    statistics_collector restored(store);
    restored.restore({j.get<daily_statistics>()});
    EXPECT_EQ(day, restored.get(day)->day);
    EXPECT_EQ(3, restored.get(day)->per_language.at("python"));
    EXPECT_EQ((set<string>{"alice", "bob"}), restored.get(day)->users);
    EXPECT_EQ(2, restored.get(day)->distinct_users);
}

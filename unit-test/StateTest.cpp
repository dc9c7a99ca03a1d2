#include <filesystem>
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "service/state.hpp"

using namespace std;
using namespace sandbox;
namespace fs = std::filesystem;

class StateTest : public ::testing::Test {
protected:
    fs::path path = WORK_DIR / "state-test.json";
    chrono::system_clock::time_point now = start_of_day(parse_date("2024-03-01")) + chrono::hours(12);

    quota_manager make_quota() {
        return quota_manager(quota_policy::defaults(), [this] { return now; });
    }

    void SetUp() override {
        fs::remove(path);
    }

    void TearDown() override {
        fs::remove(path);
    }
};

TEST_F(StateTest, MissingFile) {
    memory_store store;
    statistics_collector statistics(store);
    quota_manager quota = make_quota();
    EXPECT_FALSE(load_state(path, store, statistics, quota));
    EXPECT_EQ(0u, store.size());
}

TEST_F(StateTest, SaveAndLoad) {
    memory_store store;
    statistics_collector statistics(store);

    execution e;
    e.id = "saved";
    e.user_id = "alice";
    e.language = "python";
    e.status = execution_status::COMPLETED;
    e.exit_code = 0;
    e.stdout_output = "3\n";
    e.created_at = start_of_day(parse_date("2024-03-01")) + chrono::hours(1);
    store.insert(e);
    statistics.collect_daily(parse_date("2024-03-01"));
    quota_manager quota = make_quota();
    save_state(path, store, statistics, quota);
    EXPECT_FALSE(fs::exists(fs::path(path.string() + ".tmp")));

    memory_store loaded_store;
    statistics_collector loaded_statistics(loaded_store);
    quota_manager loaded_quota = make_quota();
    ASSERT_TRUE(load_state(path, loaded_store, loaded_statistics, loaded_quota));
    EXPECT_EQ("3\n", loaded_store.get("saved").stdout_output);
    ASSERT_EQ(1u, loaded_statistics.rows().size());
    EXPECT_EQ(1, loaded_statistics.get(parse_date("2024-03-01"))->total);
}

TEST_F(StateTest, CorruptFile) {
    write_file_content(path, "{not json");
    memory_store store;
    statistics_collector statistics(store);
    quota_manager quota = make_quota();
    EXPECT_THROW(load_state(path, store, statistics, quota), invalid_argument);
}

TEST_F(StateTest, QuotaSurvivesRestart) {
    execution_environment env;
    env.id = "python:3.11";
    env.daily_execution_cap = 6;

    memory_store store;
    statistics_collector statistics(store);
    quota_manager quota = make_quota();
    for (int i = 0; i < 5; ++i)
        ASSERT_TRUE(quota.admit("bob", user_tier::FREE, env));
    quota.commit("bob", 1.5, 3 << 20);
    save_state(path, store, statistics, quota);

    memory_store loaded_store;
    statistics_collector loaded_statistics(loaded_store);
    quota_manager loaded_quota = make_quota();
    ASSERT_TRUE(load_state(path, loaded_store, loaded_statistics, loaded_quota));

    auto status = loaded_quota.status("bob", user_tier::FREE);
    EXPECT_EQ(5, status.executions_used);
    EXPECT_DOUBLE_EQ(1.5, status.cpu_seconds_used);
    EXPECT_EQ(3, status.memory_used_mb);
    EXPECT_EQ(5, loaded_quota.environment_usage("python:3.11"));

    // 运行环境的每日上限在重启后仍然有效
    EXPECT_TRUE(loaded_quota.admit("bob", user_tier::FREE, env));
    EXPECT_FALSE(loaded_quota.admit("carol", user_tier::FREE, env));

    // 第二天重新计数
    now += chrono::hours(24);
    EXPECT_EQ(0, loaded_quota.status("bob", user_tier::FREE).executions_used);
    EXPECT_EQ(0, loaded_quota.environment_usage("python:3.11"));
}

TEST_F(StateTest, MalformedQuota) {
    write_file_content(path, R"({"quota": {"users": {"bob": {"period": "yesterday"}}}})");
    memory_store store;
    statistics_collector statistics(store);
    quota_manager quota = make_quota();
    EXPECT_THROW(load_state(path, store, statistics, quota), invalid_argument);
}

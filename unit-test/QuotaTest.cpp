#include <atomic>
#include <thread>
#include "common/utils.hpp"
#include "gtest/gtest.h"
#include "quota/quota.hpp"
#include "test/assertions.hpp"
#include "test/fixture.hpp"

using namespace std;
using namespace sandbox;

class QuotaTest : public ::testing::Test {
protected:
    // 2024-03-01 12:00:00 UTC
    chrono::system_clock::time_point now = start_of_day(parse_date("2024-03-01")) + chrono::hours(12);
    execution_environment env = test::python_environment();

    quota_policy small_policy() {
        quota_policy policy = quota_policy::defaults();
        policy.tiers[user_tier::FREE] = {3, 10, 100};
        return policy;
    }

    quota_manager make_manager(quota_policy policy) {
        return quota_manager(move(policy), [this] { return now; });
    }
};

TEST_F(QuotaTest, RejectsAfterLimit) {
    quota_manager quota = make_manager(small_policy());
    for (int i = 0; i < 3; ++i)
        EXPECT_TRUE(quota.admit("alice", user_tier::FREE, env)) << i;
    EXPECT_FALSE(quota.admit("alice", user_tier::FREE, env));

    auto status = quota.status("alice", user_tier::FREE);
    EXPECT_EQ(3, status.executions_used);
    EXPECT_EQ(3, status.executions_limit);
    EXPECT_TRUE(status.exceeded);
    EXPECT_EQ("2024-03-01", status.period);

    // 其它用户不受影响
    EXPECT_TRUE(quota.admit("bob", user_tier::FREE, env));
}

TEST_F(QuotaTest, AdminIsUnlimited) {
    quota_manager quota = make_manager(small_policy());
    for (int i = 0; i < 100; ++i)
        ASSERT_TRUE(quota.admit("root", user_tier::ADMIN, env));
    EXPECT_FALSE(quota.status("root", user_tier::ADMIN).exceeded);
}

TEST_F(QuotaTest, ResetsAtMidnight) {
    quota_manager quota = make_manager(small_policy());
    for (int i = 0; i < 3; ++i)
        ASSERT_TRUE(quota.admit("alice", user_tier::FREE, env));
    ASSERT_FALSE(quota.admit("alice", user_tier::FREE, env));
    EXPECT_EQ(chrono::hours(12), quota.until_reset());

    now += chrono::hours(12);
    EXPECT_TRUE(quota.admit("alice", user_tier::FREE, env));
    auto status = quota.status("alice", user_tier::FREE);
    EXPECT_EQ(1, status.executions_used);
    EXPECT_FALSE(status.exceeded);
    EXPECT_EQ("2024-03-02", status.period);
    EXPECT_EQ(chrono::hours(24), status.seconds_until_reset);
}

TEST_F(QuotaTest, CpuAndMemoryAreCommitted) {
    quota_manager quota = make_manager(small_policy());
    ASSERT_TRUE(quota.admit("alice", user_tier::FREE, env));
    quota.commit("alice", 10.5, 1);
    quota.commit("alice", 0.1, 3 * 1024 * 1024);

    auto status = quota.status("alice", user_tier::FREE);
    EXPECT_DOUBLE_EQ(10.6, status.cpu_seconds_used);
    // 不足 1 MB 的内存按 1 MB 计
    EXPECT_EQ(4, status.memory_used_mb);

    // cpu 时间已经用完
    EXPECT_FALSE(quota.admit("alice", user_tier::FREE, env));
}

TEST_F(QuotaTest, ConcurrentAdmissionNeverExceedsLimit) {
    quota_policy policy = quota_policy::defaults();
    policy.tiers[user_tier::FREE] = {10, -1, -1};
    quota_manager quota = make_manager(policy);

    atomic<int> admitted{0};
    vector<thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            for (int k = 0; k < 10; ++k)
                if (quota.admit("alice", user_tier::FREE, env)) ++admitted;
        });
    }
    for (auto &t : threads) t.join();

    EXPECT_EQ(10, admitted.load());
    EXPECT_EQ(10, quota.status("alice", user_tier::FREE).executions_used);
}

TEST_F(QuotaTest, EnvironmentDailyCap) {
    env.daily_execution_cap = 2;
    quota_manager quota = make_manager(quota_policy::defaults());
    EXPECT_TRUE(quota.admit("alice", user_tier::FREE, env));
    EXPECT_TRUE(quota.admit("bob", user_tier::FREE, env));
    EXPECT_FALSE(quota.admit("carol", user_tier::FREE, env));
    EXPECT_EQ(2, quota.environment_usage(env.id));
    // 被环境上限拒绝的执行不计入用户配额
    EXPECT_EQ(0, quota.status("carol", user_tier::FREE).executions_used);

    now += chrono::hours(24);
    EXPECT_EQ(0, quota.environment_usage(env.id));
    EXPECT_TRUE(quota.admit("carol", user_tier::FREE, env));
}

TEST_F(QuotaTest, SnapshotJson) {
    quota_manager quota = make_manager(small_policy());
    ASSERT_TRUE(quota.admit("alice", user_tier::FREE, env));
    quota.commit("alice", 1.5, 2 << 20);

    EXPECT_JSON_EQ(nlohmann::json::parse(R"({
        "user_id": "alice",
        "tier": "free",
        "period": "2024-03-01",
        "executions_used": 1,
        "executions_limit": 3,
        "cpu_seconds_used": 1.5,
        "cpu_seconds_limit": 10.0,
        "memory_used_mb": 2,
        "memory_limit_mb": 100,
        "exceeded": false,
        "reset_at": 1709337600000,
        "seconds_until_reset": 43200
    })"), nlohmann::json(quota.status("alice", user_tier::FREE)));
}

TEST_F(QuotaTest, PolicyFromJson) {
    auto policy = nlohmann::json::parse(R"({"free": {"executions": 5}, "premium": {"executions": 50, "memory_mb": -1}})").get<quota_policy>();
    EXPECT_EQ(5, policy.limits(user_tier::FREE).executions);
    EXPECT_EQ(50, policy.limits(user_tier::PREMIUM).executions);
    EXPECT_EQ(-1, policy.limits(user_tier::PREMIUM).memory_mb);
    EXPECT_EQ(-1, policy.limits(user_tier::ADMIN).executions);
}

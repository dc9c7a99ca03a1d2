#include <atomic>
#include <mutex>
#include <thread>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "service/execution_service.hpp"
#include "test/fixture.hpp"

using namespace std;
using namespace sandbox;
using namespace sandbox::test;

static quota_policy test_policy() {
    quota_policy policy = quota_policy::defaults();
    policy.tiers[user_tier::FREE] = {3, -1, -1};
    return policy;
}

class ExecutionServiceTest : public ::testing::Test {
protected:
    sandbox_fixture sb;
    quota_manager quota{test_policy()};
    grader grading{sb.store, sb.runner};
    statistics_collector statistics{sb.store};
    json_exercise_catalog exercises;
    json_user_directory users;
    worker_pool workers{2};
    execution_service service{sb.store, sb.environments, sb.runner, quota, grading, statistics, exercises, users, workers};

    void SetUp() override {
        users.set_tier("root", user_tier::ADMIN);
        users.set_tier("carol", user_tier::INSTRUCTOR);

        exercise sum;
        sum.id = "sum-two-numbers";
        sum.title = "Sum of two numbers";
        sum.environment_id = "python:3.11";
        sum.tests = sum_tests();
        exercises.add(sum);

        sb.runtime.set_script(sum_program);
    }

    void TearDown() override {
        service.shutdown();
    }

    static submission request(const string &source, const string &user = "alice") {
        submission req;
        req.user_id = user;
        req.environment_id = "python:3.11";
        req.source_code = source;
        req.stdin_input = "1 2\n";
        req.wait = chrono::seconds(10);
        return req;
    }

    void hang() {
        fake_program program;
        program.hang = true;
        sb.runtime.set_program(program);
    }

    void wait_until(const string &id, execution_status status) {
        for (int i = 0; i < 1000; ++i) {
            auto e = sb.store.get(id);
            if (e.status == status && (status != execution_status::RUNNING || !e.container_id.empty())) return;
            this_thread::sleep_for(chrono::milliseconds(2));
        }
        FAIL() << "Execution " << id << " never reached " << get_display_message(status);
    }
};

TEST_F(ExecutionServiceTest, SubmitAndWait) {
    auto e = service.submit_execution(request("a, b = map(int, input().split())\nprint(a + b)"));
    EXPECT_EQ(execution_status::COMPLETED, e.status);
    EXPECT_EQ("3\n", e.stdout_output);
    EXPECT_EQ(execution_kind::PLAYGROUND, e.kind);
    EXPECT_EQ("python", e.language);
    EXPECT_TRUE(e.success());
    EXPECT_FALSE(e.grade);

    EXPECT_EQ(1, service.get_quota_status("alice").executions_used);
}

TEST_F(ExecutionServiceTest, SubmitWithoutWaiting) {
    auto req = request("print(a + b)");
    req.wait.reset();
    auto e = service.submit_execution(req);
    EXPECT_FALSE(is_terminal(e.status));

    auto done = service.wait_for(e.id, chrono::seconds(10));
    EXPECT_EQ(execution_status::COMPLETED, done.status);
}

TEST_F(ExecutionServiceTest, ResolvesLanguageOnlyEnvironment) {
    auto req = request("print(a + b)");
    req.environment_id = "python";
    EXPECT_EQ("python:3.11", service.submit_execution(req).environment_id);

    req.environment_id = "cobol";
    EXPECT_THROW(service.submit_execution(req), environment_not_found);
}

TEST_F(ExecutionServiceTest, RejectsInvalidSubmissions) {
    EXPECT_THROW(service.submit_execution(request("  \n\t")), validation_error);
    EXPECT_THROW(service.submit_execution(request("print(1)", "")), validation_error);
    EXPECT_THROW(service.submit_execution(request(string(2 << 20, 'x'))), validation_error);
    EXPECT_THROW(service.submit_execution(request(string("print('\xff')"))), validation_error);

    auto req = request("print(1)");
    req.env_vars = {{"1BAD", "x"}};
    EXPECT_THROW(service.submit_execution(req), validation_error);

    req = request("int main() { return 0; }");
    req.environment_id = "c:12";
    EXPECT_THROW(service.submit_execution(req), validation_error);

    req = request("print(1)");
    req.exercise_id = "missing";
    EXPECT_THROW(service.submit_execution(req), validation_error);

    // 被拒绝的提交不消耗配额，也不会被记录
    EXPECT_EQ(0, service.get_quota_status("alice").executions_used);
    EXPECT_EQ(0u, sb.store.size());
    EXPECT_TRUE(sb.runtime.created().empty());
}

TEST_F(ExecutionServiceTest, RejectsDangerousCode) {
    EXPECT_THROW(service.submit_execution(request("import os\nos.system('rm -rf /')")), validation_error);
    EXPECT_THROW(service.submit_execution(request("import ctypes")), validation_error);
    EXPECT_THROW(service.submit_execution(request("print(eval('1'))")), validation_error);
    EXPECT_EQ(0u, sb.store.size());
}

TEST_F(ExecutionServiceTest, QuotaExceeded) {
    for (int i = 0; i < 3; ++i)
        service.submit_execution(request("print(a + b)"));

    try {
        service.submit_execution(request("print(a + b)"));
        FAIL() << "The fourth execution should exceed the quota";
    } catch (quota_exceeded &ex) {
        EXPECT_GT(ex.retry_after.count(), 0);
        EXPECT_LE(ex.retry_after.count(), 24 * 3600);
    }
    EXPECT_EQ(3u, sb.store.size());
    EXPECT_TRUE(service.get_quota_status("alice").exceeded);

    // 其他用户不受影响
    EXPECT_EQ(execution_status::COMPLETED, service.submit_execution(request("print(a + b)", "carol")).status);
}

TEST_F(ExecutionServiceTest, Ownership) {
    auto e = service.submit_execution(request("print(a + b)"));
    EXPECT_EQ(e.id, service.get_execution_result("alice", e.id).id);
    EXPECT_EQ(e.id, service.get_execution_result("root", e.id).id);
    EXPECT_THROW(service.get_execution_result("bob", e.id), permission_denied);
    EXPECT_THROW(service.stop_execution("bob", e.id), permission_denied);
    EXPECT_THROW(service.get_execution_result("alice", "missing"), not_found);
}

TEST_F(ExecutionServiceTest, StopRunningExecution) {
    hang();
    auto req = request("while True: pass");
    req.wait.reset();
    auto e = service.submit_execution(req);
    wait_until(e.id, execution_status::RUNNING);

    EXPECT_TRUE(service.stop_execution("alice", e.id));
    auto done = service.wait_for(e.id, chrono::seconds(10));
    EXPECT_EQ(execution_status::CANCELLED, done.status);

    // 已经结束的执行不能再停止
    EXPECT_FALSE(service.stop_execution("alice", e.id));
    EXPECT_EQ(0u, sb.runtime.live_containers());
}

TEST_F(ExecutionServiceTest, WaitForTimeout) {
    hang();
    auto req = request("while True: pass");
    req.wait.reset();
    auto e = service.submit_execution(req);

    EXPECT_THROW(service.wait_for(e.id, chrono::milliseconds(50)), execution_timeout);
    EXPECT_THROW(service.wait_for("missing", chrono::milliseconds(50)), not_found);
    EXPECT_TRUE(service.stop_execution("root", e.id));
}

TEST_F(ExecutionServiceTest, ExerciseIsGraded) {
    mutex results_mutex;
    vector<string> streamed;
    auto req = request("a, b = map(int, input().split())\nprint(a + b)");
    req.environment_id = "";
    req.exercise_id = "sum-two-numbers";
    req.on_test_result = [&](const test_result &r) {
        scoped_lock guard(results_mutex);
        streamed.push_back(r.test_case_name);
    };

    auto e = service.submit_execution(req);
    EXPECT_EQ(execution_status::COMPLETED, e.status);
    EXPECT_EQ(execution_kind::EXERCISE, e.kind);
    EXPECT_EQ("python:3.11", e.environment_id);
    ASSERT_TRUE(e.grade);
    EXPECT_EQ(3, e.grade->passed);
    EXPECT_DOUBLE_EQ(100, e.grade->percentage);
    {
        scoped_lock guard(results_mutex);
        EXPECT_EQ((vector<string>{"small", "negative", "large"}), streamed);
    }

    // 评分时的子执行不出现在历史中，也不消耗配额
    auto history = service.history("alice");
    EXPECT_EQ(1, history.total);
    EXPECT_EQ(1, service.get_quota_status("alice").executions_used);
}

TEST_F(ExecutionServiceTest, StopWhileGrading) {
    // 提交本身正常结束，测试点的程序都不会退出
    atomic<int> containers{0};
    sb.runtime.set_script([&](const container_spec &spec) {
        if (containers++ == 0) return sum_program(spec);
        fake_program program;
        program.hang = true;
        return program;
    });

    auto req = request("a, b = map(int, input().split())\nprint(a + b)");
    req.exercise_id = "sum-two-numbers";
    req.wait.reset();
    auto e = service.submit_execution(req);

    for (int i = 0; i < 1000 && sb.runtime.created().size() < 2; ++i)
        this_thread::sleep_for(chrono::milliseconds(2));
    ASSERT_EQ(2u, sb.runtime.created().size());
    // 评分结束前执行没有终止
    EXPECT_EQ(execution_status::RUNNING, sb.store.get(e.id).status);

    EXPECT_TRUE(service.stop_execution("alice", e.id));
    EXPECT_FALSE(service.stop_execution("alice", e.id));

    auto done = service.wait_for(e.id, chrono::seconds(3));
    EXPECT_EQ(execution_status::CANCELLED, done.status);
    EXPECT_EQ("3\n", done.stdout_output);
    ASSERT_TRUE(done.grade);
    ASSERT_EQ(3, done.grade->total_tests);
    EXPECT_EQ(0, done.grade->passed);
    for (auto &r : done.grade->results)
        EXPECT_EQ(test_status::SKIPPED, r.status) << r.test_case_name;

    EXPECT_EQ(2u, sb.runtime.created().size());
    EXPECT_EQ(0u, sb.runtime.live_containers());
    EXPECT_FALSE(service.stop_execution("alice", e.id));
}

TEST_F(ExecutionServiceTest, FailedExecutionIsNotGraded) {
    fake_program program;
    program.fail_create = true;
    sb.runtime.set_program(program);

    auto req = request("print(a + b)");
    req.exercise_id = "sum-two-numbers";
    auto e = service.submit_execution(req);
    EXPECT_EQ(execution_status::FAILED, e.status);
    EXPECT_FALSE(e.grade);
    EXPECT_TRUE(sb.runtime.created().empty());
}

TEST_F(ExecutionServiceTest, History) {
    service.submit_execution(request("print(a + b)"));
    service.submit_execution(request("import sys\nsys.exit(1)"));

    auto history = service.history("alice");
    EXPECT_EQ(2, history.total);
    EXPECT_EQ(1, history.successful);
    EXPECT_EQ(1, history.failed);
    ASSERT_EQ(2u, history.executions.size());
    EXPECT_EQ(1, history.executions[0].exit_code.value());

    EXPECT_EQ(1u, service.history("alice", 1).executions.size());
    EXPECT_EQ(2, service.history("alice", 1).total);
    EXPECT_EQ(0, service.history("bob").total);
}

TEST_F(ExecutionServiceTest, PurgeExpired) {
    auto now = chrono::system_clock::now();
    auto day = chrono::hours(24);
    auto add = [&](const string &id, execution_status status, chrono::system_clock::time_point finished) {
        execution e;
        e.id = id;
        e.user_id = "alice";
        e.status = status;
        e.container_id = "container-" + id;
        e.created_at = finished;
        e.completed_at = finished;
        sb.store.insert(e);
    };
    add("fresh", execution_status::COMPLETED, now - day);
    add("stale", execution_status::COMPLETED, now - day * RETENTION_DAYS - day);
    add("expired", execution_status::TIMEOUT, now - day * RETENTION_DAYS * 2 - day);
    add("stuck", execution_status::RUNNING, now - day * RETENTION_DAYS * 3);

    EXPECT_EQ(1u, service.purge_expired(now));
    EXPECT_EQ(nullopt, sb.store.find("expired"));
    EXPECT_EQ("container-fresh", sb.store.get("fresh").container_id);
    EXPECT_TRUE(sb.store.get("stale").container_id.empty());
    EXPECT_EQ("container-stuck", sb.store.get("stuck").container_id);
}

TEST_F(ExecutionServiceTest, CollectStatistics) {
    service.submit_execution(request("print(a + b)"));
    service.submit_execution(request("print(a + b)", "carol"));
    auto stats = service.collect_statistics(day_of(chrono::system_clock::now()));
    EXPECT_EQ(2, stats.total);
    EXPECT_EQ(2, stats.distinct_users);
    EXPECT_EQ(2, stats.per_language["python"]);
}

TEST_F(ExecutionServiceTest, ShutdownCancelsQueuedExecutions) {
    // 占满并发名额，新的执行只能排队
    vector<concurrency_slot> slots;
    for (int i = 0; i < 4; ++i)
        slots.push_back(move(*sb.limiter.try_acquire("other:" + to_string(i), 0)));

    auto req = request("print(a + b)");
    req.wait.reset();
    auto e = service.submit_execution(req);
    service.shutdown();

    EXPECT_EQ(execution_status::CANCELLED, sb.store.get(e.id).status);
    EXPECT_TRUE(sb.runtime.created().empty());
    EXPECT_THROW(service.submit_execution(request("print(a + b)")), sandbox_launch_error);
}

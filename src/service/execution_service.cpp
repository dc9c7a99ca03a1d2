#include "service/execution_service.hpp"
#include <glog/logging.h>
#include <fmt/core.h>
#include <boost/algorithm/string.hpp>
#include <regex>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace sandbox {
using namespace std;

// 单次提交的源代码上限
static const size_t MAX_SOURCE_SIZE = 1 << 20;

execution_service::execution_service(execution_store &store,
                                     environment_registry &environments,
                                     sandbox_runner &runner,
                                     quota_manager &quota,
                                     grader &grading,
                                     statistics_collector &statistics,
                                     const exercise_catalog &exercises,
                                     const user_directory &users,
                                     worker_pool &workers,
                                     code_filter filter)
    : store(store),
      environments(environments),
      runner(runner),
      quota(quota),
      grading(grading),
      statistics(statistics),
      exercises(exercises),
      users(users),
      workers(workers),
      filter(move(filter)) {}

void execution_service::validate(const submission &request) const {
    static const regex env_key("^[A-Za-z_][A-Za-z0-9_]*$");

    if (request.user_id.empty())
        throw validation_error("User id must not be empty");
    if (boost::algorithm::trim_copy(request.source_code).empty())
        throw validation_error("Source code must not be empty");
    if (request.source_code.size() > MAX_SOURCE_SIZE)
        throw validation_error(fmt::format("Source code must not exceed {} bytes", MAX_SOURCE_SIZE));
    if (!utf8_check_is_valid(request.source_code))
        throw validation_error("Source code must be valid UTF-8");
    for (auto &[key, value] : request.env_vars)
        if (!regex_match(key, env_key))
            throw validation_error("Invalid environment variable name " + key);
}

execution execution_service::submit_execution(const submission &request) {
    {
        scoped_lock guard(mut);
        if (stopping) throw sandbox_launch_error("The sandbox is shutting down");
    }
    validate(request);

    optional<exercise> ex;
    if (request.exercise_id) {
        ex = exercises.find(*request.exercise_id);
        if (!ex) throw validation_error("Exercise " + *request.exercise_id + " does not exist");
    }

    string environment_id = request.environment_id.empty() && ex ? ex->environment_id : request.environment_id;
    if (environment_id.empty())
        throw validation_error("An environment must be specified");
    execution_environment env = environments.get(environment_id);

    if (!request.stdin_input.empty() && !env.supports_input)
        throw validation_error("Environment " + env.id + " does not accept standard input");
    if (auto reason = filter.check(request.source_code, env)) {
        LOG(INFO) << "Rejected submission of user " << request.user_id << ": " << *reason;
        throw validation_error(*reason);
    }

    user_tier tier = users.tier_of(request.user_id);
    if (!quota.admit(request.user_id, tier, env)) {
        auto retry_after = quota.until_reset();
        throw quota_exceeded(fmt::format("Daily execution quota exceeded, resets in {}h {}m",
                                         retry_after.count() / 3600, retry_after.count() % 3600 / 60),
                             retry_after);
    }

    execution e;
    e.id = generate_uuid();
    e.user_id = request.user_id;
    e.environment_id = env.id;
    e.language = env.language;
    e.kind = request.exercise_id && request.kind == execution_kind::PLAYGROUND ? execution_kind::EXERCISE : request.kind;
    e.source_code = request.source_code;
    e.stdin_input = request.stdin_input;
    e.argv = request.argv;
    e.env_vars = request.env_vars;
    e.exercise_id = request.exercise_id;
    e.created_at = chrono::system_clock::now();
    store.insert(e);
    store.transition(e.id, execution_status::QUEUED);

    {
        scoped_lock guard(mut);
        inflight.insert(e.id);
    }
    LOG(INFO) << "Execution " << e.id << " of user " << e.user_id << " queued on " << env.id;
    workers.submit([this, id = e.id, callback = request.on_test_result] { run(id, callback); });

    if (request.wait) wait_until_done(e.id, *request.wait);
    return store.get(e.id);
}

void execution_service::run(const string &execution_id, const grader::result_callback &on_test_result) {
    defer {
        {
            scoped_lock guard(mut);
            inflight.erase(execution_id);
        }
        finished.notify_all();
    };

    auto queued = store.find(execution_id);
    if (!queued) return;
    bool graded = queued->exercise_id.has_value();

    // 需要评分的执行在评分结束前保持 RUNNING
    execution_result result = runner.execute(execution_id, !graded);
    quota.commit(queued->user_id, result.cpu_time, result.memory_used);
    if (!graded) return;

    auto e = store.find(execution_id);
    if (!e || e->status != execution_status::RUNNING) return;
    if (result.status != execution_status::COMPLETED) {
        store.transition(execution_id, result.status);
        return;
    }
    grade(*e, result.status, on_test_result);
}

void execution_service::grade(const execution &e, execution_status status, const grader::result_callback &on_test_result) {
    {
        scoped_lock guard(mut);
        grading_executions[e.id];
    }
    bool stop_requested = false;
    defer {
        scoped_lock guard(mut);
        grading_executions.erase(e.id);
    };

    auto on_child = [&](const string &child_id) {
        // 评分开始前执行可能已经被运行器直接停止
        auto parent = store.find(e.id);
        scoped_lock guard(mut);
        grading_state &state = grading_executions[e.id];
        state.child_id = child_id;
        return !state.stop_requested && parent && parent->status == execution_status::RUNNING;
    };

    optional<grade_report> report;
    string error_message;
    try {
        auto found = exercises.find(*e.exercise_id);
        if (!found) throw not_found("Exercise " + *e.exercise_id + " was removed before grading");
        report = grading.grade_all(e, found->tests, on_test_result, on_child);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unable to grade execution " << e.id << ": " << ex.what();
        error_message = string("Grading failed: ") + ex.what();
        status = execution_status::ERROR;
    }

    {
        scoped_lock guard(mut);
        stop_requested = grading_executions[e.id].stop_requested;
    }
    if (stop_requested) {
        status = execution_status::CANCELLED;
        error_message = "Execution was stopped while grading";
    }

    // 评分报告和终止状态一起写入，终止后的记录不再改变
    store.transition(e.id, status, [&](execution &record) {
        record.grade = move(report);
        if (!error_message.empty()) record.error_message = error_message;
    });
}

bool execution_service::wait_until_done(const string &execution_id, chrono::milliseconds timeout) {
    unique_lock lock(mut);
    return finished.wait_for(lock, timeout, [&] { return !inflight.count(execution_id); });
}

execution execution_service::wait_for(const string &execution_id, chrono::milliseconds timeout) {
    execution e = store.get(execution_id);
    if (!wait_until_done(execution_id, timeout))
        throw execution_timeout(fmt::format("Execution {} did not finish within {}ms", execution_id, timeout.count()));
    return store.get(e.id);
}

execution execution_service::owned(const string &user_id, const string &execution_id) const {
    execution e = store.get(execution_id);
    if (e.user_id != user_id && users.tier_of(user_id) != user_tier::ADMIN)
        throw permission_denied("User " + user_id + " does not own execution " + execution_id);
    return e;
}

bool execution_service::stop_execution(const string &user_id, const string &execution_id) {
    execution e = owned(user_id, execution_id);
    if (is_terminal(e.status)) return false;
    LOG(INFO) << "User " << user_id << " requested to stop execution " << execution_id;

    string child_id;
    {
        scoped_lock guard(mut);
        auto it = grading_executions.find(execution_id);
        if (it == grading_executions.end()) return runner.stop(execution_id);
        if (it->second.stop_requested) return false;
        it->second.stop_requested = true;
        child_id = it->second.child_id;
    }
    // 派生执行已经结束时停止不会生效，下一个测试点开始前会发现停止请求
    if (!child_id.empty()) runner.stop(child_id);
    return true;
}

execution execution_service::get_execution_result(const string &user_id, const string &execution_id) {
    return owned(user_id, execution_id);
}

quota_snapshot execution_service::get_quota_status(const string &user_id) {
    return quota.status(user_id, users.tier_of(user_id));
}

execution_history execution_service::history(const string &user_id, size_t limit) {
    execution_history result;
    for (execution &e : store.list_by_user(user_id)) {
        if (e.kind == execution_kind::TEST) continue;
        if (is_terminal(e.status)) {
            ++result.total;
            if (e.success())
                ++result.successful;
            else
                ++result.failed;
            result.total_time += e.execution_time;
        }
        if (limit == 0 || result.executions.size() < limit)
            result.executions.push_back(move(e));
    }
    result.average_time = result.total == 0 ? 0 : result.total_time / result.total;
    return result;
}

size_t execution_service::purge_expired(chrono::system_clock::time_point now) {
    auto window = chrono::hours(24) * RETENTION_DAYS;
    size_t cleared = 0, deleted = 0;
    store.retain([&](execution &e) {
        if (!is_terminal(e.status)) return true;
        auto finished_at = e.completed_at.value_or(e.created_at);
        if (finished_at + 2 * window <= now) {
            ++deleted;
            return false;
        }
        if (finished_at + window <= now && !e.container_id.empty()) {
            e.container_id.clear();
            ++cleared;
        }
        return true;
    });
    LOG(INFO) << "Purged " << deleted << " expired executions, cleared " << cleared << " container handles";
    return deleted;
}

daily_statistics execution_service::collect_statistics(int64_t day) {
    return statistics.collect_daily(day);
}

void execution_service::shutdown() {
    set<string> pending;
    {
        scoped_lock guard(mut);
        if (stopping) return;
        stopping = true;
        pending = inflight;
    }
    LOG(INFO) << "Shutting down, cancelling queued executions";
    for (auto &id : pending) {
        auto e = store.find(id);
        if (e && e->status == execution_status::QUEUED) runner.stop(id);
    }
    workers.stop();
}

}  // namespace sandbox

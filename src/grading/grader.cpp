#include "grading/grader.hpp"
#include <glog/logging.h>
#include <algorithm>
#include "common/defer.hpp"
#include "common/utils.hpp"

namespace sandbox {
using namespace std;

grader::grader(execution_store &store, sandbox_runner &runner, grading_policy policy)
    : store(store), runner(runner), grading(policy) {}

const grading_policy &grader::policy() const {
    return grading;
}

string grader::compose_source(const test_case &tc, const string &source) {
    string composed;
    for (const string *part : {&tc.setup_code, &source, &tc.test_code, &tc.teardown_code}) {
        if (part->empty()) continue;
        if (!composed.empty()) composed += "\n\n";
        composed += *part;
    }
    return composed;
}

static test_result skipped(const test_case &tc) {
    test_result r;
    r.test_case_id = tc.id;
    r.test_case_name = tc.name;
    r.status = test_status::SKIPPED;
    r.points_possible = tc.points;
    r.feedback = "Grading was stopped before this test ran";
    return r;
}

test_result grader::run_test(const execution &submission, const test_case &tc, const child_callback &on_child) {
    execution child;
    child.id = generate_uuid();
    child.user_id = submission.user_id;
    child.environment_id = submission.environment_id;
    child.language = submission.language;
    child.kind = execution_kind::TEST;
    child.source_code = compose_source(tc, submission.source_code);
    child.stdin_input = tc.input;
    child.argv = submission.argv;
    child.env_vars = submission.env_vars;
    child.exercise_id = submission.exercise_id;
    child.parent_id = submission.id;
    child.timeout_override = tc.timeout ? tc.timeout : submission.timeout_override;
    child.memory_override = tc.max_memory ? tc.max_memory : submission.memory_override;
    child.created_at = chrono::system_clock::now();

    store.insert(child);
    defer {
        store.remove(child.id);
    };
    store.transition(child.id, execution_status::QUEUED);
    if (on_child && !on_child(child.id)) return skipped(tc);

    execution_result result = runner.execute(child.id);
    test_result r = evaluate(tc, result, grading);
    DLOG(INFO) << "Test " << tc.name << " of execution " << submission.id << ": "
               << get_display_message(r.status) << " (" << r.points_earned << "/" << r.points_possible << ")";
    return r;
}

grade_report grader::grade_all(const execution &submission, vector<test_case> tests,
                               const result_callback &on_result, const child_callback &on_child) {
    tests.erase(remove_if(tests.begin(), tests.end(), [](const test_case &tc) { return !tc.is_active; }), tests.end());
    stable_sort(tests.begin(), tests.end(), [](const test_case &a, const test_case &b) {
        return a.order != b.order ? a.order < b.order : a.name < b.name;
    });

    grade_report report;
    bool cancelled = false;
    for (const test_case &tc : tests) {
        test_result r;
        if (cancelled) {
            r = skipped(tc);
        } else {
            r = run_test(submission, tc, on_child);
            if (r.status == test_status::SKIPPED) cancelled = true;
        }

        ++report.total_tests;
        if (r.passed())
            ++report.passed;
        else
            ++report.failed;
        report.total_points += r.points_possible;
        report.earned_points += r.points_earned;
        if (on_result) on_result(r);
        report.results.push_back(move(r));
    }
    report.percentage = report.total_points > 0 ? report.earned_points / report.total_points * 100 : 0;

    LOG(INFO) << "Graded execution " << submission.id << ": " << report.passed << "/" << report.total_tests
              << " tests passed, " << report.earned_points << "/" << report.total_points << " points";
    return report;
}

}  // namespace sandbox

#include "grading/test_case.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>
#include "common/json_utils.hpp"

namespace sandbox {
using namespace std;

// clang-format off
static const unordered_map<matching_mode, const char *> matching_mode_string = boost::assign::map_list_of
    (matching_mode::STRICT, "strict")
    (matching_mode::IGNORE_WHITESPACE, "ignore_whitespace")
    (matching_mode::IGNORE_CASE, "ignore_case")
    (matching_mode::SIMILARITY, "similarity");
// clang-format on

bool test_result::passed() const {
    return status == test_status::PASSED;
}

const char *get_display_message(matching_mode mode) {
    return matching_mode_string.at(mode);
}

void to_json(nlohmann::json &j, const matching_mode &mode) {
    j = get_display_message(mode);
}

void from_json(const nlohmann::json &j, matching_mode &mode) {
    string text = j.get<string>();
    for (auto &[value, name] : matching_mode_string)
        if (text == name) {
            mode = value;
            return;
        }
    throw invalid_argument("Unrecognized matching mode " + text);
}

void to_json(nlohmann::json &j, const test_case &tc) {
    j = {{"id", tc.id},
         {"name", tc.name},
         {"description", tc.description},
         {"input", tc.input},
         {"expected_output", tc.expected_output},
         {"expected_exit_code", tc.expected_exit_code},
         {"expected_error", tc.expected_error},
         {"setup_code", tc.setup_code},
         {"test_code", tc.test_code},
         {"teardown_code", tc.teardown_code},
         {"timeout", nlohmann::optional_to_json(tc.timeout)},
         {"max_memory", nlohmann::optional_to_json(tc.max_memory)},
         {"points", tc.points},
         {"mode", tc.mode},
         {"is_hidden", tc.is_hidden},
         {"is_active", tc.is_active},
         {"order", tc.order}};
}

void from_json(const nlohmann::json &j, test_case &tc) {
    using namespace nlohmann;
    tc.name = get_value<string>(j, "name");
    tc.id = get_value_def(j, tc.name, "id");
    tc.description = get_value_def<string>(j, "", "description");
    tc.input = get_value_def<string>(j, "", "input");
    tc.expected_output = get_value_def<string>(j, "", "expected_output");
    tc.expected_exit_code = get_value_def(j, 0, "expected_exit_code");
    tc.expected_error = get_value_def<string>(j, "", "expected_error");
    tc.setup_code = get_value_def<string>(j, "", "setup_code");
    tc.test_code = get_value_def<string>(j, "", "test_code");
    tc.teardown_code = get_value_def<string>(j, "", "teardown_code");
    tc.timeout = get_optional<int>(j, "timeout");
    tc.max_memory = get_optional<int>(j, "max_memory");
    tc.points = get_value_def(j, 1.0, "points");
    tc.mode = get_value_def(j, matching_mode::IGNORE_WHITESPACE, "mode");
    tc.is_hidden = get_value_def(j, false, "is_hidden");
    tc.is_active = get_value_def(j, true, "is_active");
    tc.order = get_value_def(j, 0, "order");

    if (tc.points < 0)
        throw invalid_argument("Points of test case " + tc.name + " must not be negative");
    if ((tc.timeout && *tc.timeout <= 0) || (tc.max_memory && *tc.max_memory <= 0))
        throw invalid_argument("Resource overrides of test case " + tc.name + " must be positive");
}

void to_json(nlohmann::json &j, const test_result &result) {
    j = {{"test_case_id", result.test_case_id},
         {"test_case_name", result.test_case_name},
         {"status", result.status},
         {"actual_output", result.actual_output},
         {"actual_error", result.actual_error},
         {"actual_exit_code", nlohmann::optional_to_json(result.actual_exit_code)},
         {"similarity", result.similarity},
         {"points_earned", result.points_earned},
         {"points_possible", result.points_possible},
         {"diff", result.diff},
         {"feedback", result.feedback},
         {"execution_time", result.execution_time},
         {"memory_used", result.memory_used}};
}

void from_json(const nlohmann::json &j, test_result &result) {
    using namespace nlohmann;
    result.test_case_id = get_value<string>(j, "test_case_id");
    result.test_case_name = get_value_def<string>(j, "", "test_case_name");
    result.status = get_value<test_status>(j, "status");
    result.actual_output = get_value_def<string>(j, "", "actual_output");
    result.actual_error = get_value_def<string>(j, "", "actual_error");
    result.actual_exit_code = get_optional<int>(j, "actual_exit_code");
    result.similarity = get_value_def(j, 0.0, "similarity");
    result.points_earned = get_value_def(j, 0.0, "points_earned");
    result.points_possible = get_value_def(j, 0.0, "points_possible");
    result.diff = get_value_def<string>(j, "", "diff");
    result.feedback = get_value_def<string>(j, "", "feedback");
    result.execution_time = get_value_def(j, 0.0, "execution_time");
    result.memory_used = get_value_def<int64_t>(j, 0, "memory_used");
}

void to_json(nlohmann::json &j, const grade_report &report) {
    j = {{"total_tests", report.total_tests},
         {"passed", report.passed},
         {"failed", report.failed},
         {"total_points", report.total_points},
         {"earned_points", report.earned_points},
         {"percentage", report.percentage},
         {"results", report.results}};
}

void from_json(const nlohmann::json &j, grade_report &report) {
    using namespace nlohmann;
    report.total_tests = get_value<int>(j, "total_tests");
    report.passed = get_value<int>(j, "passed");
    report.failed = get_value<int>(j, "failed");
    report.total_points = get_value<double>(j, "total_points");
    report.earned_points = get_value<double>(j, "earned_points");
    report.percentage = get_value<double>(j, "percentage");
    report.results = get_value_def(j, vector<test_result>(), "results");
}

}  // namespace sandbox

#include "execution/execution.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>
#include "common/json_utils.hpp"
#include "common/utils.hpp"

namespace sandbox {
using namespace std;

// clang-format off
static const unordered_map<execution_kind, const char *> execution_kind_string = boost::assign::map_list_of
    (execution_kind::PLAYGROUND, "playground")
    (execution_kind::EXERCISE, "exercise")
    (execution_kind::ASSESSMENT, "assessment")
    (execution_kind::TEST, "test")
    (execution_kind::DEBUG, "debug");
// clang-format on

bool execution::success() const {
    return status == execution_status::COMPLETED && exit_code && *exit_code == 0;
}

const char *get_display_message(execution_kind kind) {
    return execution_kind_string.at(kind);
}

void to_json(nlohmann::json &j, const execution_kind &kind) {
    j = get_display_message(kind);
}

void from_json(const nlohmann::json &j, execution_kind &kind) {
    string text = j.get<string>();
    for (auto &[value, name] : execution_kind_string)
        if (text == name) {
            kind = value;
            return;
        }
    throw invalid_argument("Unrecognized execution kind " + text);
}

static nlohmann::json time_to_json(const optional<chrono::system_clock::time_point> &time) {
    return time ? nlohmann::json(to_millis(*time)) : nlohmann::json(nullptr);
}

void to_json(nlohmann::json &j, const execution &e) {
    j = {{"id", e.id},
         {"user_id", e.user_id},
         {"environment_id", e.environment_id},
         {"language", e.language},
         {"kind", e.kind},
         {"source_code", e.source_code},
         {"stdin_input", e.stdin_input},
         {"argv", e.argv},
         {"env_vars", e.env_vars},
         {"exercise_id", nlohmann::optional_to_json(e.exercise_id)},
         {"parent_id", nlohmann::optional_to_json(e.parent_id)},
         {"timeout_override", nlohmann::optional_to_json(e.timeout_override)},
         {"memory_override", nlohmann::optional_to_json(e.memory_override)},
         {"stdout_output", e.stdout_output},
         {"stderr_output", e.stderr_output},
         {"stdout_truncated", e.stdout_truncated},
         {"stderr_truncated", e.stderr_truncated},
         {"exit_code", nlohmann::optional_to_json(e.exit_code)},
         {"execution_time", e.execution_time},
         {"cpu_time", e.cpu_time},
         {"memory_used", e.memory_used},
         {"status", e.status},
         {"container_id", e.container_id},
         {"error_message", e.error_message},
         {"grade", nlohmann::optional_to_json(e.grade)},
         {"created_at", to_millis(e.created_at)},
         {"started_at", time_to_json(e.started_at)},
         {"completed_at", time_to_json(e.completed_at)}};
}

void from_json(const nlohmann::json &j, execution &e) {
    using namespace nlohmann;
    e.id = get_value<string>(j, "id");
    e.user_id = get_value<string>(j, "user_id");
    e.environment_id = get_value<string>(j, "environment_id");
    e.language = get_value_def<string>(j, "", "language");
    e.kind = get_value<execution_kind>(j, "kind");
    e.source_code = get_value_def<string>(j, "", "source_code");
    e.stdin_input = get_value_def<string>(j, "", "stdin_input");
    e.argv = get_value_def(j, vector<string>(), "argv");
    e.env_vars = get_value_def(j, map<string, string>(), "env_vars");
    e.exercise_id = get_optional<string>(j, "exercise_id");
    e.parent_id = get_optional<string>(j, "parent_id");
    e.timeout_override = get_optional<int>(j, "timeout_override");
    e.memory_override = get_optional<int>(j, "memory_override");
    e.stdout_output = get_value_def<string>(j, "", "stdout_output");
    e.stderr_output = get_value_def<string>(j, "", "stderr_output");
    e.stdout_truncated = get_value_def(j, false, "stdout_truncated");
    e.stderr_truncated = get_value_def(j, false, "stderr_truncated");
    e.exit_code = get_optional<int>(j, "exit_code");
    e.execution_time = get_value_def(j, 0.0, "execution_time");
    e.cpu_time = get_value_def(j, 0.0, "cpu_time");
    e.memory_used = get_value_def<int64_t>(j, 0, "memory_used");
    e.status = get_value<execution_status>(j, "status");
    e.container_id = get_value_def<string>(j, "", "container_id");
    e.error_message = get_value_def<string>(j, "", "error_message");
    e.grade = get_optional<grade_report>(j, "grade");
    e.created_at = from_millis(get_value<int64_t>(j, "created_at"));
    if (auto started = get_optional<int64_t>(j, "started_at"))
        e.started_at = from_millis(*started);
    else
        e.started_at.reset();
    if (auto completed = get_optional<int64_t>(j, "completed_at"))
        e.completed_at = from_millis(*completed);
    else
        e.completed_at.reset();
}

}  // namespace sandbox

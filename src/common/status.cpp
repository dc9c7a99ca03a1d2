#include "common/status.hpp"
#include <fmt/core.h>
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace sandbox {
using namespace std;

// clang-format off
static const unordered_map<execution_status, const char *> execution_status_string = boost::assign::map_list_of
    (execution_status::PENDING, "pending")
    (execution_status::QUEUED, "queued")
    (execution_status::RUNNING, "running")
    (execution_status::COMPLETED, "completed")
    (execution_status::FAILED, "failed")
    (execution_status::TIMEOUT, "timeout")
    (execution_status::MEMORY_LIMIT_EXCEEDED, "memory_limit")
    (execution_status::CANCELLED, "cancelled")
    (execution_status::ERROR, "error");

static const unordered_map<test_status, const char *> test_status_string = boost::assign::map_list_of
    (test_status::PASSED, "passed")
    (test_status::FAILED, "failed")
    (test_status::ERROR, "error")
    (test_status::TIMEOUT, "timeout")
    (test_status::MEMORY_EXCEEDED, "memory_exceeded")
    (test_status::SKIPPED, "skipped");
// clang-format on

bool is_terminal(execution_status status) {
    switch (status) {
        case execution_status::PENDING:
        case execution_status::QUEUED:
        case execution_status::RUNNING:
            return false;
        default:
            return true;
    }
}

bool can_transition(execution_status from, execution_status to) {
    switch (from) {
        case execution_status::PENDING:
            return to == execution_status::QUEUED;
        case execution_status::QUEUED:
            // 排队时可能被停止，也可能在启动容器之前就遇到宿主侧错误
            return to == execution_status::RUNNING ||
                   to == execution_status::CANCELLED ||
                   to == execution_status::FAILED ||
                   to == execution_status::ERROR;
        case execution_status::RUNNING:
            return is_terminal(to);
        default:
            return false;
    }
}

const char *get_display_message(execution_status status) {
    return execution_status_string.at(status);
}

const char *get_display_message(test_status status) {
    return test_status_string.at(status);
}

string get_user_message(execution_status status, int exit_code) {
    switch (status) {
        case execution_status::PENDING:
        case execution_status::QUEUED:
            return "Your program is waiting to run.";
        case execution_status::RUNNING:
            return "Your program is running.";
        case execution_status::COMPLETED:
            if (exit_code == 0) return "Your program finished successfully.";
            return fmt::format("Your program crashed with exit code {}.", exit_code);
        case execution_status::TIMEOUT:
            return "Your program exceeded the time limit.";
        case execution_status::MEMORY_LIMIT_EXCEEDED:
            return "Your program used too much memory.";
        case execution_status::CANCELLED:
            return "Your program was stopped.";
        case execution_status::FAILED:
        case execution_status::ERROR:
            return "The sandbox could not run your program. This is not a problem with your code, please try again later.";
    }
    return "";
}

template <typename Enum>
static Enum parse_enum(const unordered_map<Enum, const char *> &table, const string &text) {
    for (auto &[value, name] : table)
        if (text == name) return value;
    throw invalid_argument("Unrecognized status " + text);
}

void to_json(nlohmann::json &j, const execution_status &status) {
    j = get_display_message(status);
}

void from_json(const nlohmann::json &j, execution_status &status) {
    status = parse_enum(execution_status_string, j.get<string>());
}

void to_json(nlohmann::json &j, const test_status &status) {
    j = get_display_message(status);
}

void from_json(const nlohmann::json &j, test_status &status) {
    status = parse_enum(test_status_string, j.get<string>());
}

}  // namespace sandbox

#include "grading/compare.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include <cctype>
#include <map>
#include <tuple>
#include "common/json_utils.hpp"

namespace sandbox {
using namespace std;

// 逐字符比较的规模上限，超出后按行比较
static const size_t CHAR_COMPARE_LIMIT = 4'000'000;

template <typename Seq>
static tuple<size_t, size_t, size_t> find_longest_match(const Seq &a, const Seq &b, size_t alo, size_t ahi, size_t blo, size_t bhi) {
    size_t best_i = alo, best_j = blo, best_size = 0;
    // prev[j - blo + 1] 为以 a[i - 1] 和 b[j] 结尾的公共子串长度
    vector<size_t> prev(bhi - blo + 1, 0), cur(bhi - blo + 1, 0);
    for (size_t i = alo; i < ahi; ++i) {
        for (size_t j = blo; j < bhi; ++j) {
            size_t k = a[i] == b[j] ? prev[j - blo] + 1 : 0;
            cur[j - blo + 1] = k;
            if (k > best_size) {
                best_i = i + 1 - k;
                best_j = j + 1 - k;
                best_size = k;
            }
        }
        swap(prev, cur);
    }
    return {best_i, best_j, best_size};
}

template <typename Seq>
static size_t matching_characters(const Seq &a, const Seq &b) {
    size_t matches = 0;
    vector<tuple<size_t, size_t, size_t, size_t>> queue{{0, a.size(), 0, b.size()}};
    while (!queue.empty()) {
        auto [alo, ahi, blo, bhi] = queue.back();
        queue.pop_back();
        if (alo >= ahi || blo >= bhi) continue;
        auto [i, j, k] = find_longest_match(a, b, alo, ahi, blo, bhi);
        if (k == 0) continue;
        matches += k;
        queue.emplace_back(alo, i, blo, j);
        queue.emplace_back(i + k, ahi, j + k, bhi);
    }
    return matches;
}

static vector<string_view> split_lines(string_view text) {
    vector<string_view> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == string_view::npos) end = text.size();
        else ++end;
        lines.push_back(text.substr(start, end - start));
        start = end;
    }
    return lines;
}

// 多重集合交集的大小，是匹配长度的上界
template <typename Seq>
static size_t common_elements(const Seq &a, const Seq &b) {
    map<typename Seq::value_type, long> counts;
    for (auto &x : b) ++counts[x];
    size_t matches = 0;
    for (auto &x : a) {
        auto it = counts.find(x);
        if (it != counts.end() && it->second > 0) {
            --it->second;
            ++matches;
        }
    }
    return matches;
}

static double ratio_of(size_t matches, size_t total) {
    return total == 0 ? 1.0 : 2.0 * matches / total;
}

double similarity_ratio(string_view a, string_view b) {
    if (a.empty() && b.empty()) return 1.0;
    if (a.size() * b.size() <= CHAR_COMPARE_LIMIT)
        return ratio_of(matching_characters(a, b), a.size() + b.size());

    auto la = split_lines(a), lb = split_lines(b);
    if (la.size() * lb.size() <= CHAR_COMPARE_LIMIT)
        return ratio_of(matching_characters(la, lb), la.size() + lb.size());
    return ratio_of(common_elements(la, lb), la.size() + lb.size());
}

static string collapse_whitespace(const string &text) {
    string result;
    bool in_space = false;
    for (char ch : text) {
        if (isspace((unsigned char)ch)) {
            in_space = true;
        } else {
            if (in_space && !result.empty()) result += ' ';
            in_space = false;
            result += ch;
        }
    }
    return result;
}

string normalize(const string &text, matching_mode mode) {
    switch (mode) {
        case matching_mode::STRICT:
            return text;
        case matching_mode::IGNORE_CASE:
            return boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(text));
        case matching_mode::IGNORE_WHITESPACE:
        case matching_mode::SIMILARITY:
            return collapse_whitespace(text);
    }
    return text;
}

string line_diff(const string &expected, const string &actual, size_t max_lines) {
    auto a = split_lines(expected), b = split_lines(actual);
    if (a.size() * b.size() > max_lines * max_lines) {
        a.resize(min(a.size(), max_lines));
        b.resize(min(b.size(), max_lines));
    }

    // lcs[i][j] 为 a[i..] 和 b[j..] 的最长公共子序列长度
    vector<vector<size_t>> lcs(a.size() + 1, vector<size_t>(b.size() + 1, 0));
    for (size_t i = a.size(); i-- > 0;)
        for (size_t j = b.size(); j-- > 0;)
            lcs[i][j] = a[i] == b[j] ? lcs[i + 1][j + 1] + 1 : max(lcs[i + 1][j], lcs[i][j + 1]);

    string diff;
    auto emit = [&](const char *prefix, string_view line) {
        diff += prefix;
        diff += line;
        if (line.empty() || line.back() != '\n') diff += '\n';
    };
    size_t i = 0, j = 0;
    while (i < a.size() && j < b.size()) {
        if (a[i] == b[j]) {
            emit("  ", a[i]);
            ++i, ++j;
        } else if (lcs[i + 1][j] >= lcs[i][j + 1]) {
            emit("- ", a[i++]);
        } else {
            emit("+ ", b[j++]);
        }
    }
    while (i < a.size()) emit("- ", a[i++]);
    while (j < b.size()) emit("+ ", b[j++]);
    return diff;
}

static test_status status_of(execution_status status) {
    switch (status) {
        case execution_status::COMPLETED:
            return test_status::PASSED;
        case execution_status::TIMEOUT:
            return test_status::TIMEOUT;
        case execution_status::MEMORY_LIMIT_EXCEEDED:
            return test_status::MEMORY_EXCEEDED;
        case execution_status::CANCELLED:
            return test_status::SKIPPED;
        default:
            return test_status::ERROR;
    }
}

test_result evaluate(const test_case &tc, const execution_result &result, const grading_policy &policy) {
    test_result r;
    r.test_case_id = tc.id;
    r.test_case_name = tc.name;
    r.actual_output = result.stdout_output;
    r.actual_error = result.stderr_output;
    r.actual_exit_code = result.exit_code;
    r.points_possible = tc.points;
    r.execution_time = result.wall_time;
    r.memory_used = result.memory_used;

    if (result.status != execution_status::COMPLETED) {
        r.status = status_of(result.status);
        r.feedback = get_user_message(result.status, result.exit_code.value_or(-1));
        if (r.status == test_status::ERROR && !result.error_message.empty())
            r.feedback += ": " + result.error_message;
        return r;
    }

    int exit_code = result.exit_code.value_or(-1);
    if (exit_code != tc.expected_exit_code) {
        r.status = test_status::FAILED;
        r.feedback = fmt::format("Expected exit code {}, but got {}", tc.expected_exit_code, exit_code);
        return r;
    }

    if (!tc.expected_error.empty() && result.stderr_output.find(tc.expected_error) == string::npos) {
        r.status = test_status::FAILED;
        r.feedback = tc.is_hidden ? "Expected error output was not produced"
                                  : fmt::format("Expected error output containing \"{}\"", tc.expected_error);
        return r;
    }

    string expected = normalize(tc.expected_output, tc.mode);
    string actual = normalize(result.stdout_output, tc.mode);
    r.similarity = similarity_ratio(expected, actual);

    bool passed = tc.mode == matching_mode::SIMILARITY ? r.similarity >= policy.pass_threshold : expected == actual;
    if (passed) {
        r.status = test_status::PASSED;
        r.points_earned = tc.points;
        r.feedback = "Output matches the expected output";
        return r;
    }

    r.status = test_status::FAILED;
    if (r.similarity > policy.partial_credit_cutoff)
        r.points_earned = tc.points * r.similarity;
    r.feedback = fmt::format("Output does not match the expected output ({:.0f}% similar)", r.similarity * 100);
    if (!tc.is_hidden)
        r.diff = line_diff(tc.expected_output, result.stdout_output);
    return r;
}

void from_json(const nlohmann::json &j, grading_policy &policy) {
    using namespace nlohmann;
    policy.pass_threshold = get_value_def(j, 0.9, "pass_threshold");
    policy.partial_credit_cutoff = get_value_def(j, 0.5, "partial_credit_cutoff");
    if (policy.pass_threshold < 0 || policy.pass_threshold > 1 ||
        policy.partial_credit_cutoff < 0 || policy.partial_credit_cutoff > 1)
        throw invalid_argument("Grading thresholds must be between 0 and 1");
}

void to_json(nlohmann::json &j, const grading_policy &policy) {
    j = {{"pass_threshold", policy.pass_threshold},
         {"partial_credit_cutoff", policy.partial_credit_cutoff}};
}

}  // namespace sandbox

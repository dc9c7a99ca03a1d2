#include "environment/registry.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include <cctype>
#include <mutex>
#include <stdexcept>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace sandbox {
using namespace std;

/**
 * @brief 按数字逐段比较版本号，3.9 < 3.11
 * 非数字的段按字符串比较
 */
static int compare_version(const string &a, const string &b) {
    vector<string> pa, pb;
    boost::split(pa, a, boost::is_any_of(".-"));
    boost::split(pb, b, boost::is_any_of(".-"));
    auto numeric = [](const string &part) {
        return !part.empty() && all_of(part.begin(), part.end(), [](char ch) { return isdigit((unsigned char)ch); });
    };
    for (size_t i = 0; i < max(pa.size(), pb.size()); ++i) {
        if (i >= pa.size()) return -1;
        if (i >= pb.size()) return 1;
        if (numeric(pa[i]) && numeric(pb[i])) {
            if (pa[i].size() != pb[i].size()) return pa[i].size() < pb[i].size() ? -1 : 1;
        }
        int c = pa[i].compare(pb[i]);
        if (c != 0) return c < 0 ? -1 : 1;
    }
    return 0;
}

/**
 * @brief 排序规则：priority 降序，然后语言升序，然后版本降序
 */
static bool environment_order(const execution_environment &a, const execution_environment &b) {
    if (a.priority != b.priority) return a.priority > b.priority;
    if (a.language != b.language) return a.language < b.language;
    return compare_version(a.version, b.version) > 0;
}

environment_registry::environment_registry(shared_ptr<strategy_registry> strategies)
    : strategies(move(strategies)) {}

void environment_registry::add(const execution_environment &env) {
    auto strategy = strategies->find(env.language);
    if (!strategy)
        throw invalid_argument("No execution strategy registered for language " + env.language);
    // 提前渲染一次命令模板，配置错误在加载时就暴露出来
    strategy->entry_script(env);
    assert_safe_path(env.source_file);
    for (auto &[file, content] : env.scaffold_files)
        assert_safe_path(file);

    unique_lock lock(mut);
    if (environments.count(env.id))
        throw invalid_argument("Duplicate environment id " + env.id);
    for (auto &[id, existing] : environments)
        if (existing.language == env.language && existing.version == env.version)
            throw invalid_argument("Duplicate environment " + env.language + " " + env.version);
    environments[env.id] = env;
    LOG(INFO) << "Registered environment " << env.id << " (" << strategy->name() << ", " << env.image << ")";
}

void environment_registry::load(const nlohmann::json &j) {
    if (!j.is_array())
        throw invalid_argument("Environment catalog must be an array");
    for (auto &item : j)
        add(item.get<execution_environment>());
}

void environment_registry::load(const filesystem::path &path) {
    load(nlohmann::json::parse(read_file_content(path)));
}

vector<execution_environment> environment_registry::active_of(const string &language) const {
    vector<execution_environment> result;
    for (auto &[id, env] : environments)
        if (env.language == language && env.is_active())
            result.push_back(env);
    sort(result.begin(), result.end(), environment_order);
    return result;
}

execution_environment environment_registry::resolve(const string &language, const optional<string> &version) const {
    shared_lock lock(mut);
    auto candidates = active_of(language);
    if (candidates.empty())
        throw environment_not_found("No active environment for language " + language);

    if (version) {
        for (auto &env : candidates)
            if (env.version == *version) return env;
    }

    for (auto &env : candidates)
        if (env.is_default) return env;
    return candidates.front();
}

execution_environment environment_registry::get(const string &environment_id) const {
    {
        shared_lock lock(mut);
        auto it = environments.find(environment_id);
        if (it != environments.end()) {
            if (!it->second.is_active())
                throw environment_not_found("Environment " + environment_id + " is " + get_display_message(it->second.status));
            return it->second;
        }
    }

    auto pos = environment_id.find(':');
    if (pos == string::npos)
        return resolve(environment_id);
    // 指定了不存在的版本时，退化到该语言的默认版本
    return resolve(environment_id.substr(0, pos), environment_id.substr(pos + 1));
}

set<feature> environment_registry::list_features(const execution_environment &env) const {
    return env.features();
}

vector<string> environment_registry::languages() const {
    shared_lock lock(mut);
    set<string> result;
    for (auto &[id, env] : environments)
        if (env.is_active()) result.insert(env.language);
    return vector<string>(result.begin(), result.end());
}

vector<execution_environment> environment_registry::defaults() const {
    vector<execution_environment> result;
    for (auto &language : languages()) {
        try {
            result.push_back(resolve(language));
        } catch (environment_not_found &e) {
            // 另一个线程刚刚下线了这个语言的最后一个运行环境
            LOG(WARNING) << e.what();
        }
    }
    sort(result.begin(), result.end(), environment_order);
    return result;
}

vector<execution_environment> environment_registry::list(const optional<feature> &required) const {
    shared_lock lock(mut);
    vector<execution_environment> result;
    for (auto &[id, env] : environments) {
        if (!env.is_active()) continue;
        if (required && !env.features().count(*required)) continue;
        result.push_back(env);
    }
    sort(result.begin(), result.end(), environment_order);
    return result;
}

void environment_registry::set_status(const string &environment_id, environment_status status) {
    unique_lock lock(mut);
    auto it = environments.find(environment_id);
    if (it == environments.end())
        throw environment_not_found("Environment " + environment_id + " does not exist");
    it->second.status = status;
    LOG(INFO) << "Environment " << environment_id << " is now " << get_display_message(status);
}

shared_ptr<const language_strategy> environment_registry::strategy_for(const execution_environment &env) const {
    auto strategy = strategies->find(env.language);
    if (!strategy)
        throw environment_not_found("No execution strategy registered for language " + env.language);
    return strategy;
}

}  // namespace sandbox

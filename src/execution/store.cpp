#include "execution/store.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <stdexcept>
#include "common/exceptions.hpp"

namespace sandbox {
using namespace std;

execution_store::~execution_store() = default;

execution execution_store::get(const string &id) const {
    auto result = find(id);
    if (!result) throw not_found("Execution " + id + " does not exist");
    return *result;
}

void memory_store::insert(const execution &e) {
    scoped_lock guard(mut);
    if (executions.count(e.id))
        throw invalid_argument("Duplicate execution id " + e.id);
    executions[e.id] = e;
}

optional<execution> memory_store::find(const string &id) const {
    scoped_lock guard(mut);
    auto it = executions.find(id);
    if (it == executions.end()) return nullopt;
    return it->second;
}

bool memory_store::transition(const string &id, execution_status to, const function<void(execution &)> &fill) {
    scoped_lock guard(mut);
    auto it = executions.find(id);
    if (it == executions.end()) return false;
    execution &e = it->second;
    if (!can_transition(e.status, to)) return false;
    if (fill) {
        fill(e);
    }
    e.status = to;
    return true;
}

void memory_store::update(const string &id, const function<void(execution &)> &mutator) {
    scoped_lock guard(mut);
    auto it = executions.find(id);
    if (it == executions.end())
        throw not_found("Execution " + id + " does not exist");
    execution_status status = it->second.status;
    mutator(it->second);
    if (it->second.status != status) {
        it->second.status = status;
        throw invalid_state("Status of execution " + id + " can only be changed by transition");
    }
}

bool memory_store::remove(const string &id) {
    scoped_lock guard(mut);
    return executions.erase(id) > 0;
}

vector<execution> memory_store::list_by_user(const string &user_id, size_t limit) const {
    vector<execution> result;
    {
        scoped_lock guard(mut);
        for (auto &[id, e] : executions)
            if (e.user_id == user_id) result.push_back(e);
    }
    sort(result.begin(), result.end(), [](const execution &a, const execution &b) {
        return a.created_at > b.created_at;
    });
    if (limit > 0 && result.size() > limit)
        result.resize(limit);
    return result;
}

vector<execution> memory_store::list_between(chrono::system_clock::time_point from, chrono::system_clock::time_point to) const {
    scoped_lock guard(mut);
    vector<execution> result;
    for (auto &[id, e] : executions)
        if (e.created_at >= from && e.created_at < to) result.push_back(e);
    return result;
}

void memory_store::retain(const function<bool(execution &)> &callback) {
    scoped_lock guard(mut);
    for (auto it = executions.begin(); it != executions.end();) {
        if (callback(it->second))
            ++it;
        else
            it = executions.erase(it);
    }
}

size_t memory_store::size() const {
    scoped_lock guard(mut);
    return executions.size();
}

nlohmann::json memory_store::snapshot() const {
    scoped_lock guard(mut);
    nlohmann::json j = nlohmann::json::array();
    for (auto &[id, e] : executions)
        j.push_back(e);
    return j;
}

void memory_store::restore(const nlohmann::json &j) {
    if (!j.is_array())
        throw invalid_argument("Execution snapshot must be an array");
    map<string, execution> loaded;
    for (auto &item : j) {
        execution e = item.get<execution>();
        if (!is_terminal(e.status)) {
            LOG(WARNING) << "Execution " << e.id << " was " << get_display_message(e.status) << " when the daemon stopped, marking it as error";
            e.status = execution_status::ERROR;
            e.error_message = "The sandbox was restarted before the execution finished";
        }
        loaded[e.id] = move(e);
    }
    scoped_lock guard(mut);
    executions = move(loaded);
}

}  // namespace sandbox

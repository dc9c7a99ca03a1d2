#include "sandbox/limiter.hpp"
#include <chrono>

namespace sandbox {
using namespace std;

concurrency_slot::concurrency_slot(concurrency_limiter *limiter, const string &environment_id)
    : limiter(limiter), environment_id(environment_id) {}

concurrency_slot::concurrency_slot(concurrency_slot &&other)
    : limiter(other.limiter), environment_id(move(other.environment_id)) {
    other.limiter = nullptr;
}

concurrency_slot::~concurrency_slot() {
    if (limiter) limiter->release(environment_id);
}

concurrency_limiter::concurrency_limiter(int global_limit, int default_environment_limit)
    : global_limit(global_limit), default_environment_limit(default_environment_limit) {}

bool concurrency_limiter::has_room(const string &environment_id, int environment_limit) const {
    int limit = environment_limit > 0 ? environment_limit : default_environment_limit;
    auto it = per_environment.find(environment_id);
    int current = it == per_environment.end() ? 0 : it->second;
    return total < global_limit && current < limit;
}

optional<concurrency_slot> concurrency_limiter::acquire(const string &environment_id, int environment_limit, const function<bool()> &cancelled) {
    unique_lock lock(mut);
    while (!has_room(environment_id, environment_limit)) {
        if (cancelled && cancelled()) return nullopt;
        // 定期醒来检查是否被取消
        cond.wait_for(lock, chrono::milliseconds(100));
    }
    if (cancelled && cancelled()) return nullopt;
    ++total;
    ++per_environment[environment_id];
    return concurrency_slot(this, environment_id);
}

optional<concurrency_slot> concurrency_limiter::try_acquire(const string &environment_id, int environment_limit) {
    scoped_lock lock(mut);
    if (!has_room(environment_id, environment_limit)) return nullopt;
    ++total;
    ++per_environment[environment_id];
    return concurrency_slot(this, environment_id);
}

int concurrency_limiter::running() const {
    scoped_lock lock(mut);
    return total;
}

int concurrency_limiter::running(const string &environment_id) const {
    scoped_lock lock(mut);
    auto it = per_environment.find(environment_id);
    return it == per_environment.end() ? 0 : it->second;
}

void concurrency_limiter::release(const string &environment_id) {
    {
        scoped_lock lock(mut);
        --total;
        if (--per_environment[environment_id] <= 0)
            per_environment.erase(environment_id);
    }
    cond.notify_all();
}

}  // namespace sandbox

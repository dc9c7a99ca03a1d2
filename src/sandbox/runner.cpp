#include "sandbox/runner.hpp"
#include <glog/logging.h>
#include <fmt/core.h>
#include <algorithm>
#include <csignal>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace sandbox {
using namespace std;

// 等待容器结束时，每隔多久采样一次资源使用情况
static const chrono::milliseconds SAMPLE_INTERVAL(250);

// 超出 CPU 时间限制时，内核发送 SIGXCPU，sh 报告的退出码为 128 + SIGXCPU
static const int CPU_LIMIT_EXIT_CODE = 128 + SIGXCPU;

// 采样得到的 CPU 时间最多落后两个采样周期
static const double CPU_LIMIT_TOLERANCE = 0.5;

execution_result execution_result::of(const execution &e) {
    execution_result result;
    result.stdout_output = e.stdout_output;
    result.stderr_output = e.stderr_output;
    result.stdout_truncated = e.stdout_truncated;
    result.stderr_truncated = e.stderr_truncated;
    result.exit_code = e.exit_code;
    result.wall_time = e.execution_time;
    result.cpu_time = e.cpu_time;
    result.memory_used = e.memory_used;
    result.status = e.status;
    result.error_message = e.error_message;
    return result;
}

sandbox_runner::sandbox_runner(execution_store &store,
                               const environment_registry &environments,
                               container_runtime &runtime,
                               concurrency_limiter &limiter,
                               const workspace_builder &builder)
    : store(store), environments(environments), runtime(runtime), limiter(limiter), builder(builder) {}

execution_status sandbox_runner::current_status(const string &execution_id) const {
    auto e = store.find(execution_id);
    return e ? e->status : execution_status::ERROR;
}

execution_result sandbox_runner::result_of(const string &execution_id) const {
    auto e = store.find(execution_id);
    if (e) return execution_result::of(*e);
    execution_result result;
    result.status = execution_status::ERROR;
    result.error_message = "Execution " + execution_id + " does not exist";
    return result;
}

container_spec sandbox_runner::make_spec(const execution &e, const execution_environment &env, const filesystem::path &workspace) const {
    container_spec spec;
    spec.image = env.image;
    spec.command = {"/bin/sh", CONTAINER_WORKDIR + "/run.sh"};
    spec.command.insert(spec.command.end(), e.argv.begin(), e.argv.end());
    spec.workspace = workspace;
    spec.mount_path = CONTAINER_WORKDIR;

    int memory = e.memory_override.value_or(env.max_memory);
    int timeout = e.timeout_override.value_or(env.default_timeout);
    spec.env = e.env_vars;
    spec.env["TIMEOUT"] = to_string(timeout);
    spec.env["MAX_MEMORY"] = to_string(memory);
    spec.env["HOME"] = "/tmp";
    spec.labels["sandbox-engine.execution"] = e.id;
    spec.labels["sandbox-engine.user"] = e.user_id;

    spec.memory_bytes = (int64_t)memory * 1024 * 1024;
    spec.cpu_period = 100000;
    spec.cpu_quota = max<int64_t>(1000, (int64_t)(env.cpu_cores * spec.cpu_period));
    spec.cpu_time_limit = env.max_cpu_time;
    spec.file_size_bytes = (int64_t)env.max_file_size * 1024 * 1024;
    spec.pids_limit = PIDS_LIMIT;
    spec.tmpfs_mb = TMPFS_SIZE;
    spec.network = env.supports_networking;
    spec.user = fmt::format("{}:{}", SANDBOX_UID, SANDBOX_GID);
    // 编译器需要的最小能力集合
    spec.capabilities = {"CHOWN", "SETUID", "SETGID"};
    return spec;
}

void sandbox_runner::fail(const string &execution_id, execution_status status, const string &message) {
    bool changed = store.transition(execution_id, status, [&](execution &record) {
        record.error_message = message;
        record.completed_at = chrono::system_clock::now();
    });
    if (changed) {
        LOG(ERROR) << "Execution " << execution_id << " " << get_display_message(status) << ": " << message;
    } else {
        // 执行已经被停止，容器被删除导致的错误是预期的
        LOG(INFO) << "Execution " << execution_id << " was already " << get_display_message(current_status(execution_id))
                  << " when the error occurred: " << message;
    }
}

void sandbox_runner::teardown(const string &execution_id, const string &container_id) {
    try {
        if (runtime.remove(container_id))
            LOG(INFO) << "Container " << container_id << " of execution " << execution_id << " removed";
        else
            LOG(WARNING) << "Container " << container_id << " of execution " << execution_id << " was already removed";
    } catch (sandbox_exception &ex) {
        LOG(ERROR) << "Unable to remove container " << container_id << " of execution " << execution_id << ": " << ex.what();
    }
}

static void append_marker(string &output, bool truncated) {
    if (truncated) output += TRUNCATION_MARKER;
}

execution_result sandbox_runner::execute(const string &execution_id, bool finalize) {
    auto found = store.find(execution_id);
    if (!found) {
        LOG(ERROR) << "Execution " << execution_id << " does not exist";
        return result_of(execution_id);
    }
    execution e = *found;
    if (e.status != execution_status::QUEUED) {
        LOG(WARNING) << "Execution " << execution_id << " is " << get_display_message(e.status) << ", not running it";
        return execution_result::of(e);
    }

    try {
        execution_environment env = environments.get(e.environment_id);
        auto strategy = environments.strategy_for(env);

        // 等待并发名额期间保持 QUEUED，停止请求可以直接取消
        auto slot = limiter.acquire(env.id, env.max_concurrent, [&] {
            return current_status(execution_id) != execution_status::QUEUED;
        });
        if (!slot) return result_of(execution_id);

        if (!store.transition(execution_id, execution_status::RUNNING, [](execution &record) {
                record.started_at = chrono::system_clock::now();
            }))
            return result_of(execution_id);

        workspace_handle workspace = builder.prepare(e, env, *strategy);

        string container_id;
        try {
            container_id = runtime.create(make_spec(e, env, workspace.path()));
        } catch (sandbox_launch_error &ex) {
            fail(execution_id, execution_status::FAILED, ex.what());
            return result_of(execution_id);
        }
        defer {
            teardown(execution_id, container_id);
        };

        // 立即记录容器 id，并发的停止请求才能找到容器
        store.update(execution_id, [&](execution &record) { record.container_id = container_id; });
        if (current_status(execution_id) != execution_status::RUNNING)
            return result_of(execution_id);

        try {
            runtime.start(container_id);
        } catch (sandbox_launch_error &ex) {
            fail(execution_id, execution_status::FAILED, ex.what());
            return result_of(execution_id);
        }
        LOG(INFO) << "Container " << container_id << " launched for execution " << execution_id << " (" << env.id << ")";
        elapsed_time timer;

        auto limit = chrono::milliseconds(chrono::seconds(e.timeout_override.value_or(env.default_timeout)));
        optional<int> exit_code;
        bool timed_out = false;
        container_usage peak;
        auto sample = [&] {
            auto usage = runtime.usage(container_id);
            peak.memory_peak = max(peak.memory_peak, usage.memory_peak);
            peak.cpu_seconds = max(peak.cpu_seconds, usage.cpu_seconds);
        };

        while (true) {
            auto remaining = limit - timer.duration<chrono::milliseconds>();
            if (remaining <= chrono::milliseconds::zero()) {
                timed_out = true;
                break;
            }
            exit_code = runtime.wait(container_id, min(remaining, SAMPLE_INTERVAL));
            sample();
            if (exit_code) break;
            if (current_status(execution_id) != execution_status::RUNNING)
                return result_of(execution_id);
        }

        if (timed_out) {
            LOG(INFO) << "Execution " << execution_id << " exceeded the time limit of " << limit.count() << "ms, stopping container " << container_id;
            try {
                runtime.stop(container_id, chrono::seconds(STOP_GRACE_PERIOD));
            } catch (sandbox_exception &ex) {
                // 容器稍后会被强制删除
                LOG(WARNING) << "Unable to stop container " << container_id << ": " << ex.what();
            }
        }
        double wall_time = timer.seconds();

        container_state state = runtime.inspect(container_id);
        container_output output = runtime.logs(container_id, env.max_output_size);
        sample();

        execution_status status = execution_status::COMPLETED;
        if (timed_out)
            status = execution_status::TIMEOUT;
        else if (state.oom_killed)
            status = execution_status::MEMORY_LIMIT_EXCEEDED;
        else if (exit_code && *exit_code == CPU_LIMIT_EXIT_CODE && peak.cpu_seconds + CPU_LIMIT_TOLERANCE >= env.max_cpu_time)
            status = execution_status::TIMEOUT;

        append_marker(output.out, output.out_truncated);
        append_marker(output.err, output.err_truncated);

        auto fill = [&](execution &record) {
            record.stdout_output = move(output.out);
            record.stderr_output = move(output.err);
            record.stdout_truncated = output.out_truncated;
            record.stderr_truncated = output.err_truncated;
            record.exit_code = timed_out ? state.exit_code : exit_code;
            record.execution_time = wall_time;
            record.cpu_time = peak.cpu_seconds;
            record.memory_used = peak.memory_peak;
            record.completed_at = chrono::system_clock::now();
        };

        if (!finalize) {
            // 结果写入记录但保持 RUNNING，由调用者转移到终止状态
            store.update(execution_id, fill);
            execution_result result = result_of(execution_id);
            if (result.status == execution_status::RUNNING) result.status = status;
            LOG(INFO) << "Execution " << execution_id << " " << get_display_message(status) << " in " << wall_time << "s, waiting to be finalized";
            return result;
        }

        bool recorded = store.transition(execution_id, status, fill);
        if (recorded)
            LOG(INFO) << "Execution " << execution_id << " " << get_display_message(status) << " in " << wall_time << "s";
    } catch (sandbox_launch_error &ex) {
        fail(execution_id, execution_status::FAILED, ex.what());
    } catch (sandbox_exception &ex) {
        fail(execution_id, execution_status::ERROR, ex.what());
    } catch (exception &ex) {
        fail(execution_id, execution_status::ERROR, ex.what());
    }
    return result_of(execution_id);
}

bool sandbox_runner::stop(const string &execution_id) {
    auto e = store.find(execution_id);
    if (!e) return false;

    auto mark_cancelled = [](execution &record) {
        record.completed_at = chrono::system_clock::now();
        record.error_message = "Execution was stopped";
    };

    if (e->status == execution_status::QUEUED) {
        if (store.transition(execution_id, execution_status::CANCELLED, mark_cancelled)) {
            LOG(INFO) << "Execution " << execution_id << " cancelled while queued";
            return true;
        }
        // 刚刚开始运行
        e = store.find(execution_id);
        if (!e) return false;
    }

    if (e->status != execution_status::RUNNING) return false;
    if (!store.transition(execution_id, execution_status::CANCELLED, mark_cancelled))
        return false;  // 刚刚自然结束

    string container_id = store.get(execution_id).container_id;
    LOG(INFO) << "Execution " << execution_id << " cancelled, stopping container " << container_id;
    if (!container_id.empty()) {
        // 先尝试优雅停止，失败也要继续删除容器
        try {
            runtime.stop(container_id, chrono::seconds(STOP_GRACE_PERIOD));
        } catch (sandbox_exception &ex) {
            LOG(WARNING) << "Unable to stop container " << container_id << ", removing it by force: " << ex.what();
        }
        teardown(execution_id, container_id);
    }
    // 容器 id 还没有记录时，运行器在记录容器 id 后会发现执行已被取消并删除容器
    return true;
}

}  // namespace sandbox

#include "sandbox/docker_runtime.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace sandbox {
using namespace std;
namespace fs = std::filesystem;

// docker 命令行自身的超时，避免守护进程卡死时 worker 永远阻塞
static const chrono::milliseconds DOCKER_CLI_TIMEOUT = chrono::seconds(60);

container_runtime::~container_runtime() = default;

static bool no_such_container(const process_result &result) {
    return result.err.find("No such container") != string::npos ||
           result.err.find("no such container") != string::npos;
}

static string describe_failure(const process_result &result) {
    if (result.timed_out) return "docker command timed out";
    string message = boost::algorithm::trim_copy(result.err);
    if (message.empty()) message = fmt::format("docker exited with code {}", result.exit_code);
    return message;
}

docker_runtime::docker_runtime(const string &binary, const fs::path &cgroup_root)
    : binary(binary), cgroup_root(cgroup_root) {}

bool docker_runtime::available() {
    try {
        auto result = capture_process({binary, "info", "--format", "{{.ServerVersion}}"}, "", chrono::seconds(10));
        return result.exit_code == 0 && !result.timed_out;
    } catch (system_error &e) {
        LOG(WARNING) << "Unable to query container runtime " << binary << ": " << e.what();
        return false;
    }
}

vector<string> docker_runtime::create_arguments(const container_spec &spec) {
    vector<string> args = {"create"};
    auto add = [&](const string &key, const string &value) {
        args.push_back(key);
        args.push_back(value);
    };

    add("--memory", to_string(spec.memory_bytes));
    add("--memory-swap", to_string(spec.memory_bytes));  // 禁止使用交换分区
    add("--cpu-period", to_string(spec.cpu_period));
    add("--cpu-quota", to_string(spec.cpu_quota));
    add("--pids-limit", to_string(spec.pids_limit));
    add("--cap-drop", "ALL");
    for (auto &cap : spec.capabilities)
        add("--cap-add", cap);
    add("--security-opt", "no-new-privileges");
    args.push_back("--read-only");
    add("--tmpfs", fmt::format("/tmp:rw,noexec,nosuid,size={}m", spec.tmpfs_mb));
    add("--network", spec.network ? "bridge" : "none");
    if (!spec.user.empty())
        add("--user", spec.user);
    if (spec.cpu_time_limit > 0)
        add("--ulimit", fmt::format("cpu={0}:{0}", spec.cpu_time_limit));
    if (spec.file_size_bytes > 0)
        add("--ulimit", fmt::format("fsize={0}:{0}", spec.file_size_bytes));
    add("--volume", fmt::format("{}:{}:rw", spec.workspace.string(), spec.mount_path));
    add("--workdir", spec.mount_path);
    for (auto &[key, value] : spec.env)
        add("--env", key + "=" + value);
    for (auto &[key, value] : spec.labels)
        add("--label", key + "=" + value);

    args.push_back(spec.image);
    args.insert(args.end(), spec.command.begin(), spec.command.end());
    return args;
}

string docker_runtime::create(const container_spec &spec) {
    vector<string> argv = {binary};
    auto args = create_arguments(spec);
    argv.insert(argv.end(), args.begin(), args.end());
    if (DEBUG) LOG(INFO) << boost::algorithm::join(argv, " ");

    process_result result;
    try {
        result = capture_process(argv, "", DOCKER_CLI_TIMEOUT);
    } catch (system_error &e) {
        throw sandbox_launch_error(string("Unable to invoke container runtime: ") + e.what());
    }
    if (result.exit_code != 0 || result.timed_out)
        throw sandbox_launch_error("Unable to create container from image " + spec.image + ": " + describe_failure(result));

    string id = boost::algorithm::trim_copy(result.out);
    if (id.empty())
        throw sandbox_launch_error("Container runtime returned an empty container id");
    return id;
}

void docker_runtime::start(const string &id) {
    process_result result;
    try {
        result = capture_process({binary, "start", id}, "", DOCKER_CLI_TIMEOUT);
    } catch (system_error &e) {
        throw sandbox_launch_error(string("Unable to invoke container runtime: ") + e.what());
    }
    if (result.exit_code != 0 || result.timed_out)
        throw sandbox_launch_error("Unable to start container " + id + ": " + describe_failure(result));
}

optional<int> docker_runtime::wait(const string &id, chrono::milliseconds timeout) {
    process_result result;
    try {
        result = capture_process({binary, "wait", id}, "", timeout);
    } catch (system_error &e) {
        throw execution_error(string("Unable to invoke container runtime: ") + e.what());
    }
    if (result.timed_out) return nullopt;
    if (result.exit_code != 0)
        throw execution_error("Unable to wait for container " + id + ": " + describe_failure(result));
    try {
        return boost::lexical_cast<int>(boost::algorithm::trim_copy(result.out));
    } catch (boost::bad_lexical_cast &) {
        throw execution_error("Unexpected output of docker wait: " + result.out);
    }
}

void docker_runtime::stop(const string &id, chrono::seconds grace) {
    // docker stop 先发送 SIGTERM，等待 grace 秒后发送 SIGKILL
    process_result result;
    try {
        result = capture_process({binary, "stop", "--time", to_string(grace.count()), id}, "", DOCKER_CLI_TIMEOUT + grace);
    } catch (system_error &e) {
        throw execution_error(string("Unable to invoke container runtime: ") + e.what());
    }
    if (result.exit_code == 0) return;
    if (no_such_container(result)) {
        LOG(WARNING) << "Container " << id << " was already removed when stopping it";
        return;
    }
    throw execution_error("Unable to stop container " + id + ": " + describe_failure(result));
}

container_state docker_runtime::inspect(const string &id) {
    process_result result;
    try {
        result = capture_process({binary, "inspect", "--format", "{{json .State}}", id}, "", DOCKER_CLI_TIMEOUT);
    } catch (system_error &e) {
        throw execution_error(string("Unable to invoke container runtime: ") + e.what());
    }
    if (result.exit_code != 0 || result.timed_out)
        throw execution_error("Unable to inspect container " + id + ": " + describe_failure(result));

    container_state state;
    try {
        auto j = nlohmann::json::parse(result.out);
        state.running = j.value("Running", false);
        state.oom_killed = j.value("OOMKilled", false);
        if (!state.running && j.count("ExitCode"))
            state.exit_code = j.at("ExitCode").get<int>();
    } catch (nlohmann::json::exception &e) {
        throw execution_error("Unexpected output of docker inspect: " + string(e.what()));
    }
    return state;
}

container_output docker_runtime::logs(const string &id, size_t limit) {
    process_result result;
    try {
        // docker logs 将容器的 stdout 输出到自己的 stdout，stderr 输出到自己的 stderr
        result = capture_process({binary, "logs", id}, "", DOCKER_CLI_TIMEOUT, limit);
    } catch (system_error &e) {
        throw execution_error(string("Unable to invoke container runtime: ") + e.what());
    }
    if (result.exit_code != 0 || result.timed_out)
        throw execution_error("Unable to read output of container " + id + ": " + describe_failure(result));

    container_output output;
    output.out = move(result.out);
    output.err = move(result.err);
    output.out_truncated = result.out_truncated;
    output.err_truncated = result.err_truncated;
    return output;
}

/**
 * @brief 读取 cgroup 文件中的一个整数
 * @param key 如果不为空，文件为 key value 的多行格式，比如 cpu.stat
 */
static optional<int64_t> read_cgroup_value(const fs::path &file, const string &key = "") {
    ifstream fin(file);
    if (!fin) return nullopt;
    if (key.empty()) {
        int64_t value;
        if (fin >> value) return value;
        return nullopt;
    }
    string name;
    int64_t value;
    while (fin >> name >> value)
        if (name == key) return value;
    return nullopt;
}

container_usage docker_runtime::usage(const string &id) {
    container_usage result;

    // cgroup v2，分别对应 systemd 和 cgroupfs 两种 cgroup driver
    for (const fs::path &dir : {cgroup_root / "system.slice" / ("docker-" + id + ".scope"), cgroup_root / "docker" / id}) {
        if (!fs::is_directory(dir)) continue;
        auto peak = read_cgroup_value(dir / "memory.peak");
        if (!peak) peak = read_cgroup_value(dir / "memory.current");
        auto cpu = read_cgroup_value(dir / "cpu.stat", "usage_usec");
        if (peak) result.memory_peak = *peak;
        if (cpu) result.cpu_seconds = *cpu / 1e6;
        return result;
    }

    // cgroup v1
    auto peak = read_cgroup_value(cgroup_root / "memory" / "docker" / id / "memory.max_usage_in_bytes");
    auto cpu = read_cgroup_value(cgroup_root / "cpuacct" / "docker" / id / "cpuacct.usage");
    if (peak) result.memory_peak = *peak;
    if (cpu) result.cpu_seconds = *cpu / 1e9;
    if (!peak && !cpu)
        LOG_FIRST_N(WARNING, 1) << "Unable to read cgroup usage of container " << id << " under " << cgroup_root << ", reporting zero usage";
    return result;
}

bool docker_runtime::remove(const string &id) {
    process_result result;
    try {
        result = capture_process({binary, "rm", "--force", id}, "", DOCKER_CLI_TIMEOUT);
    } catch (system_error &e) {
        throw execution_error(string("Unable to invoke container runtime: ") + e.what());
    }
    if (result.exit_code == 0) return true;
    if (no_such_container(result)) return false;
    throw execution_error("Unable to remove container " + id + ": " + describe_failure(result));
}

}  // namespace sandbox

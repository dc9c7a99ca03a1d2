#include <glog/logging.h>
#include <sys/stat.h>
#include <unistd.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <csignal>
#include <iostream>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "environment/registry.hpp"
#include "grading/grader.hpp"
#include "quota/quota.hpp"
#include "sandbox/docker_runtime.hpp"
#include "sandbox/limiter.hpp"
#include "sandbox/runner.hpp"
#include "sandbox/workspace.hpp"
#include "service/catalog.hpp"
#include "service/execution_service.hpp"
#include "service/state.hpp"
#include "stats/statistics.hpp"
#include "worker.hpp"
using namespace std;

static volatile sig_atomic_t interrupted = 0;

void sigintHandler(int /* signum */) {
    interrupted = 1;
}

template <typename T>
static void read_option(const boost::program_options::variables_map &vm, const char *option, const char *env, T &target) {
    if (vm.count(option)) {
        target = vm.at(option).as<T>();
    } else if (getenv(env)) {
        target = boost::lexical_cast<T>(getenv(env));
    }
}

template <typename T>
static T load_json_config(const filesystem::path &path, const T &def) {
    if (!filesystem::exists(path)) {
        LOG(INFO) << "Configuration file " << path << " does not exist, using defaults";
        return def;
    }
    try {
        return nlohmann::json::parse(sandbox::read_file_content(path)).get<T>();
    } catch (std::exception &e) {
        LOG(FATAL) << "Configuration file " << path << " is malformed: " << e.what();
    }
    return def;
}

static void print(const nlohmann::json &j) {
    cout << j.dump(2) << endl;
}

static int run_submission(sandbox::execution_service &service, const boost::program_options::variables_map &vm) {
    if (!vm.count("source")) {
        cerr << "run requires --source" << endl;
        return EXIT_FAILURE;
    }

    sandbox::submission request;
    request.user_id = vm["user"].as<string>();
    request.source_code = sandbox::read_file_content(vm["source"].as<string>());
    if (vm.count("environment")) request.environment_id = vm["environment"].as<string>();
    if (vm.count("stdin")) request.stdin_input = sandbox::read_file_content(vm["stdin"].as<string>());
    if (vm.count("exercise")) request.exercise_id = vm["exercise"].as<string>();
    if (vm.count("args")) request.argv = vm["args"].as<vector<string>>();
    request.on_test_result = [](const sandbox::test_result &result) {
        LOG(INFO) << "Test " << result.test_case_name << ": " << sandbox::get_display_message(result.status);
    };

    sandbox::execution e = service.submit_execution(request);
    auto deadline = chrono::steady_clock::now() + chrono::seconds(vm["wait"].as<int>());
    while (true) {
        try {
            e = service.wait_for(e.id, chrono::seconds(1));
            break;
        } catch (sandbox::execution_timeout &) {
            if (interrupted) {
                LOG(ERROR) << "Received SIGINT, stopping execution " << e.id;
                service.stop_execution(request.user_id, e.id);
                interrupted = 0;
            } else if (chrono::steady_clock::now() >= deadline) {
                LOG(ERROR) << "Execution " << e.id << " did not finish in time, stopping it";
                service.stop_execution(request.user_id, e.id);
                deadline = chrono::steady_clock::time_point::max();
            }
        }
    }

    print(e);
    cerr << sandbox::get_user_message(e.status, e.exit_code.value_or(-1)) << endl;
    return e.success() ? EXIT_SUCCESS : EXIT_FAILURE;
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    filesystem::path current(argv[0]);
    filesystem::path repo_dir(filesystem::weakly_canonical(current).parent_path().parent_path());

    signal(SIGINT, sigintHandler);
    // 外部命令可能不读 stdin，写管道时进程不能因为 SIGPIPE 退出
    signal(SIGPIPE, SIG_IGN);

    namespace po = boost::program_options;
    po::options_description desc("sandbox-engine options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("command", po::value<string>(), "run, stats, quota, environments or purge")
        ("config-dir", po::value<string>(), "set the directory with environments.json, quota.json, grading.json, exercises.json and users.json. You can either pass it from environ CONFIGDIR")
        ("work-dir", po::value<string>(), "set the directory to create execution workspaces in. You can either pass it from environ WORKDIR")
        ("state-file", po::value<string>(), "set the json file to persist executions and statistics across restarts. You can either pass it from environ STATEFILE")
        ("runtime", po::value<string>(), "set the container runtime executable, default to docker. You can either pass it from environ CONTAINERRUNTIME")
        ("sandbox-user", po::value<int>(), "set the uid running user programs, default to 65534. You can either pass it from environ SANDBOXUSER")
        ("sandbox-group", po::value<int>(), "set the gid running user programs, default to 65534. You can either pass it from environ SANDBOXGROUP")
        ("max-concurrent", po::value<int>(), "set the maximum number of running executions, default to 10. You can either pass it from environ MAXCONCURRENT")
        ("max-per-environment", po::value<int>(), "set the maximum number of running executions of one environment, default to 4. You can either pass it from environ MAXPERENVIRONMENT")
        ("workers", po::value<int>(), "set the number of worker threads, default to 10. You can either pass it from environ WORKERS")
        ("stop-grace-period", po::value<int>(), "set seconds to wait between SIGTERM and SIGKILL, default to 5. You can either pass it from environ STOPGRACEPERIOD")
        ("pids-limit", po::value<int>(), "set the maximum number of processes in a container, default to 64. You can either pass it from environ PIDSLIMIT")
        ("retention-days", po::value<int>(), "set days to keep execution records, default to 30. You can either pass it from environ RETENTIONDAYS")
        ("user", po::value<string>()->default_value("cli"), "the user submitting the execution or querying the quota")
        ("environment", po::value<string>(), "environment id, language or language:version to run the source with")
        ("source", po::value<string>(), "path of the source file to run")
        ("stdin", po::value<string>(), "path of the file fed to the standard input")
        ("exercise", po::value<string>(), "grade the source against the test cases of the exercise")
        ("args", po::value<vector<string>>(), "arguments passed to the program")
        ("wait", po::value<int>()->default_value(300), "seconds to wait for the execution before stopping it")
        ("date", po::value<string>(), "the day (YYYY-MM-DD) to collect statistics for, default to today")
        ("debug", "turn on the debug mode to print full container command lines. You can either pass it from environ DEBUG")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on
    positional.add("command", 1).add("args", -1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help") || !vm.count("command")) {
        cout << "sandbox-engine: Run untrusted code in resource-bounded containers and grade it" << endl
             << "Usage: " << argv[0] << " <run|stats|quota|environments|purge> [options]" << endl;
        cout << desc << endl;
        return vm.count("help") ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    if (vm.count("version")) {
        cout << "sandbox-engine 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug") || getenv("DEBUG")) {
        sandbox::DEBUG = true;
    }

    filesystem::path config_dir = repo_dir / "config";
    if (vm.count("config-dir")) {
        config_dir = filesystem::path(vm.at("config-dir").as<string>());
    } else if (getenv("CONFIGDIR")) {
        config_dir = filesystem::path(getenv("CONFIGDIR"));
    }
    CHECK(filesystem::is_directory(config_dir))
        << "Configuration directory " << config_dir << " does not exist";

    if (vm.count("work-dir")) {
        sandbox::WORK_DIR = filesystem::path(vm.at("work-dir").as<string>());
    } else if (getenv("WORKDIR")) {
        sandbox::WORK_DIR = filesystem::path(getenv("WORKDIR"));
    }
    filesystem::create_directories(sandbox::WORK_DIR);
    CHECK(filesystem::is_directory(sandbox::WORK_DIR))
        << "Work directory " << sandbox::WORK_DIR << " does not exist";

    optional<filesystem::path> state_file;
    if (vm.count("state-file")) {
        state_file = filesystem::path(vm.at("state-file").as<string>());
    } else if (getenv("STATEFILE")) {
        state_file = filesystem::path(getenv("STATEFILE"));
    }

    read_option(vm, "runtime", "CONTAINERRUNTIME", sandbox::CONTAINER_RUNTIME);
    read_option(vm, "sandbox-user", "SANDBOXUSER", sandbox::SANDBOX_UID);
    read_option(vm, "sandbox-group", "SANDBOXGROUP", sandbox::SANDBOX_GID);
    read_option(vm, "max-concurrent", "MAXCONCURRENT", sandbox::MAX_CONCURRENT_EXECUTIONS);
    read_option(vm, "max-per-environment", "MAXPERENVIRONMENT", sandbox::MAX_CONCURRENT_PER_ENVIRONMENT);
    read_option(vm, "workers", "WORKERS", sandbox::WORKER_THREADS);
    read_option(vm, "stop-grace-period", "STOPGRACEPERIOD", sandbox::STOP_GRACE_PERIOD);
    read_option(vm, "pids-limit", "PIDSLIMIT", sandbox::PIDS_LIMIT);
    read_option(vm, "retention-days", "RETENTIONDAYS", sandbox::RETENTION_DAYS);
    CHECK(sandbox::WORKER_THREADS > 0) << "At least one worker is required";

    if (getuid() != 0) {
        LOG(WARNING) << "Not running in privileged mode, workspaces cannot be handed to the sandbox user";
    }

    // 工作区只允许守护进程和沙箱用户访问
    umask(0077);

    sandbox::environment_registry environments;
    try {
        environments.load(config_dir / "environments.json");
    } catch (std::exception &e) {
        LOG(FATAL) << "Environment catalog " << config_dir / "environments.json" << " is malformed: " << e.what();
    }

    sandbox::quota_manager quota(load_json_config(config_dir / "quota.json", sandbox::quota_policy::defaults()));
    sandbox::grading_policy grading_policy = load_json_config(config_dir / "grading.json", sandbox::grading_policy());

    sandbox::json_exercise_catalog exercises;
    sandbox::json_user_directory users;
    try {
        if (filesystem::exists(config_dir / "exercises.json"))
            exercises.load(nlohmann::json::parse(sandbox::read_file_content(config_dir / "exercises.json")));
        if (filesystem::exists(config_dir / "users.json"))
            users.load(nlohmann::json::parse(sandbox::read_file_content(config_dir / "users.json")));
    } catch (std::exception &e) {
        LOG(FATAL) << "Exercise or user configuration is malformed: " << e.what();
    }

    sandbox::memory_store store;
    sandbox::statistics_collector statistics(store);
    if (state_file) {
        try {
            sandbox::load_state(*state_file, store, statistics, quota);
        } catch (std::exception &e) {
            LOG(FATAL) << "State file " << *state_file << " is malformed: " << e.what();
        }
    }

    sandbox::docker_runtime runtime(sandbox::CONTAINER_RUNTIME);
    sandbox::concurrency_limiter limiter(sandbox::MAX_CONCURRENT_EXECUTIONS, sandbox::MAX_CONCURRENT_PER_ENVIRONMENT);
    sandbox::workspace_builder builder(sandbox::WORK_DIR, sandbox::SANDBOX_UID, sandbox::SANDBOX_GID);
    sandbox::sandbox_runner runner(store, environments, runtime, limiter, builder);
    sandbox::grader grader(store, runner, grading_policy);
    sandbox::worker_pool workers(sandbox::WORKER_THREADS);
    sandbox::execution_service service(store, environments, runner, quota, grader, statistics, exercises, users, workers);

    string command = vm["command"].as<string>();
    int ret = EXIT_SUCCESS;
    try {
        if (command == "run") {
            if (!runtime.available()) {
                LOG(ERROR) << "Container runtime " << sandbox::CONTAINER_RUNTIME << " is not available";
                ret = EXIT_FAILURE;
            } else {
                ret = run_submission(service, vm);
            }
        } else if (command == "stats") {
            int64_t day = vm.count("date") ? sandbox::parse_date(vm["date"].as<string>())
                                           : sandbox::day_of(chrono::system_clock::now());
            print(service.collect_statistics(day));
        } else if (command == "quota") {
            print(service.get_quota_status(vm["user"].as<string>()));
        } else if (command == "environments") {
            print(environments.list());
        } else if (command == "purge") {
            size_t deleted = service.purge_expired();
            cout << deleted << " executions deleted" << endl;
        } else {
            cerr << "Unrecognized command " << command << endl;
            ret = EXIT_FAILURE;
        }
    } catch (sandbox::quota_exceeded &e) {
        cerr << e.what() << endl;
        ret = EXIT_FAILURE;
    } catch (sandbox::validation_error &e) {
        cerr << e.what() << endl;
        ret = EXIT_FAILURE;
    } catch (sandbox::environment_not_found &e) {
        cerr << e.what() << endl;
        ret = EXIT_FAILURE;
    } catch (sandbox::sandbox_exception &e) {
        LOG(ERROR) << e;
        ret = EXIT_FAILURE;
    } catch (std::exception &e) {
        LOG(ERROR) << e.what() << endl
                   << boost::diagnostic_information(e);
        ret = EXIT_FAILURE;
    }

    service.shutdown();
    if (state_file) sandbox::save_state(*state_file, store, statistics, quota);
    return ret;
}

#include "config.hpp"

namespace sandbox {
using namespace std;

filesystem::path WORK_DIR = "/tmp/sandbox-engine";
string CONTAINER_RUNTIME = "docker";
string CONTAINER_WORKDIR = "/workspace";
int SANDBOX_UID = 65534;  // nobody
int SANDBOX_GID = 65534;
int STOP_GRACE_PERIOD = 5;  // 5s
int PIDS_LIMIT = 64;
int TMPFS_SIZE = 10;  // 10M
int MAX_CONCURRENT_EXECUTIONS = 10;
int MAX_CONCURRENT_PER_ENVIRONMENT = 4;
int WORKER_THREADS = 10;
string TRUNCATION_MARKER = "\n... [output truncated]";
int RETENTION_DAYS = 30;
bool DEBUG = false;

}  // namespace sandbox

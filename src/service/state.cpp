#include "service/state.hpp"
#include <glog/logging.h>
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace sandbox {
using namespace std;

void save_state(const filesystem::path &path, const memory_store &store, const statistics_collector &statistics, quota_manager &quota) {
    nlohmann::json j = {{"executions", store.snapshot()},
                        {"statistics", statistics.rows()},
                        {"quota", quota.snapshot()}};
    filesystem::path temp = path;
    temp += ".tmp";
    write_file_content(temp, j.dump());
    filesystem::rename(temp, path);
    LOG(INFO) << "Saved " << store.size() << " executions to " << path;
}

bool load_state(const filesystem::path &path, memory_store &store, statistics_collector &statistics, quota_manager &quota) {
    if (!filesystem::exists(path)) return false;
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(read_file_content(path));
    } catch (nlohmann::json::parse_error &ex) {
        throw invalid_argument("Unable to parse state file " + path.string() + ": " + ex.what());
    }
    store.restore(nlohmann::get_value_def(j, nlohmann::json::array(), "executions"));
    statistics.restore(nlohmann::get_value_def(j, vector<daily_statistics>(), "statistics"));
    quota.restore(nlohmann::get_value_def(j, nlohmann::json::object(), "quota"));
    LOG(INFO) << "Loaded " << store.size() << " executions from " << path;
    return true;
}

}  // namespace sandbox

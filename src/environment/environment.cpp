#include "environment/environment.hpp"
#include <boost/assign.hpp>
#include <filesystem>
#include <stdexcept>
#include <unordered_map>
#include "common/json_utils.hpp"

namespace sandbox {
using namespace std;

// clang-format off
static const unordered_map<environment_status, const char *> environment_status_string = boost::assign::map_list_of
    (environment_status::ACTIVE, "active")
    (environment_status::MAINTENANCE, "maintenance")
    (environment_status::DEPRECATED, "deprecated")
    (environment_status::DISABLED, "disabled");

static const unordered_map<feature, const char *> feature_string = boost::assign::map_list_of
    (feature::STDIN, "stdin")
    (feature::NETWORKING, "networking")
    (feature::FILE_IO, "file_io")
    (feature::GRAPHICS, "graphics");
// clang-format on

string execution_environment::binary_file() const {
    return filesystem::path(source_file).stem().string();
}

set<feature> execution_environment::features() const {
    set<feature> result;
    if (supports_input) result.insert(feature::STDIN);
    if (supports_networking) result.insert(feature::NETWORKING);
    if (supports_file_operations) result.insert(feature::FILE_IO);
    if (supports_graphics) result.insert(feature::GRAPHICS);
    return result;
}

bool execution_environment::is_active() const {
    return status == environment_status::ACTIVE;
}

const char *get_display_message(environment_status status) {
    return environment_status_string.at(status);
}

const char *get_display_message(feature f) {
    return feature_string.at(f);
}

template <typename Enum>
static Enum parse_enum(const unordered_map<Enum, const char *> &table, const string &text, const char *what) {
    for (auto &[value, name] : table)
        if (text == name) return value;
    throw invalid_argument(string("Unrecognized ") + what + " " + text);
}

void to_json(nlohmann::json &j, const environment_status &status) {
    j = get_display_message(status);
}

void from_json(const nlohmann::json &j, environment_status &status) {
    status = parse_enum(environment_status_string, j.get<string>(), "environment status");
}

void to_json(nlohmann::json &j, const feature &f) {
    j = get_display_message(f);
}

void from_json(const nlohmann::json &j, feature &f) {
    f = parse_enum(feature_string, j.get<string>(), "feature");
}

void to_json(nlohmann::json &j, const execution_environment &env) {
    j = {{"id", env.id},
         {"name", env.name},
         {"language", env.language},
         {"version", env.version},
         {"image", env.image},
         {"default_timeout", env.default_timeout},
         {"max_memory", env.max_memory},
         {"max_cpu_time", env.max_cpu_time},
         {"max_file_size", env.max_file_size},
         {"max_output_size", env.max_output_size},
         {"cpu_cores", env.cpu_cores},
         {"supports_input", env.supports_input},
         {"supports_networking", env.supports_networking},
         {"supports_file_operations", env.supports_file_operations},
         {"supports_graphics", env.supports_graphics},
         {"compile_command", env.compile_command},
         {"run_command", env.run_command},
         {"source_file", env.source_file},
         {"scaffold_files", env.scaffold_files},
         {"allowed_imports", env.allowed_imports},
         {"blocked_imports", env.blocked_imports},
         {"blocked_functions", env.blocked_functions},
         {"status", env.status},
         {"is_default", env.is_default},
         {"priority", env.priority},
         {"daily_execution_cap", env.daily_execution_cap},
         {"max_concurrent", env.max_concurrent}};
}

void from_json(const nlohmann::json &j, execution_environment &env) {
    using namespace nlohmann;
    env.language = get_value<string>(j, "language");
    env.version = get_value<string>(j, "version");
    env.image = get_value<string>(j, "image");
    env.run_command = get_value<string>(j, "run_command");
    env.source_file = get_value<string>(j, "source_file");
    env.id = get_value_def<string>(j, env.language + ":" + env.version, "id");
    env.name = get_value_def<string>(j, env.language + " " + env.version, "name");
    env.default_timeout = get_value_def(j, 30, "default_timeout");
    env.max_memory = get_value_def(j, 128, "max_memory");
    env.max_cpu_time = get_value_def(j, 10, "max_cpu_time");
    env.max_file_size = get_value_def(j, 10, "max_file_size");
    env.max_output_size = get_value_def<size_t>(j, 64 * 1024, "max_output_size");
    env.cpu_cores = get_value_def(j, 1.0, "cpu_cores");
    env.supports_input = get_value_def(j, true, "supports_input");
    env.supports_networking = get_value_def(j, false, "supports_networking");
    env.supports_file_operations = get_value_def(j, true, "supports_file_operations");
    env.supports_graphics = get_value_def(j, false, "supports_graphics");
    env.compile_command = get_value_def<string>(j, "", "compile_command");
    env.scaffold_files = get_value_def(j, map<string, string>(), "scaffold_files");
    env.allowed_imports = get_value_def(j, vector<string>(), "allowed_imports");
    env.blocked_imports = get_value_def(j, vector<string>(), "blocked_imports");
    env.blocked_functions = get_value_def(j, vector<string>(), "blocked_functions");
    env.status = get_value_def(j, environment_status::ACTIVE, "status");
    env.is_default = get_value_def(j, false, "is_default");
    env.priority = get_value_def(j, 0, "priority");
    env.daily_execution_cap = get_value_def<int64_t>(j, -1, "daily_execution_cap");
    env.max_concurrent = get_value_def(j, 0, "max_concurrent");

    if (env.default_timeout <= 0 || env.max_memory <= 0 || env.max_cpu_time <= 0 || env.max_file_size <= 0)
        throw invalid_argument("Resource limits of environment " + env.id + " must be positive");
    if (env.max_output_size == 0 || env.cpu_cores <= 0)
        throw invalid_argument("Output size and cpu cores of environment " + env.id + " must be positive");
}

}  // namespace sandbox

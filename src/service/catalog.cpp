#include "service/catalog.hpp"
#include <glog/logging.h>
#include <mutex>
#include <set>
#include <stdexcept>
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace sandbox {
using namespace std;

exercise_catalog::~exercise_catalog() = default;

user_directory::~user_directory() = default;

json_exercise_catalog::json_exercise_catalog(const filesystem::path &path) {
    load(nlohmann::json::parse(read_file_content(path)));
}

void json_exercise_catalog::add(exercise ex) {
    set<string> names;
    for (auto &tc : ex.tests)
        if (!names.insert(tc.name).second)
            throw invalid_argument("Duplicate test case " + tc.name + " in exercise " + ex.id);

    unique_lock lock(mut);
    LOG(INFO) << "Loaded exercise " << ex.id << " with " << ex.tests.size() << " test cases";
    exercises[ex.id] = move(ex);
}

void json_exercise_catalog::load(const nlohmann::json &j) {
    if (!j.is_array())
        throw invalid_argument("Exercise catalog must be an array");
    for (auto &item : j)
        add(item.get<exercise>());
}

optional<exercise> json_exercise_catalog::find(const string &exercise_id) const {
    shared_lock lock(mut);
    auto it = exercises.find(exercise_id);
    if (it == exercises.end()) return nullopt;
    return it->second;
}

json_user_directory::json_user_directory(const filesystem::path &path) {
    load(nlohmann::json::parse(read_file_content(path)));
}

void json_user_directory::set_tier(const string &user_id, user_tier tier) {
    unique_lock lock(mut);
    tiers[user_id] = tier;
}

void json_user_directory::load(const nlohmann::json &j) {
    if (!j.is_object())
        throw invalid_argument("User directory must be an object of user id to tier");
    for (auto &item : j.items())
        set_tier(item.key(), item.value().get<user_tier>());
}

user_tier json_user_directory::tier_of(const string &user_id) const {
    shared_lock lock(mut);
    auto it = tiers.find(user_id);
    return it == tiers.end() ? user_tier::FREE : it->second;
}

void from_json(const nlohmann::json &j, exercise &ex) {
    using namespace nlohmann;
    ex.id = get_value<string>(j, "id");
    ex.title = get_value_def<string>(j, ex.id, "title");
    ex.environment_id = get_value<string>(j, "environment");
    ex.tests = get_value_def(j, vector<test_case>(), "tests");
}

void to_json(nlohmann::json &j, const exercise &ex) {
    j = {{"id", ex.id},
         {"title", ex.title},
         {"environment", ex.environment_id},
         {"tests", ex.tests}};
}

}  // namespace sandbox

#include <filesystem>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "environment/registry.hpp"
#include "grading/compare.hpp"
#include "gtest/gtest.h"
#include "service/catalog.hpp"

using namespace std;
using namespace sandbox;

// 由构建系统定义，指向源码目录下的 config/
static const filesystem::path CONFIG_DIR = filesystem::path(SANDBOX_SOURCE_DIR) / "config";

TEST(CatalogTest, BundledConfigurationLoads) {
    environment_registry environments;
    environments.load(CONFIG_DIR / "environments.json");
    EXPECT_EQ("python:3.11", environments.get("python").id);
    EXPECT_THROW(environments.get("python:3.9"), environment_not_found);

    json_exercise_catalog exercises(CONFIG_DIR / "exercises.json");
    auto sum = exercises.find("sum-two-numbers");
    ASSERT_TRUE(sum);
    EXPECT_EQ(3u, sum->tests.size());
    EXPECT_NO_THROW(environments.get(sum->environment_id));

    json_user_directory users(CONFIG_DIR / "users.json");
    EXPECT_EQ(user_tier::ADMIN, users.tier_of("root"));
    EXPECT_EQ(user_tier::FREE, users.tier_of("stranger"));

    auto quota = nlohmann::json::parse(read_file_content(CONFIG_DIR / "quota.json")).get<quota_policy>();
    EXPECT_EQ(100, quota.limits(user_tier::FREE).executions);
    EXPECT_EQ(-1, quota.limits(user_tier::ADMIN).executions);

    auto policy = nlohmann::json::parse(read_file_content(CONFIG_DIR / "grading.json")).get<grading_policy>();
    EXPECT_DOUBLE_EQ(0.9, policy.pass_threshold);
}

TEST(CatalogTest, ExerciseFromJson) {
    json_exercise_catalog exercises;
    exercises.load(nlohmann::json::parse(R"([
        {"id": "echo", "environment": "python", "tests": [
            {"name": "one", "input": "1\n", "expected_output": "1", "points": 2, "mode": "strict"}
        ]}
    ])"));
    auto echo = exercises.find("echo");
    ASSERT_TRUE(echo);
    EXPECT_EQ("echo", echo->title);
    EXPECT_EQ("python", echo->environment_id);
    ASSERT_EQ(1u, echo->tests.size());
    EXPECT_EQ("one", echo->tests[0].id);
    EXPECT_EQ(matching_mode::STRICT, echo->tests[0].mode);
    EXPECT_DOUBLE_EQ(2, echo->tests[0].points);
    EXPECT_EQ(nullopt, exercises.find("missing"));
}

TEST(CatalogTest, RejectsDuplicateTestNames) {
    exercise ex;
    ex.id = "dup";
    ex.tests.resize(2);
    ex.tests[0].name = ex.tests[1].name = "same";
    json_exercise_catalog exercises;
    EXPECT_THROW(exercises.add(ex), invalid_argument);
}

TEST(CatalogTest, RejectsInvalidTestCases) {
    json_exercise_catalog exercises;
    EXPECT_THROW(exercises.load(nlohmann::json::parse(R"([{"id": "x", "environment": "python", "tests": [{"name": "t", "timeout": 0}]}])")),
                 invalid_argument);
    EXPECT_THROW(exercises.load(nlohmann::json::object()), invalid_argument);
}

TEST(CatalogTest, UserDirectory) {
    json_user_directory users;
    users.load(nlohmann::json::parse(R"({"dave": "premium"})"));
    EXPECT_EQ(user_tier::PREMIUM, users.tier_of("dave"));
    users.set_tier("dave", user_tier::INSTRUCTOR);
    EXPECT_EQ(user_tier::INSTRUCTOR, users.tier_of("dave"));
    EXPECT_THROW(users.load(nlohmann::json::parse(R"({"eve": "superuser"})")), invalid_argument);
}

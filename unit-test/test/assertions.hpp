#pragma once

#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "gtest/gtest.h"

namespace sandbox::test {

/**
 * @brief 比较两个 json，失败时输出两边的内容和 json patch 形式的差异
 */
inline ::testing::AssertionResult json_equal(const char *expected_expression,
                                             const char *actual_expression,
                                             const nlohmann::json &expected,
                                             const nlohmann::json &actual) {
    if (expected == actual) return ::testing::AssertionSuccess();

    std::stringstream ss;
    ss << std::endl
       << "      Expected: " << expected_expression << std::endl
       << expected.dump(2) << std::endl
       << "To be equal to: " << actual_expression << std::endl
       << actual.dump(2) << std::endl
       << "    Difference: " << std::endl
       << nlohmann::json::diff(expected, actual).dump(2);
    return ::testing::AssertionFailure() << ss.str();
}

}  // namespace sandbox::test

#define EXPECT_JSON_EQ(expected, actual) \
    EXPECT_PRED_FORMAT2(::sandbox::test::json_equal, expected, actual)

#define ASSERT_JSON_EQ(expected, actual) \
    ASSERT_PRED_FORMAT2(::sandbox::test::json_equal, expected, actual)

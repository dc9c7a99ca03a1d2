#include "common/status.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace sandbox;

static const vector<execution_status> ALL_STATUSES = {
    execution_status::PENDING, execution_status::QUEUED, execution_status::RUNNING,
    execution_status::COMPLETED, execution_status::FAILED, execution_status::TIMEOUT,
    execution_status::MEMORY_LIMIT_EXCEEDED, execution_status::CANCELLED, execution_status::ERROR};

TEST(StatusTest, QueuedCannotSkipRunning) {
    EXPECT_TRUE(can_transition(execution_status::PENDING, execution_status::QUEUED));
    EXPECT_TRUE(can_transition(execution_status::QUEUED, execution_status::RUNNING));
    EXPECT_TRUE(can_transition(execution_status::RUNNING, execution_status::COMPLETED));

    EXPECT_FALSE(can_transition(execution_status::PENDING, execution_status::RUNNING));
    EXPECT_FALSE(can_transition(execution_status::QUEUED, execution_status::COMPLETED));
    EXPECT_FALSE(can_transition(execution_status::QUEUED, execution_status::TIMEOUT));
    EXPECT_FALSE(can_transition(execution_status::QUEUED, execution_status::MEMORY_LIMIT_EXCEEDED));
}

TEST(StatusTest, TerminalStatusesAreFinal) {
    for (auto from : ALL_STATUSES) {
        if (!is_terminal(from)) continue;
        for (auto to : ALL_STATUSES)
            EXPECT_FALSE(can_transition(from, to)) << get_display_message(from) << " -> " << get_display_message(to);
    }
}

TEST(StatusTest, TransitionsNeverGoBackwards) {
    for (auto from : ALL_STATUSES)
        for (auto to : ALL_STATUSES)
            if (can_transition(from, to))
                EXPECT_LT((int)from, (int)to);
}

TEST(StatusTest, UserMessagesDistinguishTimeoutFromCrash) {
    EXPECT_EQ("Your program exceeded the time limit.", get_user_message(execution_status::TIMEOUT, -1));
    EXPECT_EQ("Your program crashed with exit code 139.", get_user_message(execution_status::COMPLETED, 139));
    EXPECT_EQ("Your program used too much memory.", get_user_message(execution_status::MEMORY_LIMIT_EXCEEDED, 137));
    EXPECT_NE(get_user_message(execution_status::FAILED, -1), get_user_message(execution_status::COMPLETED, 1));
}

TEST(StatusTest, JsonNames) {
    nlohmann::json j = execution_status::MEMORY_LIMIT_EXCEEDED;
    EXPECT_EQ("memory_limit", j.get<string>());
    EXPECT_EQ(test_status::MEMORY_EXCEEDED, nlohmann::json("memory_exceeded").get<test_status>());
    EXPECT_THROW(nlohmann::json("finished").get<execution_status>(), invalid_argument);
}

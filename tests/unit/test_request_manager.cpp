#include <string>
#include <gtest/gtest.h>
#include "core/errors/dispatch_errors.hpp"
#include "session/request_manager.hpp"

namespace {

using cidispatch::core::errors::get_error;
using cidispatch::core::errors::get_value;
using cidispatch::core::errors::is_error;
using cidispatch::session::RequestManager;
using cidispatch::session::RequestState;

TEST(RequestManagerTest, StartRequestMovesToRunning) {
    RequestManager manager;
    auto start = manager.start_request("1", "req-a", "lint");
    ASSERT_FALSE(is_error(start));
    EXPECT_FALSE(get_value(start)->load());

    EXPECT_EQ(manager.in_flight_count(), 1u);

    auto done = manager.mark_completed("1");
    ASSERT_FALSE(is_error(done));
    EXPECT_EQ(get_value(done), RequestState::Completed);
    EXPECT_EQ(manager.in_flight_count(), 0u);
}

TEST(RequestManagerTest, DuplicateKeyIsRejected) {
    RequestManager manager;
    ASSERT_FALSE(is_error(manager.start_request("7", "req-a", "lint")));
    auto again = manager.start_request("7", "req-b", "analyze");
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "duplicate_request_id");
}

TEST(RequestManagerTest, EmptyKeyIsRejected) {
    RequestManager manager;
    auto start = manager.start_request("", "req-a", "lint");
    ASSERT_TRUE(is_error(start));
    EXPECT_EQ(get_error(start).code, "invalid_request_id");
}

TEST(RequestManagerTest, CancelSetsToken) {
    RequestManager manager;
    auto start = manager.start_request("\"abc\"", "req-a", "full_ci");
    ASSERT_FALSE(is_error(start));
    const auto token = get_value(start);

    auto cancel = manager.cancel_request("\"abc\"");
    ASSERT_FALSE(is_error(cancel));
    EXPECT_EQ(get_value(cancel), RequestState::Cancelled);
    EXPECT_TRUE(token->load());
    EXPECT_EQ(manager.in_flight_count(), 0u);
}

TEST(RequestManagerTest, TerminalStatesDoNotTransition) {
    RequestManager manager;
    ASSERT_FALSE(is_error(manager.start_request("1", "req-a", "lint")));
    ASSERT_FALSE(is_error(manager.mark_completed("1")));

    auto cancel = manager.cancel_request("1");
    ASSERT_TRUE(is_error(cancel));
    EXPECT_EQ(get_error(cancel).code, "invalid_state_transition");

    auto fail = manager.mark_failed("1");
    ASSERT_TRUE(is_error(fail));
    EXPECT_NE(get_error(fail).message.find("completed"), std::string::npos);
}

TEST(RequestManagerTest, UnknownKeyIsNotFound) {
    RequestManager manager;
    auto cancel = manager.cancel_request("missing");
    ASSERT_TRUE(is_error(cancel));
    EXPECT_EQ(get_error(cancel).code, "request_not_found");
}

TEST(RequestManagerTest, ReleaseFreesKey) {
    RequestManager manager;
    ASSERT_FALSE(is_error(manager.start_request("1", "req-a", "lint")));
    ASSERT_FALSE(is_error(manager.mark_failed("1")));
    manager.release("1");

    auto cancel = manager.cancel_request("1");
    ASSERT_TRUE(is_error(cancel));
    EXPECT_EQ(get_error(cancel).code, "request_not_found");
    EXPECT_FALSE(is_error(manager.start_request("1", "req-b", "lint")));
}

TEST(RequestManagerTest, CancelAllReachesEveryRunningRequest) {
    RequestManager manager;
    auto first = manager.start_request("1", "req-a", "lint");
    auto second = manager.start_request("2", "req-b", "analyze");
    auto third = manager.start_request("3", "req-c", "format_check");
    ASSERT_FALSE(is_error(first));
    ASSERT_FALSE(is_error(second));
    ASSERT_FALSE(is_error(third));
    ASSERT_FALSE(is_error(manager.mark_completed("3")));

    EXPECT_EQ(manager.cancel_all(), 2u);
    EXPECT_TRUE(get_value(first)->load());
    EXPECT_TRUE(get_value(second)->load());
    EXPECT_FALSE(get_value(third)->load());
    EXPECT_EQ(manager.in_flight_count(), 0u);
}

}  // namespace

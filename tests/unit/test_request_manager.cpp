#include <string>
#include <gtest/gtest.h>
#include "core/errors/hearth_errors.hpp"
#include "session/request_manager.hpp"

namespace {

using hearth::core::errors::get_error;
using hearth::core::errors::get_value;
using hearth::core::errors::is_error;
using hearth::session::RequestManager;
using hearth::session::RequestState;

TEST(RequestManagerTest, StartRequestMovesToRunning) {
    RequestManager manager;
    auto start = manager.start_request("conv-1", "energy question");
    ASSERT_FALSE(is_error(start));

    const std::string request_id = get_value(start);
    EXPECT_EQ(request_id.rfind("req-", 0), 0u);
    auto state = manager.get_state(request_id);
    ASSERT_FALSE(is_error(state));
    EXPECT_EQ(get_value(state), RequestState::Running);

    auto record = manager.get_record(request_id);
    ASSERT_FALSE(is_error(record));
    EXPECT_EQ(get_value(record).conversation_id, "conv-1");
    EXPECT_EQ(get_value(record).task_label, "energy question");
    EXPECT_EQ(manager.request_count(), 1u);
}

TEST(RequestManagerTest, CancelSetsTokenAndState) {
    RequestManager manager;
    auto start = manager.start_request("conv-1");
    ASSERT_FALSE(is_error(start));
    const std::string request_id = get_value(start);

    auto token_result = manager.get_cancel_token(request_id);
    ASSERT_FALSE(is_error(token_result));
    auto token = get_value(token_result);
    ASSERT_TRUE(token != nullptr);
    EXPECT_FALSE(token->load());

    auto cancel = manager.cancel_request(request_id);
    ASSERT_FALSE(is_error(cancel));
    EXPECT_EQ(get_value(cancel), RequestState::Cancelled);
    EXPECT_TRUE(token->load());
}

TEST(RequestManagerTest, FailureKeepsReason) {
    RequestManager manager;
    const std::string request_id = get_value(manager.start_request("conv-1"));

    auto failed = manager.mark_failed(request_id, "sandbox disabled in production");
    ASSERT_FALSE(is_error(failed));
    EXPECT_EQ(get_value(failed), RequestState::Failed);

    auto record = manager.get_record(request_id);
    ASSERT_FALSE(is_error(record));
    EXPECT_EQ(get_value(record).failure_reason,
              std::optional<std::string>("sandbox disabled in production"));
    EXPECT_FALSE(get_value(record).cancel_token->load());
}

TEST(RequestManagerTest, TerminalStatesAreFinal) {
    RequestManager manager;
    const std::string request_id = get_value(manager.start_request("conv-1"));

    auto complete = manager.mark_completed(request_id);
    ASSERT_FALSE(is_error(complete));
    EXPECT_EQ(get_value(complete), RequestState::Completed);

    auto cancel = manager.cancel_request(request_id);
    ASSERT_TRUE(is_error(cancel));
    EXPECT_EQ(get_error(cancel).code, "invalid_state_transition");

    auto fail = manager.mark_failed(request_id, "late");
    ASSERT_TRUE(is_error(fail));
    EXPECT_EQ(get_error(fail).code, "invalid_state_transition");
}

TEST(RequestManagerTest, UnknownIdsAreReported) {
    RequestManager manager;
    EXPECT_EQ(get_error(manager.cancel_request("req-missing")).code, "request_not_found");
    EXPECT_EQ(get_error(manager.get_cancel_token("req-missing")).code, "request_not_found");
    EXPECT_EQ(get_error(manager.get_state("req-missing")).code, "request_not_found");
}

TEST(RequestManagerTest, RequestNeedsConversation) {
    RequestManager manager;
    auto start = manager.start_request("");
    ASSERT_TRUE(is_error(start));
    EXPECT_EQ(get_error(start).code, "invalid_request");
    EXPECT_EQ(manager.request_count(), 0u);
}

TEST(RequestManagerTest, StateNames) {
    EXPECT_EQ(hearth::session::to_string(RequestState::Running), "running");
    EXPECT_EQ(hearth::session::to_string(RequestState::Cancelled), "cancelled");
}

}  // namespace

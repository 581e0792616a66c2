#include <sstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/errors/hearth_errors.hpp"
#include "protocol/event_contract.hpp"
#include "streaming/stream_consumer.hpp"

namespace {

using hearth::core::errors::ErrorCategory;
using hearth::core::errors::HearthError;
using hearth::core::errors::Result;
using hearth::core::errors::get_error;
using hearth::core::errors::get_value;
using hearth::core::errors::is_error;
using hearth::protocol::StreamEvent;
using hearth::protocol::StreamFragment;
using hearth::protocol::TokenEvent;
using hearth::protocol::ToolCallChunk;
using hearth::streaming::FragmentSource;
using hearth::streaming::JsonLinesFragmentSource;
using hearth::streaming::VectorFragmentSource;
using hearth::streaming::consume_stream;

StreamFragment text(const std::string& content) {
    StreamFragment fragment;
    fragment.content = content;
    return fragment;
}

StreamFragment chunk(int index, std::optional<std::string> name,
                     std::optional<std::string> args, std::optional<std::string> id,
                     std::optional<std::string> content = std::nullopt) {
    StreamFragment fragment;
    fragment.content = std::move(content);
    ToolCallChunk piece;
    piece.index = index;
    piece.name = std::move(name);
    piece.args_delta = std::move(args);
    piece.id = std::move(id);
    fragment.tool_call_chunks.push_back(std::move(piece));
    return fragment;
}

std::vector<std::string> token_texts(const std::vector<StreamEvent>& events) {
    std::vector<std::string> texts;
    for (const auto& event : events) {
        if (const auto* token = std::get_if<TokenEvent>(&event)) {
            texts.push_back(token->content);
        }
    }
    return texts;
}

// Fails with the given error once, after a fixed number of good fragments.
class FailingSource : public FragmentSource {
public:
    explicit FailingSource(HearthError error) : error_(std::move(error)) {}

    Result<std::optional<StreamFragment>> next() override {
        if (calls_++ == 0) {
            return std::optional<StreamFragment>{text("before ")};
        }
        if (calls_ == 2) {
            return error_;
        }
        if (calls_ == 3) {
            return std::optional<StreamFragment>{text("after")};
        }
        return std::optional<StreamFragment>{};
    }

private:
    HearthError error_;
    int calls_ = 0;
};

TEST(StreamConsumerTest, TextFragmentsBecomeTokens) {
    VectorFragmentSource source({text("Hello"), text(", "), text(""), text("world")});
    std::vector<StreamEvent> events;
    auto outcome = consume_stream(source, [&](const StreamEvent& e) { events.push_back(e); });

    ASSERT_FALSE(is_error(outcome));
    EXPECT_EQ(get_value(outcome).collected_content, "Hello, world");
    EXPECT_TRUE(get_value(outcome).tool_calls.empty());
    EXPECT_EQ(token_texts(events), (std::vector<std::string>{"Hello", ", ", "world"}));
}

TEST(StreamConsumerTest, MergesChunksByIndex) {
    VectorFragmentSource source({
        text("Let me check."),
        chunk(0, "get_entity_state", std::nullopt, "call-a"),
        chunk(1, "seek_approval", R"({"name": )", "call-b"),
        chunk(0, "", R"({"entity_id": )", std::nullopt),
        chunk(0, std::nullopt, R"("light.kitchen"})", ""),
        chunk(1, std::nullopt, R"("x"})", std::nullopt),
    });
    auto outcome = consume_stream(source, nullptr);
    ASSERT_FALSE(is_error(outcome));

    const auto& calls = get_value(outcome).tool_calls;
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0].index, 0);
    EXPECT_EQ(calls[0].name, "get_entity_state");
    EXPECT_EQ(calls[0].args, R"({"entity_id": "light.kitchen"})");
    EXPECT_EQ(calls[0].id, "call-a");
    EXPECT_EQ(calls[1].name, "seek_approval");
    EXPECT_EQ(calls[1].args, R"({"name": "x"})");
    EXPECT_EQ(get_value(outcome).collected_content, "Let me check.");
}

TEST(StreamConsumerTest, RepeatedNameAndIdAreNotConcatenated) {
    VectorFragmentSource source({
        chunk(0, "get_entity_state", R"({"entity_id": )", "call-1"),
        chunk(0, "get_entity_state", R"("sensor.power"})", "call-1"),
        chunk(1, "get_history", "{}", "provisional"),
        chunk(1, std::nullopt, std::nullopt, "call-2"),
    });
    auto outcome = consume_stream(source, nullptr);
    ASSERT_FALSE(is_error(outcome));

    const auto& calls = get_value(outcome).tool_calls;
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0].name, "get_entity_state");
    EXPECT_EQ(calls[0].args, R"({"entity_id": "sensor.power"})");
    EXPECT_EQ(calls[0].id, "call-1");
    EXPECT_EQ(calls[1].name, "get_history");
    EXPECT_EQ(calls[1].id, "call-2");
}

TEST(StreamConsumerTest, TextNextToToolChunksIsSuppressed) {
    VectorFragmentSource source({chunk(0, "get_entity_state", "{}", "c1", R"({"partial)")});
    std::vector<StreamEvent> events;
    auto outcome = consume_stream(source, [&](const StreamEvent& e) { events.push_back(e); });
    ASSERT_FALSE(is_error(outcome));
    EXPECT_TRUE(events.empty());
    EXPECT_TRUE(get_value(outcome).collected_content.empty());
    EXPECT_EQ(get_value(outcome).tool_calls.size(), 1u);
}

TEST(StreamConsumerTest, ValidationErrorsAreSkipped) {
    FailingSource source(HearthError{ErrorCategory::Validation, "bad line", "malformed_fragment"});
    auto outcome = consume_stream(source, nullptr);
    ASSERT_FALSE(is_error(outcome));
    EXPECT_EQ(get_value(outcome).collected_content, "before after");
}

TEST(StreamConsumerTest, OtherSourceErrorsAbort) {
    FailingSource source(HearthError{ErrorCategory::Internal, "read failed", "stream_read_failed"});
    auto outcome = consume_stream(source, nullptr);
    ASSERT_TRUE(is_error(outcome));
    EXPECT_EQ(get_error(outcome).code, "stream_read_failed");
}

TEST(StreamConsumerTest, JsonLinesSourceSkipsBlankAndMalformedLines) {
    std::istringstream input(
        "{\"content\": \"Hi\"}\n"
        "\n"
        "not json\n"
        "[1, 2]\n"
        "{\"tool_call_chunks\": [{\"index\": 0, \"name\": \"get_entity_state\", "
        "\"args\": \"{}\", \"id\": \"c1\"}]}\n");
    JsonLinesFragmentSource source(input);

    std::vector<StreamEvent> events;
    auto outcome = consume_stream(source, [&](const StreamEvent& e) { events.push_back(e); });
    ASSERT_FALSE(is_error(outcome));
    EXPECT_EQ(token_texts(events), (std::vector<std::string>{"Hi"}));
    ASSERT_EQ(get_value(outcome).tool_calls.size(), 1u);
    EXPECT_EQ(get_value(outcome).tool_calls[0].id, "c1");
}

TEST(StreamConsumerTest, MalformedLineReportsLineNumber) {
    std::istringstream input("{\"content\": \"ok\"}\n{broken\n");
    JsonLinesFragmentSource source(input);

    auto first = source.next();
    ASSERT_FALSE(is_error(first));
    ASSERT_TRUE(get_value(first).has_value());

    auto second = source.next();
    ASSERT_TRUE(is_error(second));
    EXPECT_EQ(get_error(second).category, ErrorCategory::Validation);
    EXPECT_NE(get_error(second).message.find("line 2"), std::string::npos);

    auto end = source.next();
    ASSERT_FALSE(is_error(end));
    EXPECT_FALSE(get_value(end).has_value());
}

TEST(StreamConsumerTest, FragmentParsingRejectsBadChunkShapes) {
    EXPECT_TRUE(is_error(hearth::streaming::parse_fragment_json(R"({"tool_call_chunks": 3})")));
    EXPECT_TRUE(is_error(hearth::streaming::parse_fragment_json(R"({"tool_call_chunks": [1]})")));

    auto ok = hearth::streaming::parse_fragment_json(R"({"content": null, "tool_call_chunks": null})");
    ASSERT_FALSE(is_error(ok));
    EXPECT_FALSE(get_value(ok).content.has_value());
    EXPECT_TRUE(get_value(ok).tool_call_chunks.empty());
}

}  // namespace

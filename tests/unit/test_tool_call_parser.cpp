#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "protocol/tool_contract.hpp"
#include "streaming/tool_call_parser.hpp"

namespace {

using hearth::protocol::ToolCallBufferEntry;
using hearth::streaming::ToolCallParser;

bool mutating_if_control(const std::string& name) {
    return name.rfind("control_", 0) == 0;
}

TEST(ToolCallParserTest, ParsesArgumentsAndClassifies) {
    const std::vector<ToolCallBufferEntry> buffer = {
        {0, "get_entity_state", R"({"entity_id": "sensor.power"})", "call-1"},
        {1, "control_entity", R"({"entity": "light.x", "state": "on"})", "call-2"},
    };
    const auto calls = ToolCallParser::parse(buffer, mutating_if_control);

    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0].id, "call-1");
    EXPECT_EQ(calls[0].args.at("entity_id"), "sensor.power");
    EXPECT_FALSE(calls[0].is_mutating);
    EXPECT_EQ(calls[1].name, "control_entity");
    EXPECT_TRUE(calls[1].is_mutating);
}

TEST(ToolCallParserTest, DropsMalformedEntriesAndKeepsOrder) {
    const std::vector<ToolCallBufferEntry> buffer = {
        {0, "first", "{}", "a"},
        {1, "", R"({"x": 1})", "b"},
        {2, "broken", R"({"x": )", "c"},
        {3, "listy", "[1, 2]", "d"},
        {4, "last", R"({"y": 2})", "e"},
    };
    const auto calls = ToolCallParser::parse(buffer, mutating_if_control);

    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0].name, "first");
    EXPECT_EQ(calls[1].name, "last");
    EXPECT_EQ(calls[1].args.at("y"), 2);
}

TEST(ToolCallParserTest, EmptyArgumentsMeanNoArguments) {
    const auto calls = ToolCallParser::parse({{0, "get_domain_summary", "  ", "x"}},
                                             mutating_if_control);
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_TRUE(calls[0].args.is_object());
    EXPECT_TRUE(calls[0].args.empty());
}

TEST(ToolCallParserTest, MissingIdIsGenerated) {
    const auto calls = ToolCallParser::parse({{0, "get_domain_summary", "{}", ""}},
                                             mutating_if_control);
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].id.rfind("call-", 0), 0u);
}

TEST(ToolCallParserTest, NoPredicateTreatsEverythingAsMutating) {
    const auto calls = ToolCallParser::parse({{0, "get_entity_state", "{}", "a"}}, nullptr);
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_TRUE(calls[0].is_mutating);
}

}  // namespace

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/settings.hpp"
#include "core/errors/hearth_errors.hpp"
#include "protocol/event_contract.hpp"
#include "runtime/execution_context.hpp"
#include "tools/tool_dispatcher.hpp"
#include "tools/tool_registry.hpp"

namespace {

using hearth::core::config::Settings;
using hearth::core::errors::ErrorCategory;
using hearth::core::errors::HearthError;
using hearth::core::errors::Result;
using hearth::core::errors::get_error;
using hearth::core::errors::get_value;
using hearth::core::errors::is_error;
using hearth::protocol::ApprovalRequiredEvent;
using hearth::protocol::ParsedToolCall;
using hearth::protocol::ProgressStreamEvent;
using hearth::protocol::StreamEvent;
using hearth::protocol::ToolEndEvent;
using hearth::protocol::ToolStartEvent;
using hearth::protocol::event_type;
using hearth::runtime::ExecutionContext;
using hearth::runtime::ProgressKind;
using hearth::tools::DispatcherOptions;
using hearth::tools::Tool;
using hearth::tools::ToolDispatcher;
using hearth::tools::ToolRegistry;
using nlohmann::json;

using Body = std::function<Result<std::string>(const json&, const ExecutionContext&)>;

class FunctionTool : public Tool {
public:
    FunctionTool(std::string name, Body body) : name_(std::move(name)), body_(std::move(body)) {}

    std::string name() const override { return name_; }
    std::string description() const override { return "test tool " + name_; }

    Result<std::string> invoke(const json& args, const ExecutionContext& ctx) override {
        return body_(args, ctx);
    }

private:
    std::string name_;
    Body body_;
};

// Sleeps in small steps until cancelled or `total` has passed.
bool sleep_unless_cancelled(const ExecutionContext& ctx, std::chrono::milliseconds total) {
    const auto until = std::chrono::steady_clock::now() + total;
    while (std::chrono::steady_clock::now() < until) {
        if (ctx.is_cancelled()) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

class Recorder {
public:
    hearth::protocol::EventSink sink() {
        return [this](const StreamEvent& event) { events.push_back(event); };
    }

    std::vector<std::string> types() const {
        std::vector<std::string> out;
        for (const auto& event : events) {
            out.push_back(event_type(event));
        }
        return out;
    }

    template <typename T>
    std::vector<T> of() const {
        std::vector<T> out;
        for (const auto& event : events) {
            if (const auto* typed = std::get_if<T>(&event)) {
                out.push_back(*typed);
            }
        }
        return out;
    }

    std::vector<StreamEvent> events;
};

ParsedToolCall make_call(const std::string& id, const std::string& name, json args,
                         const ToolRegistry& registry) {
    ParsedToolCall call;
    call.id = id;
    call.name = name;
    call.args = std::move(args);
    call.is_mutating = registry.is_mutating(name);
    return call;
}

std::shared_ptr<ToolRegistry> registry_with(std::vector<std::shared_ptr<Tool>> tools) {
    auto registry = std::make_shared<ToolRegistry>();
    for (auto& tool : tools) {
        EXPECT_FALSE(is_error(registry->add(tool)));
    }
    return registry;
}

std::shared_ptr<Tool> entity_tool() {
    return std::make_shared<FunctionTool>(
        "get_entity_state", [](const json& args, const ExecutionContext&) -> Result<std::string> {
            return json{{"entity_id", args.value("entity_id", "")}, {"state", "on"}}.dump();
        });
}

DispatcherOptions fast_options() {
    DispatcherOptions options;
    options.cancel_grace = std::chrono::milliseconds(300);
    options.poll_slice = std::chrono::milliseconds(10);
    return options;
}

TEST(ToolDispatcherTest, MutatingCallOnlyRequestsApproval) {
    auto registry = registry_with({entity_tool()});
    ToolDispatcher dispatcher(registry, Settings::defaults());
    const auto ctx = ExecutionContext::for_request(Settings::defaults(), "conv");

    const std::vector<ParsedToolCall> calls = {
        make_call("c1", "control_entity", {{"entity", "light.x"}, {"state", "on"}}, *registry),
        make_call("c2", "get_entity_state", {{"entity_id", "light.x"}}, *registry),
    };
    Recorder recorder;
    auto result = dispatcher.dispatch(calls, ctx, recorder.sink());
    ASSERT_FALSE(is_error(result));

    EXPECT_EQ(recorder.types(),
              (std::vector<std::string>{"approval_required", "tool_start", "tool_end"}));
    const auto approvals = recorder.of<ApprovalRequiredEvent>();
    ASSERT_EQ(approvals.size(), 1u);
    EXPECT_EQ(approvals[0].tool, "control_entity");
    EXPECT_NE(approvals[0].content.find("light.x"), std::string::npos);

    const auto& dispatched = get_value(result);
    EXPECT_NE(dispatched.tool_results.at("c1").find("approval"), std::string::npos);
    EXPECT_NE(dispatched.tool_results.at("c2").find("\"state\":\"on\""), std::string::npos);
    ASSERT_EQ(dispatched.full_tool_calls.size(), 2u);
    EXPECT_EQ(dispatched.full_tool_calls[0].id, "c1");
    EXPECT_EQ(dispatched.full_tool_calls[1].id, "c2");

    const auto starts = recorder.of<ToolStartEvent>();
    ASSERT_EQ(starts.size(), 1u);
    EXPECT_EQ(starts[0].agent, "architect");
    EXPECT_EQ(starts[0].args_preview, R"({"entity_id":"light.x"})");
}

TEST(ToolDispatcherTest, UnknownAndDisabledToolsReportWithoutRunning) {
    std::atomic<int> runs{0};
    auto registry = registry_with({std::make_shared<FunctionTool>(
        "get_ha_logs", [&](const json&, const ExecutionContext&) -> Result<std::string> {
            ++runs;
            return std::string("logs");
        })});
    registry->set_enabled_check([](const std::string& name) { return name != "get_ha_logs"; });
    ToolDispatcher dispatcher(registry, Settings::defaults());
    const auto ctx = ExecutionContext::for_request(Settings::defaults(), "conv");

    Recorder recorder;
    auto result = dispatcher.dispatch(
        {make_call("a", "search_entities", json::object(), *registry),
         make_call("b", "get_ha_logs", json::object(), *registry)},
        ctx, recorder.sink());
    ASSERT_FALSE(is_error(result));

    EXPECT_EQ(get_value(result).tool_results.at("a"), "Tool search_entities not found");
    EXPECT_EQ(get_value(result).tool_results.at("b"), "Tool get_ha_logs is currently disabled");
    EXPECT_EQ(runs.load(), 0);
    const auto ends = recorder.of<ToolEndEvent>();
    ASSERT_EQ(ends.size(), 2u);
    EXPECT_FALSE(ends[0].success);
    EXPECT_FALSE(ends[1].success);
}

TEST(ToolDispatcherTest, ExceptionsAndErrorsBecomeResultText) {
    auto registry = registry_with({
        std::make_shared<FunctionTool>(
            "get_entity_state",
            [](const json&, const ExecutionContext&) -> Result<std::string> {
                throw std::runtime_error("boom");
            }),
        std::make_shared<FunctionTool>(
            "render_template",
            [](const json&, const ExecutionContext&) -> Result<std::string> {
                return HearthError{ErrorCategory::Validation, "template missing"};
            }),
        std::make_shared<FunctionTool>(
            "get_domain_summary",
            [](const json&, const ExecutionContext&) -> Result<std::string> {
                return std::string("3 lights");
            }),
    });
    ToolDispatcher dispatcher(registry, Settings::defaults());
    const auto ctx = ExecutionContext::for_request(Settings::defaults(), "conv");

    Recorder recorder;
    auto result = dispatcher.dispatch(
        {make_call("a", "get_entity_state", json::object(), *registry),
         make_call("b", "render_template", json::object(), *registry),
         make_call("c", "get_domain_summary", json::object(), *registry)},
        ctx, recorder.sink());
    ASSERT_FALSE(is_error(result));

    const auto& results = get_value(result).tool_results;
    EXPECT_EQ(results.at("a"), "Error: boom");
    EXPECT_EQ(results.at("b"), "Error: template missing");
    EXPECT_EQ(results.at("c"), "3 lights");

    const auto ends = recorder.of<ToolEndEvent>();
    ASSERT_EQ(ends.size(), 3u);
    EXPECT_FALSE(ends[0].success);
    EXPECT_FALSE(ends[1].success);
    EXPECT_TRUE(ends[2].success);
}

TEST(ToolDispatcherTest, TimeoutCancelsAndReportsWithinBound) {
    std::atomic_bool saw_cancel{false};
    auto registry = registry_with({std::make_shared<FunctionTool>(
        "get_ha_logs", [&](const json&, const ExecutionContext& ctx) -> Result<std::string> {
            if (!sleep_unless_cancelled(ctx, std::chrono::seconds(30))) {
                saw_cancel = true;
                return HearthError{ErrorCategory::Execution, "cancelled", "cancelled"};
            }
            return std::string("finished");
        })});
    ToolDispatcher dispatcher(registry, Settings::defaults(), fast_options());
    auto ctx = ExecutionContext::for_request(Settings::defaults(), "conv");
    ctx.tool_timeout = std::chrono::seconds(1);

    const auto started = std::chrono::steady_clock::now();
    auto result = dispatcher.dispatch(
        {make_call("slow", "get_ha_logs", json::object(), *registry)}, ctx, nullptr);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).tool_results.at("slow"),
              "Error: Tool get_ha_logs timed out after 1s");
    EXPECT_LT(elapsed, std::chrono::seconds(3));
    EXPECT_TRUE(saw_cancel.load());
}

TEST(ToolDispatcherTest, DispatchWaitsForWorkerThatIgnoresCancel) {
    auto finished = std::make_shared<std::atomic_bool>(false);
    auto registry = registry_with({std::make_shared<FunctionTool>(
        "get_ha_logs", [finished](const json&, const ExecutionContext&) -> Result<std::string> {
            std::this_thread::sleep_for(std::chrono::milliseconds(1800));
            finished->store(true);
            return std::string("too late");
        })});
    ToolDispatcher dispatcher(registry, Settings::defaults(), fast_options());
    auto ctx = ExecutionContext::for_request(Settings::defaults(), "conv");
    ctx.tool_timeout = std::chrono::seconds(1);

    Recorder recorder;
    auto result = dispatcher.dispatch(
        {make_call("slow", "get_ha_logs", json::object(), *registry)}, ctx, recorder.sink());

    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(finished->load());
    EXPECT_EQ(get_value(result).tool_results.at("slow"),
              "Error: Tool get_ha_logs timed out after 1s");
    const auto ends = recorder.of<ToolEndEvent>();
    ASSERT_EQ(ends.size(), 1u);
    EXPECT_FALSE(ends[0].success);
}

TEST(ToolDispatcherTest, ConfigurationErrorAbortsDispatch) {
    std::atomic<int> later_runs{0};
    auto registry = registry_with({
        std::make_shared<FunctionTool>(
            "run_custom_analysis",
            [](const json&, const ExecutionContext&) -> Result<std::string> {
                return HearthError{ErrorCategory::Configuration, "sandbox disabled in production"};
            }),
        std::make_shared<FunctionTool>(
            "get_domain_summary",
            [&](const json&, const ExecutionContext&) -> Result<std::string> {
                ++later_runs;
                return std::string("ok");
            }),
    });
    ToolDispatcher dispatcher(registry, Settings::defaults());
    const auto ctx = ExecutionContext::for_request(Settings::defaults(), "conv");

    auto result = dispatcher.dispatch(
        {make_call("a", "run_custom_analysis", json::object(), *registry),
         make_call("b", "get_domain_summary", json::object(), *registry)},
        ctx, nullptr);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Configuration);
    EXPECT_EQ(later_runs.load(), 0);
}

TEST(ToolDispatcherTest, ProgressIsForwardedBeforeToolEnd) {
    auto registry = registry_with({std::make_shared<FunctionTool>(
        "analyze_energy", [](const json&, const ExecutionContext& ctx) -> Result<std::string> {
            ctx.emit_progress(ProgressKind::AgentStart, "energy_analyst", "starting");
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
            ctx.emit_progress(ProgressKind::AgentEnd, "energy_analyst", "done");
            return std::string("analysis");
        })});
    ToolDispatcher dispatcher(registry, Settings::defaults(), fast_options());
    auto ctx = ExecutionContext::for_request(Settings::defaults(), "conv");
    auto parent_queue = std::make_shared<hearth::runtime::ProgressQueue>();
    ctx.progress_sink = parent_queue;

    Recorder recorder;
    auto result = dispatcher.dispatch(
        {make_call("e", "analyze_energy", json::object(), *registry)}, ctx, recorder.sink());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(recorder.types(),
              (std::vector<std::string>{"tool_start", "agent_start", "agent_end", "tool_end"}));
    EXPECT_EQ(parent_queue->size(), 0u);
}

TEST(ToolDispatcherTest, CancelledRequestSkipsRemainingCalls) {
    auto registry = registry_with({entity_tool()});
    ToolDispatcher dispatcher(registry, Settings::defaults());
    auto ctx = ExecutionContext::for_request(Settings::defaults(), "conv");
    ctx.cancel_token->store(true);

    auto result = dispatcher.dispatch(
        {make_call("a", "get_entity_state", json::object(), *registry)}, ctx, nullptr);
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).tool_results.empty());
}

TEST(ToolDispatcherTest, SeekApprovalSubmissionsAreSummarized) {
    auto registry = registry_with({std::make_shared<FunctionTool>(
        "seek_approval", [](const json&, const ExecutionContext&) -> Result<std::string> {
            return std::string("Proposal 'Night lights' (automation) submitted for approval.");
        })});
    ToolDispatcher dispatcher(registry, Settings::defaults());
    const auto ctx = ExecutionContext::for_request(Settings::defaults(), "conv");

    auto result = dispatcher.dispatch(
        {make_call("s", "seek_approval", {{"name", "Night lights"}}, *registry)}, ctx, nullptr);
    ASSERT_FALSE(is_error(result));
    ASSERT_EQ(get_value(result).approval_summaries.size(), 1u);
    EXPECT_NE(get_value(result).approval_summaries[0].find("Night lights"), std::string::npos);
}

TEST(ToolDispatcherTest, ParallelDispatchRunsCallsConcurrently) {
    auto slow = [](const std::string& text) {
        return [text](const json&, const ExecutionContext& ctx) -> Result<std::string> {
            ctx.emit_progress(ProgressKind::Status, text, "working");
            std::this_thread::sleep_for(std::chrono::milliseconds(400));
            return text;
        };
    };
    auto registry = registry_with({
        std::make_shared<FunctionTool>("analyze_energy", slow("energy")),
        std::make_shared<FunctionTool>("diagnose_issue", slow("diagnosis")),
        std::make_shared<FunctionTool>("get_domain_summary", slow("summary")),
    });
    ToolDispatcher dispatcher(registry, Settings::defaults(), fast_options());
    const auto ctx = ExecutionContext::for_request(Settings::defaults(), "conv");

    Recorder recorder;
    const auto started = std::chrono::steady_clock::now();
    auto result = dispatcher.dispatch_parallel(
        {make_call("1", "analyze_energy", json::object(), *registry),
         make_call("2", "control_entity", {{"entity", "light.x"}}, *registry),
         make_call("3", "diagnose_issue", json::object(), *registry),
         make_call("4", "get_domain_summary", json::object(), *registry)},
        ctx, recorder.sink());
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_FALSE(is_error(result));
    EXPECT_LT(elapsed, std::chrono::milliseconds(1100));
    const auto& results = get_value(result).tool_results;
    EXPECT_EQ(results.at("1"), "energy");
    EXPECT_EQ(results.at("2"), "Requires user approval");
    EXPECT_EQ(results.at("3"), "diagnosis");
    EXPECT_EQ(results.at("4"), "summary");
    EXPECT_EQ(get_value(result).full_tool_calls.size(), 4u);

    EXPECT_EQ(recorder.of<ToolStartEvent>().size(), 3u);
    EXPECT_EQ(recorder.of<ToolEndEvent>().size(), 3u);
    EXPECT_EQ(recorder.of<ProgressStreamEvent>().size(), 3u);
    EXPECT_EQ(recorder.of<ApprovalRequiredEvent>().size(), 1u);
}

TEST(ToolDispatcherTest, ParallelConfigurationErrorAborts) {
    auto registry = registry_with({
        std::make_shared<FunctionTool>(
            "run_custom_analysis",
            [](const json&, const ExecutionContext&) -> Result<std::string> {
                return HearthError{ErrorCategory::Configuration, "sandbox disabled in production"};
            }),
        std::make_shared<FunctionTool>(
            "get_domain_summary",
            [](const json&, const ExecutionContext& ctx) -> Result<std::string> {
                sleep_unless_cancelled(ctx, std::chrono::seconds(5));
                return std::string("late");
            }),
    });
    ToolDispatcher dispatcher(registry, Settings::defaults(), fast_options());
    const auto ctx = ExecutionContext::for_request(Settings::defaults(), "conv");

    auto result = dispatcher.dispatch_parallel(
        {make_call("a", "run_custom_analysis", json::object(), *registry),
         make_call("b", "get_domain_summary", json::object(), *registry)},
        ctx, nullptr);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Configuration);
}

TEST(ToolDispatcherTest, ParallelTimeoutLeavesSiblingsIntact) {
    auto stopped = std::make_shared<std::atomic_bool>(false);
    auto quick = [](const std::string& text) {
        return [text](const json&, const ExecutionContext& ctx) -> Result<std::string> {
            ctx.emit_progress(ProgressKind::Status, text, "working");
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            return text;
        };
    };
    auto registry = registry_with({
        std::make_shared<FunctionTool>(
            "get_ha_logs",
            [stopped](const json&, const ExecutionContext& ctx) -> Result<std::string> {
                sleep_unless_cancelled(ctx, std::chrono::seconds(30));
                stopped->store(true);
                return std::string("never reported");
            }),
        std::make_shared<FunctionTool>("get_entity_state", quick("entity")),
        std::make_shared<FunctionTool>("get_domain_summary", quick("summary")),
    });
    ToolDispatcher dispatcher(registry, Settings::defaults(), fast_options());
    auto ctx = ExecutionContext::for_request(Settings::defaults(), "conv");
    ctx.tool_timeout = std::chrono::seconds(1);

    Recorder recorder;
    auto result = dispatcher.dispatch_parallel(
        {make_call("slow", "get_ha_logs", json::object(), *registry),
         make_call("a", "get_entity_state", json::object(), *registry),
         make_call("b", "get_domain_summary", json::object(), *registry)},
        ctx, recorder.sink());

    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(stopped->load());
    const auto& results = get_value(result).tool_results;
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results.at("slow"), "Error: Tool get_ha_logs timed out after 1s");
    EXPECT_EQ(results.at("a"), "entity");
    EXPECT_EQ(results.at("b"), "summary");

    EXPECT_EQ(recorder.of<ToolStartEvent>().size(), 3u);
    EXPECT_EQ(recorder.of<ProgressStreamEvent>().size(), 2u);
    const auto ends = recorder.of<ToolEndEvent>();
    ASSERT_EQ(ends.size(), 3u);
    EXPECT_TRUE(ends[0].success);
    EXPECT_TRUE(ends[1].success);
    EXPECT_EQ(ends[2].tool_call_id, "slow");
    EXPECT_FALSE(ends[2].success);
}

TEST(ToolDispatcherTest, ParallelCancelledRequestSkipsAllCalls) {
    std::atomic<int> runs{0};
    auto registry = registry_with({std::make_shared<FunctionTool>(
        "get_entity_state", [&](const json&, const ExecutionContext&) -> Result<std::string> {
            ++runs;
            return std::string("on");
        })});
    ToolDispatcher dispatcher(registry, Settings::defaults(), fast_options());
    auto ctx = ExecutionContext::for_request(Settings::defaults(), "conv");
    ctx.cancel_token->store(true);

    Recorder recorder;
    auto result = dispatcher.dispatch_parallel(
        {make_call("a", "get_entity_state", json::object(), *registry),
         make_call("b", "control_entity", json::object(), *registry)},
        ctx, recorder.sink());
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).tool_results.empty());
    EXPECT_TRUE(recorder.events.empty());
    EXPECT_EQ(runs.load(), 0);
}

TEST(ToolDispatcherTest, TruncationKeepsUtf8Intact) {
    const std::string text = "ab\xc3\xa9" "cd";
    EXPECT_EQ(hearth::tools::truncate_utf8(text, 3), "ab");
    EXPECT_EQ(hearth::tools::truncate_utf8(text, 4), "ab\xc3\xa9");
    EXPECT_EQ(hearth::tools::truncate_utf8(text, 100), text);
}

}  // namespace

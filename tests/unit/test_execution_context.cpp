#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/settings.hpp"
#include "core/errors/hearth_errors.hpp"
#include "runtime/execution_context.hpp"
#include "storage/artifact_store.hpp"

namespace {

using hearth::core::config::Settings;
using hearth::core::errors::get_error;
using hearth::core::errors::get_value;
using hearth::core::errors::is_error;
using hearth::runtime::CommunicationEntry;
using hearth::runtime::ExecutionContext;
using hearth::runtime::ProgressKind;
using hearth::runtime::ProgressQueue;
using hearth::runtime::SpecialistFinding;
using hearth::runtime::TeamAnalysis;

TEST(ExecutionContextTest, ForRequestCopiesTimeoutsFromSettings) {
    Settings settings = Settings::defaults();
    settings.tool_timeout_seconds = 12;
    settings.analysis_tool_timeout_seconds = 90;

    const auto ctx = ExecutionContext::for_request(settings, "conv-1", "energy question");
    EXPECT_EQ(ctx.conversation_id, "conv-1");
    EXPECT_EQ(ctx.task_label, "energy question");
    EXPECT_EQ(ctx.tool_timeout, std::chrono::seconds(12));
    EXPECT_EQ(ctx.timeout_for(settings, "get_entity_state"), std::chrono::seconds(12));
    EXPECT_EQ(ctx.timeout_for(settings, "run_custom_analysis"), std::chrono::seconds(90));
    ASSERT_NE(ctx.communication_log, nullptr);
    ASSERT_NE(ctx.cancel_token, nullptr);
    EXPECT_FALSE(ctx.is_cancelled());
    EXPECT_EQ(ctx.progress_sink, nullptr);
}

TEST(ExecutionContextTest, EmitWithoutSinkIsNoop) {
    const auto ctx = ExecutionContext::for_request(Settings::defaults(), "c");
    ctx.emit_progress(ProgressKind::Status, "architect", "nobody listens");
    SUCCEED();
}

TEST(ExecutionContextTest, DeriveScopesSinkAndCancelToChild) {
    auto parent_queue = std::make_shared<ProgressQueue>();
    auto parent = ExecutionContext::for_request(Settings::defaults(), "c");
    parent.progress_sink = parent_queue;

    auto child_queue = std::make_shared<ProgressQueue>();
    const auto child = parent.derive(child_queue);
    child.emit_progress(ProgressKind::AgentStart, "data_scientist", "starting");

    EXPECT_EQ(child_queue->size(), 1u);
    EXPECT_EQ(parent_queue->size(), 0u);
    EXPECT_EQ(parent.progress_sink, parent_queue);

    child.cancel_token->store(true);
    EXPECT_TRUE(child.is_cancelled());
    EXPECT_FALSE(parent.is_cancelled());

    EXPECT_EQ(child.communication_log, parent.communication_log);
    EXPECT_EQ(child.conversation_id, parent.conversation_id);
}

TEST(ExecutionContextTest, DeriveCanShareCancelToken) {
    auto parent = ExecutionContext::for_request(Settings::defaults(), "c");
    const auto child = parent.derive(nullptr, parent.cancel_token);
    parent.cancel_token->store(true);
    EXPECT_TRUE(child.is_cancelled());
}

TEST(ExecutionContextTest, DelegationAlsoEmitsProgress) {
    auto queue = std::make_shared<ProgressQueue>();
    auto ctx = ExecutionContext::for_request(Settings::defaults(), "c");
    ctx.progress_sink = queue;

    ctx.log_communication({"data_science_team", "energy_analyst", "delegation",
                           "Analyze: energy use"});
    ctx.log_communication({"energy_analyst", "team", "finding", "Peak at 18:00"});

    EXPECT_EQ(ctx.communication_log->size(), 2u);
    auto event = queue->try_pop();
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->kind, ProgressKind::Delegation);
    EXPECT_EQ(event->agent, "data_science_team");
    EXPECT_EQ(event->target, std::optional<std::string>("energy_analyst"));
    EXPECT_FALSE(queue->try_pop().has_value());

    const auto entries = ctx.communication_log->snapshot();
    EXPECT_EQ(hearth::runtime::to_json(entries[1]).at("message_type"), "finding");
}

TEST(ExecutionContextTest, StoreAcquisitionNeedsFactory) {
    auto ctx = ExecutionContext::for_request(Settings::defaults(), "c");
    auto missing = ctx.acquire_store();
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "store_unavailable");

    ctx.store_factory = [] { return std::shared_ptr<hearth::storage::ArtifactStore>(); };
    EXPECT_TRUE(is_error(ctx.acquire_store()));

    ctx.store_factory = [] {
        return std::make_shared<hearth::storage::ArtifactStore>("/tmp/hearth-artifacts");
    };
    auto store = ctx.acquire_store();
    ASSERT_FALSE(is_error(store));
    EXPECT_EQ(get_value(store)->base_dir(), "/tmp/hearth-artifacts");
}

TEST(ProgressQueueTest, PopForTimesOutWhenEmpty) {
    ProgressQueue queue;
    const auto started = std::chrono::steady_clock::now();
    EXPECT_FALSE(queue.pop_for(std::chrono::milliseconds(50)).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(40));
}

TEST(ProgressQueueTest, ConcurrentProducersLoseNothing) {
    ProgressQueue queue;
    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([&queue, p]() {
            for (int i = 0; i < 50; ++i) {
                hearth::protocol::ProgressEvent event;
                event.agent = "p" + std::to_string(p);
                queue.push(event);
            }
        });
    }
    for (auto& producer : producers) {
        producer.join();
    }

    std::size_t drained = 0;
    while (queue.try_pop().has_value()) {
        ++drained;
    }
    EXPECT_EQ(drained, 200u);
}

TEST(TeamAnalysisTest, AssignsIdsAndSerializes) {
    TeamAnalysis team("analysis-1", "why is power high");
    SpecialistFinding finding;
    finding.specialist = "energy_analyst";
    finding.finding_type = "insight";
    finding.title = "High load";
    finding.confidence = 0.8;
    const std::string id = team.add_finding(finding);
    EXPECT_EQ(id.rfind("finding-", 0), 0u);

    team.set_consensus("1 finding");
    team.set_shared("total_w", 1200);

    const auto payload = team.to_json();
    EXPECT_EQ(payload.at("request_id"), "analysis-1");
    ASSERT_EQ(payload.at("findings").size(), 1u);
    EXPECT_EQ(payload.at("findings")[0].at("id"), id);
    EXPECT_EQ(payload.at("consensus"), "1 finding");
    EXPECT_EQ(payload.at("shared_data").at("total_w"), 1200);
}

}  // namespace

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "core/config/settings.hpp"
#include "core/errors/hearth_errors.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/tool_contract.hpp"
#include "runtime/execution_context.hpp"
#include "tools/tool_registry.hpp"

namespace hearth::tools {

struct DispatcherOptions {
    std::string agent_name = "architect";
    // How long a cancelled call is expected to take to stop. Covers the
    // sandbox's SIGTERM grace plus the process runner's SIGKILL grace; past
    // it the dispatcher logs a warning and keeps waiting.
    std::chrono::milliseconds cancel_grace{6000};
    std::chrono::milliseconds poll_slice{50};
};

struct InFlightCall;

// Executes one batch of parsed tool calls. Mutating calls only raise an
// approval request; read-only calls run on worker threads with their own
// progress queue and cancel token. A fault in one call never stops the rest
// of the batch; only a Configuration error aborts the dispatch.
class ToolDispatcher {
public:
    ToolDispatcher(std::shared_ptr<const ToolRegistry> registry,
                   core::config::Settings settings,
                   DispatcherOptions options = {});

    // Calls run one after another, in request order.
    core::errors::Result<protocol::DispatchResult> dispatch(
        const std::vector<protocol::ParsedToolCall>& calls,
        const runtime::ExecutionContext& ctx,
        const protocol::EventSink& sink) const;

    // All read-only calls run at once; their progress is muxed and each
    // tool_end is emitted as soon as that call settles.
    core::errors::Result<protocol::DispatchResult> dispatch_parallel(
        const std::vector<protocol::ParsedToolCall>& calls,
        const runtime::ExecutionContext& ctx,
        const protocol::EventSink& sink) const;

private:
    // Handles the calls that never reach a worker thread: approval-required,
    // unknown and disabled tools. Returns the tool to run otherwise.
    std::shared_ptr<Tool> admit(const protocol::ParsedToolCall& call,
                                const protocol::EventSink& sink,
                                protocol::DispatchResult& result) const;

    std::shared_ptr<InFlightCall> launch(const protocol::ParsedToolCall& call,
                                         std::shared_ptr<Tool> tool,
                                         const runtime::ExecutionContext& ctx) const;

    // Joins the call's worker. A timed-out worker is waited for even past
    // the cancel grace, so no tool outlives the dispatch that started it.
    void retire(InFlightCall& flight) const;

    // Drains leftover progress, emits tool_end and records the result text.
    core::errors::Result<bool> finalize(InFlightCall& flight,
                                        const protocol::EventSink& sink,
                                        protocol::DispatchResult& result) const;

    std::shared_ptr<const ToolRegistry> registry_;
    core::config::Settings settings_;
    DispatcherOptions options_;
};

// Cuts at a UTF-8 character boundary so previews always serialize.
std::string truncate_utf8(const std::string& text, std::size_t max_bytes);

}  // namespace hearth::tools

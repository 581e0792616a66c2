#pragma once

#include <memory>
#include <string>
#include "core/config/settings.hpp"
#include "core/errors/hearth_errors.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/tool_contract.hpp"
#include "runtime/execution_context.hpp"
#include "streaming/stream_consumer.hpp"
#include "tools/tool_dispatcher.hpp"
#include "tools/tool_registry.hpp"

namespace hearth::runtime {

struct TurnOutcome {
    std::string content;
    protocol::DispatchResult dispatch;
};

// One model turn: stream -> parsed tool calls -> dispatch.
class TurnRunner {
public:
    TurnRunner(std::shared_ptr<const tools::ToolRegistry> registry,
               core::config::Settings settings,
               tools::DispatcherOptions options = {});

    // When the model called tools but streamed no text, a fallback token is
    // emitted: the submitted proposal summaries, or a generic apology when
    // there are none.
    core::errors::Result<TurnOutcome> run_turn(streaming::FragmentSource& source,
                                               const ExecutionContext& ctx,
                                               const protocol::EventSink& sink,
                                               bool parallel = false) const;

private:
    std::shared_ptr<const tools::ToolRegistry> registry_;
    tools::ToolDispatcher dispatcher_;
};

}  // namespace hearth::runtime

#include "runtime/turn_runner.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "streaming/tool_call_parser.hpp"

namespace hearth::runtime {

namespace {

constexpr const char* kSummarySeparator = "\n\n---\n\n";
constexpr const char* kNoResponseFallback =
    "I processed your request using several tools but wasn't able to "
    "generate a complete response. Please try rephrasing or breaking "
    "your request into smaller steps.";

}  // namespace

TurnRunner::TurnRunner(std::shared_ptr<const tools::ToolRegistry> registry,
                       core::config::Settings settings,
                       tools::DispatcherOptions options)
    : registry_(registry),
      dispatcher_(std::move(registry), std::move(settings), std::move(options)) {}

core::errors::Result<TurnOutcome> TurnRunner::run_turn(streaming::FragmentSource& source,
                                                       const ExecutionContext& ctx,
                                                       const protocol::EventSink& sink,
                                                       const bool parallel) const {
    auto streamed = streaming::consume_stream(source, sink);
    if (core::errors::is_error(streamed)) {
        return core::errors::get_error(streamed);
    }
    protocol::StreamOutcome& stream = core::errors::get_value(streamed);

    TurnOutcome outcome;
    outcome.content = std::move(stream.collected_content);

    const auto registry = registry_;
    const auto calls = streaming::ToolCallParser::parse(
        stream.tool_calls, [registry](const std::string& name) {
            return !registry || registry->is_mutating(name);
        });
    HEARTH_LOG_INFO("Turn produced " + std::to_string(stream.tool_calls.size()) +
                    " tool call(s), " + std::to_string(calls.size()) + " parsed");

    if (!calls.empty()) {
        auto dispatched = parallel ? dispatcher_.dispatch_parallel(calls, ctx, sink)
                                   : dispatcher_.dispatch(calls, ctx, sink);
        if (core::errors::is_error(dispatched)) {
            return core::errors::get_error(dispatched);
        }
        outcome.dispatch = std::move(core::errors::get_value(dispatched));
    }

    // A turn that only called tools still has to leave the user something
    // to read.
    if (outcome.content.empty() && !stream.tool_calls.empty()) {
        std::string fallback;
        if (outcome.dispatch.approval_summaries.empty()) {
            fallback = kNoResponseFallback;
        } else {
            for (const auto& summary : outcome.dispatch.approval_summaries) {
                if (!fallback.empty()) {
                    fallback += kSummarySeparator;
                }
                fallback += summary;
            }
        }
        if (sink) {
            sink(protocol::TokenEvent{fallback});
        }
        outcome.content = std::move(fallback);
    }
    return outcome;
}

}  // namespace hearth::runtime

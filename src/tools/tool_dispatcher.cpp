#include "tools/tool_dispatcher.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <exception>
#include <future>
#include <optional>
#include <thread>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "runtime/progress_muxer.hpp"

namespace hearth::tools {

using core::errors::ErrorCategory;
using core::errors::HearthError;
using core::errors::Result;
using protocol::DispatchResult;
using protocol::EventSink;
using protocol::ParsedToolCall;
using Clock = std::chrono::steady_clock;

struct InFlightCall {
    ParsedToolCall call;
    std::shared_ptr<runtime::ProgressQueue> queue;
    std::shared_ptr<std::atomic_bool> cancel;
    std::future<Result<std::string>> future;
    std::chrono::seconds timeout{0};
    Clock::time_point deadline;
    std::optional<Clock::time_point> cancelled_at;
    bool finalized = false;
    std::thread worker;

    InFlightCall() = default;
    InFlightCall(const InFlightCall&) = delete;
    InFlightCall& operator=(const InFlightCall&) = delete;

    ~InFlightCall() {
        if (worker.joinable()) {
            cancel->store(true);
            worker.join();
        }
    }

    bool ready() const {
        return future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }
};

namespace {

constexpr std::size_t kArgsPreviewBytes = 200;
constexpr std::size_t kResultPreviewBytes = 500;

std::string args_text(const nlohmann::json& args) {
    if (args.empty()) {
        return "";
    }
    return args.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool mentions_submission(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered.find("submitted") != std::string::npos ||
           lowered.find("proposal") != std::string::npos;
}

void forward_progress(const EventSink& sink, runtime::ProgressEvent event) {
    if (sink) {
        sink(protocol::ProgressStreamEvent{std::move(event)});
    }
}

void emit(const EventSink& sink, const protocol::StreamEvent& event) {
    if (sink) {
        sink(event);
    }
}

std::chrono::milliseconds until(Clock::time_point deadline, std::chrono::milliseconds cap) {
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return std::clamp(remaining, std::chrono::milliseconds(1), cap);
}

// Returns true once the call has settled: it finished, or it reached its
// deadline and was cancelled. The worker may still be unwinding after that.
bool sweep(InFlightCall& flight) {
    if (flight.cancelled_at || flight.ready()) {
        return true;
    }
    const auto now = Clock::now();
    if (now < flight.deadline) {
        return false;
    }
    flight.cancel->store(true);
    flight.cancelled_at = now;
    HEARTH_LOG_WARN("Tool " + flight.call.name + " (" + flight.call.id +
                    ") hit its deadline; cancelling");
    return true;
}

}  // namespace

std::string truncate_utf8(const std::string& text, std::size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }
    std::size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut);
}

ToolDispatcher::ToolDispatcher(std::shared_ptr<const ToolRegistry> registry,
                               core::config::Settings settings,
                               DispatcherOptions options)
    : registry_(std::move(registry)),
      settings_(std::move(settings)),
      options_(std::move(options)) {}

std::shared_ptr<Tool> ToolDispatcher::admit(const ParsedToolCall& call,
                                            const EventSink& sink,
                                            DispatchResult& result) const {
    result.full_tool_calls.push_back(call);

    if (call.is_mutating) {
        const std::string args = call.args.dump(-1, ' ', false,
                                                nlohmann::json::error_handler_t::replace);
        emit(sink, protocol::ApprovalRequiredEvent{
                       call.id, call.name, "Approval needed: " + call.name + "(" + args + ")"});
        result.tool_results[call.id] = "Requires user approval";
        HEARTH_LOG_INFO("Tool " + call.name + " requires approval; not executed");
        return nullptr;
    }

    emit(sink, protocol::ToolStartEvent{call.id, call.name, options_.agent_name,
                                        truncate_utf8(args_text(call.args), kArgsPreviewBytes)});

    std::string refusal;
    std::shared_ptr<Tool> tool = registry_ ? registry_->find(call.name) : nullptr;
    if (!tool) {
        refusal = "Tool " + call.name + " not found";
    } else if (!registry_->is_enabled(call.name)) {
        refusal = "Tool " + call.name + " is currently disabled";
        tool.reset();
    }

    if (!tool) {
        HEARTH_LOG_WARN(refusal);
        emit(sink, protocol::ToolEndEvent{call.id, call.name, refusal, false});
        result.tool_results[call.id] = refusal;
    }
    return tool;
}

std::shared_ptr<InFlightCall> ToolDispatcher::launch(const ParsedToolCall& call,
                                                     std::shared_ptr<Tool> tool,
                                                     const runtime::ExecutionContext& ctx) const {
    auto flight = std::make_shared<InFlightCall>();
    flight->call = call;
    flight->queue = std::make_shared<runtime::ProgressQueue>();
    flight->cancel = std::make_shared<std::atomic_bool>(false);
    flight->timeout = ctx.timeout_for(settings_, call.name);
    flight->deadline = Clock::now() + flight->timeout;

    auto promise = std::make_shared<std::promise<Result<std::string>>>();
    flight->future = promise->get_future();

    runtime::ExecutionContext child = ctx.derive(flight->queue, flight->cancel);
    flight->worker = std::thread([tool = std::move(tool), args = call.args,
                                  child = std::move(child), promise]() {
        try {
            promise->set_value(tool->invoke(args, child));
        } catch (const std::exception& e) {
            promise->set_value(HearthError{ErrorCategory::Execution, e.what(), "tool_exception"});
        }
    });

    HEARTH_LOG_DEBUG("Launched " + call.name + " (" + call.id + ") with a " +
                     std::to_string(flight->timeout.count()) + "s deadline");
    return flight;
}

Result<bool> ToolDispatcher::finalize(InFlightCall& flight, const EventSink& sink,
                                      DispatchResult& result) const {
    flight.finalized = true;
    while (auto event = flight.queue->try_pop()) {
        forward_progress(sink, std::move(*event));
    }

    const ParsedToolCall& call = flight.call;
    std::string text;
    bool success = false;

    if (flight.cancelled_at) {
        text = "Error: Tool " + call.name + " timed out after " +
               std::to_string(flight.timeout.count()) + "s";
        HEARTH_LOG_WARN(text);
    } else {
        Result<std::string> outcome = flight.future.get();
        if (core::errors::is_error(outcome)) {
            const HearthError& error = core::errors::get_error(outcome);
            if (core::errors::is_fatal(error)) {
                HEARTH_LOG_ERROR("Tool " + call.name + " raised a fatal error: " + error.message);
                return error;
            }
            text = "Error: " + error.message;
            HEARTH_LOG_WARN("Tool " + call.name + " failed: " + error.message);
        } else {
            text = std::move(core::errors::get_value(outcome));
            success = true;
        }
    }

    emit(sink, protocol::ToolEndEvent{call.id, call.name,
                                      truncate_utf8(text, kResultPreviewBytes), success});
    if (success && call.name == "seek_approval" && mentions_submission(text)) {
        result.approval_summaries.push_back(text);
    }
    result.tool_results[call.id] = std::move(text);
    return true;
}

void ToolDispatcher::retire(InFlightCall& flight) const {
    if (!flight.worker.joinable()) {
        return;
    }
    if (flight.future.wait_for(options_.cancel_grace) != std::future_status::ready) {
        HEARTH_LOG_WARN("Tool " + flight.call.name + " (" + flight.call.id +
                        ") is still running after cancellation; waiting for it to stop");
    }
    flight.worker.join();
    if (flight.cancelled_at && flight.queue->size() > 0) {
        HEARTH_LOG_DEBUG("Dropping " + std::to_string(flight.queue->size()) +
                         " progress event(s) from timed-out tool " + flight.call.name);
    }
}

Result<DispatchResult> ToolDispatcher::dispatch(const std::vector<ParsedToolCall>& calls,
                                                const runtime::ExecutionContext& ctx,
                                                const EventSink& sink) const {
    DispatchResult result;

    for (const auto& call : calls) {
        if (ctx.is_cancelled()) {
            HEARTH_LOG_INFO("Request cancelled; skipping remaining tool calls");
            break;
        }
        std::shared_ptr<Tool> tool = admit(call, sink, result);
        if (!tool) {
            continue;
        }

        auto flight = launch(call, std::move(tool), ctx);
        while (!sweep(*flight)) {
            if (auto event = flight->queue->pop_for(until(flight->deadline, options_.poll_slice))) {
                forward_progress(sink, std::move(*event));
            }
        }

        auto finalized = finalize(*flight, sink, result);
        retire(*flight);
        if (core::errors::is_error(finalized)) {
            return core::errors::get_error(finalized);
        }
    }
    return result;
}

Result<DispatchResult> ToolDispatcher::dispatch_parallel(const std::vector<ParsedToolCall>& calls,
                                                         const runtime::ExecutionContext& ctx,
                                                         const EventSink& sink) const {
    DispatchResult result;
    if (ctx.is_cancelled()) {
        HEARTH_LOG_INFO("Request cancelled; skipping tool calls");
        return result;
    }

    std::vector<std::shared_ptr<InFlightCall>> flights;
    std::vector<std::shared_ptr<runtime::ProgressQueue>> queues;

    for (const auto& call : calls) {
        std::shared_ptr<Tool> tool = admit(call, sink, result);
        if (!tool) {
            continue;
        }
        auto flight = launch(call, std::move(tool), ctx);
        queues.push_back(flight->queue);
        flights.push_back(std::move(flight));
    }

    std::optional<HearthError> fatal;
    auto settle = [&]() {
        bool all_settled = true;
        for (auto& flight : flights) {
            if (flight->finalized) {
                continue;
            }
            if (!sweep(*flight)) {
                all_settled = false;
                continue;
            }
            auto finalized = finalize(*flight, sink, result);
            if (core::errors::is_error(finalized) && !fatal) {
                fatal = core::errors::get_error(finalized);
            }
        }
        return all_settled || fatal.has_value();
    };

    runtime::ProgressMuxer muxer(options_.poll_slice);
    muxer.run(queues, settle,
              [&](std::size_t, const runtime::ProgressEvent& event) {
                  forward_progress(sink, event);
                  settle();
              });
    // The muxer may stop on its final drain before every call was finalized.
    while (!fatal && !settle()) {
        std::this_thread::sleep_for(options_.poll_slice);
    }

    if (fatal) {
        for (auto& flight : flights) {
            flight->cancel->store(true);
        }
    }
    for (auto& flight : flights) {
        retire(*flight);
    }
    if (fatal) {
        return *fatal;
    }
    return result;
}

}  // namespace hearth::tools

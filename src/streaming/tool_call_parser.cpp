#include "streaming/tool_call_parser.hpp"

#include <nlohmann/json.hpp>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"

namespace hearth::streaming {

using nlohmann::json;
using protocol::ParsedToolCall;
using protocol::ToolCallBufferEntry;

namespace {

std::string preview(const std::string& text) {
    constexpr std::size_t kMaxPreview = 120;
    return text.size() <= kMaxPreview ? text : text.substr(0, kMaxPreview) + "...";
}

}  // namespace

std::vector<ParsedToolCall> ToolCallParser::parse(const std::vector<ToolCallBufferEntry>& buffer,
                                                  const MutatingPredicate& is_mutating) {
    std::vector<ParsedToolCall> calls;
    calls.reserve(buffer.size());

    for (const auto& entry : buffer) {
        if (entry.name.empty()) {
            HEARTH_LOG_WARN("Dropping tool call #" + std::to_string(entry.index) +
                            " with empty name (truncated output?), args: " +
                            preview(entry.args));
            continue;
        }

        json args = json::object();
        if (entry.args.find_first_not_of(" \t\r\n") != std::string::npos) {
            args = json::parse(entry.args, nullptr, false);
            if (args.is_discarded()) {
                HEARTH_LOG_WARN("Dropping tool call '" + entry.name +
                                "': unparsable arguments: " + preview(entry.args));
                continue;
            }
            if (!args.is_object()) {
                HEARTH_LOG_WARN("Dropping tool call '" + entry.name +
                                "': arguments are not an object: " + preview(entry.args));
                continue;
            }
        }

        ParsedToolCall call;
        call.name = entry.name;
        call.args = std::move(args);
        call.id = entry.id.empty() ? core::config::generate_id("call") : entry.id;
        call.is_mutating = is_mutating ? is_mutating(entry.name) : true;
        calls.push_back(std::move(call));
    }
    return calls;
}

}  // namespace hearth::streaming

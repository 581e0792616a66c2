#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace hearth::protocol {

    // One partial tool call as it arrives on the model stream. Every field
    // except the index may be missing from any given fragment.
    struct ToolCallChunk {
        int index = 0;
        std::optional<std::string> name;
        std::optional<std::string> args_delta;
        std::optional<std::string> id;
    };

    // A single model-stream fragment
    struct StreamFragment {
        std::optional<std::string> content;
        std::vector<ToolCallChunk> tool_call_chunks;
    };

    // Accumulated state of one tool call; args stay raw text until parsed.
    struct ToolCallBufferEntry {
        int index = 0;
        std::string name;
        std::string args;
        std::string id;
    };

    // Built only by ToolCallParser from a fully accumulated buffer entry
    struct ParsedToolCall {
        std::string id;
        std::string name;
        nlohmann::json args = nlohmann::json::object();
        bool is_mutating = false;
    };

    // What the stream produced once it closed
    struct StreamOutcome {
        std::string collected_content;
        std::vector<ToolCallBufferEntry> tool_calls;
    };

    // Aggregate of one dispatch batch
    struct DispatchResult {
        std::map<std::string, std::string> tool_results;  // call id -> result text
        std::vector<ParsedToolCall> full_tool_calls;       // in request order
        std::vector<std::string> approval_summaries;
    };

    inline nlohmann::json to_json(const ParsedToolCall& call) {
        return {{"id", call.id}, {"name", call.name}, {"args", call.args}};
    }

} // namespace hearth::protocol

#pragma once

#include <functional>
#include <string>
#include <vector>
#include "protocol/tool_contract.hpp"

namespace hearth::streaming {

class ToolCallParser {
public:
    using MutatingPredicate = std::function<bool(const std::string& tool_name)>;

    // Entries with an empty name (truncated output) or arguments that are
    // not a JSON object are dropped with a warning; the rest keep their
    // order. Empty argument text means no arguments. Never fails as a whole.
    static std::vector<protocol::ParsedToolCall> parse(
        const std::vector<protocol::ToolCallBufferEntry>& buffer,
        const MutatingPredicate& is_mutating);
};

}  // namespace hearth::streaming

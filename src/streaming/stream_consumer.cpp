#include "streaming/stream_consumer.hpp"

#include <map>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace hearth::streaming {

using core::errors::ErrorCategory;
using core::errors::HearthError;
using nlohmann::json;
using protocol::StreamFragment;
using protocol::ToolCallBufferEntry;
using protocol::ToolCallChunk;

namespace {

HearthError malformed(const std::string& reason) {
    return HearthError{ErrorCategory::Validation, "Malformed stream fragment: " + reason,
                       "malformed_fragment"};
}

std::optional<std::string> optional_string(const json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return std::nullopt;
}

// Only args arrive as deltas. Providers may repeat the name and id on every
// chunk of a call, so a non-empty name or id replaces the buffered one.
void merge_chunk(std::map<int, ToolCallBufferEntry>& buffer, const ToolCallChunk& chunk) {
    auto& entry = buffer[chunk.index];
    entry.index = chunk.index;
    if (chunk.name.has_value() && !chunk.name->empty()) {
        entry.name = *chunk.name;
    }
    if (chunk.args_delta.has_value()) {
        entry.args += *chunk.args_delta;
    }
    if (chunk.id.has_value() && !chunk.id->empty()) {
        entry.id = *chunk.id;
    }
}

}  // namespace

VectorFragmentSource::VectorFragmentSource(std::vector<StreamFragment> fragments)
    : fragments_(std::move(fragments)) {}

core::errors::Result<std::optional<StreamFragment>> VectorFragmentSource::next() {
    if (position_ >= fragments_.size()) {
        return std::optional<StreamFragment>{};
    }
    return std::optional<StreamFragment>{fragments_[position_++]};
}

JsonLinesFragmentSource::JsonLinesFragmentSource(std::istream& input) : input_(input) {}

core::errors::Result<std::optional<StreamFragment>> JsonLinesFragmentSource::next() {
    std::string line;
    while (std::getline(input_, line)) {
        ++line_number_;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        auto parsed = parse_fragment_json(line);
        if (core::errors::is_error(parsed)) {
            auto err = core::errors::get_error(parsed);
            err.message += " (line " + std::to_string(line_number_) + ")";
            return err;
        }
        return std::optional<StreamFragment>{core::errors::get_value(parsed)};
    }
    if (input_.bad()) {
        return HearthError{ErrorCategory::Internal, "Failed reading model stream input.",
                           "stream_read_failed"};
    }
    return std::optional<StreamFragment>{};
}

core::errors::Result<StreamFragment> parse_fragment_json(const std::string& text) {
    const json root = json::parse(text, nullptr, false);
    if (root.is_discarded()) {
        return malformed("not valid JSON");
    }
    if (!root.is_object()) {
        return malformed("expected a JSON object");
    }

    StreamFragment fragment;
    fragment.content = optional_string(root, "content");

    const auto chunks = root.find("tool_call_chunks");
    if (chunks != root.end() && !chunks->is_null()) {
        if (!chunks->is_array()) {
            return malformed("tool_call_chunks must be an array");
        }
        for (const auto& item : *chunks) {
            if (!item.is_object()) {
                return malformed("tool call chunk must be an object");
            }
            ToolCallChunk chunk;
            const auto index = item.find("index");
            if (index != item.end() && index->is_number_integer()) {
                chunk.index = index->get<int>();
            }
            chunk.name = optional_string(item, "name");
            chunk.args_delta = optional_string(item, "args");
            chunk.id = optional_string(item, "id");
            fragment.tool_call_chunks.push_back(std::move(chunk));
        }
    }
    return fragment;
}

core::errors::Result<protocol::StreamOutcome> consume_stream(FragmentSource& source,
                                                             const protocol::EventSink& sink) {
    protocol::StreamOutcome outcome;
    std::map<int, ToolCallBufferEntry> buffer;

    while (true) {
        auto next = source.next();
        if (core::errors::is_error(next)) {
            const auto& err = core::errors::get_error(next);
            if (err.category == ErrorCategory::Validation) {
                HEARTH_LOG_WARN("Skipping stream fragment: " + err.message);
                continue;
            }
            return err;
        }

        auto& fragment = core::errors::get_value(next);
        if (!fragment.has_value()) {
            break;
        }

        if (!fragment->tool_call_chunks.empty()) {
            // Some models leak partial JSON as text next to tool calls.
            for (const auto& chunk : fragment->tool_call_chunks) {
                merge_chunk(buffer, chunk);
            }
            continue;
        }

        if (fragment->content.has_value() && !fragment->content->empty()) {
            outcome.collected_content += *fragment->content;
            if (sink) {
                sink(protocol::TokenEvent{*fragment->content});
            }
        }
    }

    outcome.tool_calls.reserve(buffer.size());
    for (auto& [index, entry] : buffer) {
        outcome.tool_calls.push_back(std::move(entry));
    }
    return outcome;
}

}  // namespace hearth::streaming

#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/hearth_errors.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/tool_contract.hpp"

namespace hearth::streaming {

// Pull interface over a model response. `std::nullopt` marks end of stream.
class FragmentSource {
public:
    virtual ~FragmentSource() = default;
    virtual core::errors::Result<std::optional<protocol::StreamFragment>> next() = 0;
};

class VectorFragmentSource : public FragmentSource {
public:
    explicit VectorFragmentSource(std::vector<protocol::StreamFragment> fragments);
    core::errors::Result<std::optional<protocol::StreamFragment>> next() override;

private:
    std::vector<protocol::StreamFragment> fragments_;
    std::size_t position_ = 0;
};

// One JSON fragment per line:
//   {"content": "...", "tool_call_chunks": [{"index": 0, "name": "...", "args": "...", "id": "..."}]}
// Blank lines are skipped. A malformed line yields a Validation error for
// that line only; the next call continues with the following line.
class JsonLinesFragmentSource : public FragmentSource {
public:
    explicit JsonLinesFragmentSource(std::istream& input);
    core::errors::Result<std::optional<protocol::StreamFragment>> next() override;

private:
    std::istream& input_;
    std::size_t line_number_ = 0;
};

core::errors::Result<protocol::StreamFragment> parse_fragment_json(const std::string& text);

// Emits a TokenEvent for every text-only fragment and merges tool-call
// chunks by index. Text that arrives together with tool-call chunks is
// suppressed. Validation errors from the source are logged and skipped;
// any other source error aborts the stream.
core::errors::Result<protocol::StreamOutcome> consume_stream(FragmentSource& source,
                                                             const protocol::EventSink& sink);

}  // namespace hearth::streaming

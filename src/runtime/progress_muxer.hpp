#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <vector>
#include "runtime/execution_context.hpp"

namespace hearth::runtime {

// Merges N progress queues into one stream. Events from one queue keep
// their order; across queues they come out in arrival order.
class ProgressMuxer {
public:
    using DonePredicate = std::function<bool()>;
    // `source` is the index of the queue the event came from.
    using Sink = std::function<void(std::size_t source, const ProgressEvent& event)>;

    explicit ProgressMuxer(
        std::chrono::milliseconds poll_interval = std::chrono::milliseconds(20));

    // Drains round-robin until `done` holds and a full pass finds nothing,
    // then drains once more for events pushed in between. Returns the
    // number of events delivered. Returns at once for zero queues.
    std::size_t run(const std::vector<std::shared_ptr<ProgressQueue>>& queues,
                    const DonePredicate& done, const Sink& sink) const;

private:
    std::size_t drain_pass(const std::vector<std::shared_ptr<ProgressQueue>>& queues,
                           const Sink& sink) const;

    std::chrono::milliseconds poll_interval_;
};

}  // namespace hearth::runtime

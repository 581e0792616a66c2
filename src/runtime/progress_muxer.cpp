#include "runtime/progress_muxer.hpp"

#include <thread>

namespace hearth::runtime {

ProgressMuxer::ProgressMuxer(const std::chrono::milliseconds poll_interval)
    : poll_interval_(poll_interval) {}

std::size_t ProgressMuxer::drain_pass(
    const std::vector<std::shared_ptr<ProgressQueue>>& queues, const Sink& sink) const {
    std::size_t delivered = 0;
    for (std::size_t source = 0; source < queues.size(); ++source) {
        if (!queues[source]) {
            continue;
        }
        while (auto event = queues[source]->try_pop()) {
            sink(source, *event);
            ++delivered;
        }
    }
    return delivered;
}

std::size_t ProgressMuxer::run(const std::vector<std::shared_ptr<ProgressQueue>>& queues,
                               const DonePredicate& done, const Sink& sink) const {
    if (queues.empty()) {
        return 0;
    }

    std::size_t total = 0;
    while (true) {
        const std::size_t found = drain_pass(queues, sink);
        total += found;
        if (found > 0) {
            continue;
        }
        if (done()) {
            // Catch anything pushed between the empty pass and `done`.
            total += drain_pass(queues, sink);
            return total;
        }
        std::this_thread::sleep_for(poll_interval_);
    }
}

}  // namespace hearth::runtime

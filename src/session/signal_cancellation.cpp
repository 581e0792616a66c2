#include "session/signal_cancellation.hpp"

#include <cerrno>
#include <cstring>
#include <utility>
#include "core/logging/logger.hpp"

namespace hearth::session {

namespace {

std::atomic<int> g_pending_signal{0};

static_assert(std::atomic<int>::is_always_lock_free,
              "signal handler needs a lock-free flag");

extern "C" void record_signal(int signo) {
    g_pending_signal.store(signo);
}

void install(int signo, struct sigaction& previous) {
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = record_signal;
    sigemptyset(&action.sa_mask);
    if (::sigaction(signo, &action, &previous) != 0) {
        HEARTH_LOG_WARN("Unable to install handler for signal " + std::to_string(signo) +
                        ": " + std::strerror(errno));
    }
}

}  // namespace

SignalCancellation::SignalCancellation(RequestManager& requests, std::string request_id,
                                       std::chrono::milliseconds poll)
    : requests_(requests), request_id_(std::move(request_id)), poll_(poll) {
    g_pending_signal.store(0);
    install(SIGINT, previous_int_);
    install(SIGTERM, previous_term_);
    watcher_ = std::thread([this]() { watch(); });
}

SignalCancellation::~SignalCancellation() {
    stop_.store(true);
    watcher_.join();
    ::sigaction(SIGINT, &previous_int_, nullptr);
    ::sigaction(SIGTERM, &previous_term_, nullptr);
}

void SignalCancellation::watch() {
    while (!stop_.load()) {
        const int signo = g_pending_signal.exchange(0);
        if (signo == 0) {
            std::this_thread::sleep_for(poll_);
            continue;
        }
        received_.store(signo);
        HEARTH_LOG_WARN("Received signal " + std::to_string(signo) + "; cancelling request " +
                        request_id_);
        auto cancelled = requests_.cancel_request(request_id_);
        if (core::errors::is_error(cancelled)) {
            HEARTH_LOG_WARN("Request " + request_id_ + " not cancelled: " +
                            core::errors::get_error(cancelled).message);
        }
    }
}

}  // namespace hearth::session

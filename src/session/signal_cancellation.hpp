#pragma once

#include <atomic>
#include <chrono>
#include <csignal>
#include <string>
#include <thread>
#include "session/request_manager.hpp"

namespace hearth::session {

// Turns SIGINT/SIGTERM into RequestManager::cancel_request for one request
// while in scope. The handler only records the signal; a watcher thread does
// the cancellation, so nothing unsafe runs in signal context. Previous
// handlers are restored on destruction. One instance at a time.
class SignalCancellation {
public:
    SignalCancellation(RequestManager& requests, std::string request_id,
                       std::chrono::milliseconds poll = std::chrono::milliseconds(50));
    ~SignalCancellation();

    SignalCancellation(const SignalCancellation&) = delete;
    SignalCancellation& operator=(const SignalCancellation&) = delete;

    // The signal that cancelled the request, or 0.
    int received_signal() const { return received_.load(); }

private:
    void watch();

    RequestManager& requests_;
    std::string request_id_;
    std::chrono::milliseconds poll_;
    std::atomic_bool stop_{false};
    std::atomic<int> received_{0};
    struct sigaction previous_int_{};
    struct sigaction previous_term_{};
    std::thread watcher_;
};

}  // namespace hearth::session

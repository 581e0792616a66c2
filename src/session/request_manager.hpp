#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "core/errors/hearth_errors.hpp"

namespace hearth::session {

enum class RequestState {
    Created,
    Running,
    Completed,
    Failed,
    Cancelled
};

struct RequestRecord {
    std::string request_id;
    std::string conversation_id;
    std::string task_label;
    RequestState state = RequestState::Created;
    std::optional<std::string> failure_reason;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

class RequestManager {
public:
    // Returns a fresh "req-xxxxxxxx" id already in the running state.
    core::errors::Result<std::string> start_request(const std::string& conversation_id,
                                                    const std::string& task_label = "");

    // Also raises the request's cancel token.
    core::errors::Result<RequestState> cancel_request(const std::string& request_id);
    core::errors::Result<RequestState> mark_completed(const std::string& request_id);
    core::errors::Result<RequestState> mark_failed(const std::string& request_id,
                                                   const std::string& reason);

    core::errors::Result<RequestState> get_state(const std::string& request_id) const;
    core::errors::Result<std::shared_ptr<std::atomic_bool>> get_cancel_token(
        const std::string& request_id) const;
    core::errors::Result<RequestRecord> get_record(const std::string& request_id) const;

    std::size_t request_count() const;

private:
    core::errors::Result<RequestState> transition_to_terminal(
        const std::string& request_id, RequestState next_state,
        const std::optional<std::string>& failure_reason);
    static bool is_terminal(RequestState state);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, RequestRecord> requests_;
};

std::string to_string(RequestState state);

}  // namespace hearth::session

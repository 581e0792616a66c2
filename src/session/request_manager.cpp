#include "session/request_manager.hpp"
#include <utility>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"

namespace hearth::session {

using core::errors::ErrorCategory;
using core::errors::HearthError;

namespace {

HearthError not_found(const std::string& request_id) {
    return HearthError{ErrorCategory::Input, "Request ID not found: " + request_id,
                       "request_not_found"};
}

}  // namespace

std::string to_string(const RequestState state) {
    switch (state) {
        case RequestState::Created:
            return "created";
        case RequestState::Running:
            return "running";
        case RequestState::Completed:
            return "completed";
        case RequestState::Failed:
            return "failed";
        case RequestState::Cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

bool RequestManager::is_terminal(const RequestState state) {
    return state == RequestState::Completed || state == RequestState::Failed ||
           state == RequestState::Cancelled;
}

core::errors::Result<std::string> RequestManager::start_request(
    const std::string& conversation_id, const std::string& task_label) {
    if (conversation_id.empty()) {
        return HearthError{ErrorCategory::Input,
                           "Request must belong to a conversation.",
                           "invalid_request"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    constexpr int kMaxAttempts = 16;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        const std::string request_id = core::config::generate_id("req");
        if (requests_.find(request_id) != requests_.end()) {
            continue;
        }

        RequestRecord record;
        record.request_id = request_id;
        record.conversation_id = conversation_id;
        record.task_label = task_label;
        record.state = RequestState::Created;
        record.cancel_token = std::make_shared<std::atomic_bool>(false);
        requests_.emplace(request_id, std::move(record));
        HEARTH_LOG_INFO("RequestManager: request " + request_id +
                        " transition created -> running");
        requests_[request_id].state = RequestState::Running;
        return request_id;
    }

    return HearthError{ErrorCategory::Internal,
                       "Unable to allocate unique request ID.",
                       "request_id_generation_failed"};
}

core::errors::Result<RequestState> RequestManager::cancel_request(
    const std::string& request_id) {
    return transition_to_terminal(request_id, RequestState::Cancelled, std::nullopt);
}

core::errors::Result<RequestState> RequestManager::mark_completed(
    const std::string& request_id) {
    return transition_to_terminal(request_id, RequestState::Completed, std::nullopt);
}

core::errors::Result<RequestState> RequestManager::mark_failed(
    const std::string& request_id, const std::string& reason) {
    return transition_to_terminal(request_id, RequestState::Failed, reason);
}

core::errors::Result<RequestState> RequestManager::transition_to_terminal(
    const std::string& request_id, const RequestState next_state,
    const std::optional<std::string>& failure_reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(request_id);
    if (it == requests_.end()) {
        return not_found(request_id);
    }

    if (is_terminal(it->second.state)) {
        return HearthError{ErrorCategory::Input,
                           "Request is already terminal: " + to_string(it->second.state),
                           "invalid_state_transition"};
    }

    const std::string prev = to_string(it->second.state);
    it->second.state = next_state;
    it->second.failure_reason = failure_reason;
    if (next_state == RequestState::Cancelled) {
        it->second.cancel_token->store(true);
    }
    HEARTH_LOG_INFO("RequestManager: request " + request_id + " transition " + prev +
                    " -> " + to_string(next_state));
    return it->second.state;
}

core::errors::Result<RequestState> RequestManager::get_state(
    const std::string& request_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(request_id);
    if (it == requests_.end()) {
        return not_found(request_id);
    }
    return it->second.state;
}

core::errors::Result<std::shared_ptr<std::atomic_bool>> RequestManager::get_cancel_token(
    const std::string& request_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(request_id);
    if (it == requests_.end()) {
        return not_found(request_id);
    }
    return it->second.cancel_token;
}

core::errors::Result<RequestRecord> RequestManager::get_record(
    const std::string& request_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(request_id);
    if (it == requests_.end()) {
        return not_found(request_id);
    }
    return it->second;
}

std::size_t RequestManager::request_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
}

}  // namespace hearth::session

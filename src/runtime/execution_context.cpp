#include "runtime/execution_context.hpp"

#include <utility>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"

namespace hearth::runtime {

using core::errors::ErrorCategory;
using core::errors::HearthError;
using nlohmann::json;

using protocol::unix_seconds;

void ProgressQueue::push(ProgressEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(std::move(event));
    }
    cv_.notify_one();
}

std::optional<ProgressEvent> ProgressQueue::try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.empty()) {
        return std::nullopt;
    }
    ProgressEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::optional<ProgressEvent> ProgressQueue::pop_for(const std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !events_.empty(); })) {
        return std::nullopt;
    }
    ProgressEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::size_t ProgressQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

void CommunicationLog::append(CommunicationEntry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(std::move(entry));
}

std::vector<CommunicationEntry> CommunicationLog::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

std::size_t CommunicationLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

json to_json(const CommunicationEntry& entry) {
    return json{{"from_agent", entry.from_agent},
                {"to_agent", entry.to_agent},
                {"message_type", entry.message_type},
                {"content", entry.content},
                {"metadata", entry.metadata},
                {"ts", unix_seconds(entry.timestamp)}};
}

json to_json(const SpecialistFinding& finding) {
    return json{{"id", finding.id},
                {"specialist", finding.specialist},
                {"finding_type", finding.finding_type},
                {"title", finding.title},
                {"description", finding.description},
                {"confidence", finding.confidence},
                {"entities", finding.entities},
                {"evidence", finding.evidence}};
}

TeamAnalysis::TeamAnalysis(std::string request_id, std::string request_summary)
    : request_id_(std::move(request_id)), request_summary_(std::move(request_summary)) {}

std::string TeamAnalysis::add_finding(SpecialistFinding finding) {
    if (finding.id.empty()) {
        finding.id = core::config::generate_id("finding");
    }
    std::string id = finding.id;
    std::lock_guard<std::mutex> lock(mutex_);
    findings_.push_back(std::move(finding));
    return id;
}

std::vector<SpecialistFinding> TeamAnalysis::findings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return findings_;
}

void TeamAnalysis::set_consensus(std::string consensus) {
    std::lock_guard<std::mutex> lock(mutex_);
    consensus_ = std::move(consensus);
}

std::optional<std::string> TeamAnalysis::consensus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consensus_;
}

void TeamAnalysis::set_shared(const std::string& key, json value) {
    std::lock_guard<std::mutex> lock(mutex_);
    shared_data_[key] = std::move(value);
}

json TeamAnalysis::shared_data() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shared_data_;
}

json TeamAnalysis::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    json findings = json::array();
    for (const auto& finding : findings_) {
        findings.push_back(runtime::to_json(finding));
    }
    json payload;
    payload["request_id"] = request_id_;
    payload["request_summary"] = request_summary_;
    payload["findings"] = findings;
    payload["consensus"] = consensus_.has_value() ? json(*consensus_) : json(nullptr);
    payload["shared_data"] = shared_data_;
    return payload;
}

ExecutionContext ExecutionContext::for_request(const core::config::Settings& settings,
                                               std::string conversation_id,
                                               std::string task_label) {
    ExecutionContext ctx;
    ctx.conversation_id = std::move(conversation_id);
    ctx.task_label = std::move(task_label);
    ctx.tool_timeout = std::chrono::seconds(settings.tool_timeout_seconds);
    ctx.analysis_timeout = std::chrono::seconds(settings.analysis_tool_timeout_seconds);
    ctx.communication_log = std::make_shared<CommunicationLog>();
    ctx.cancel_token = std::make_shared<std::atomic_bool>(false);
    return ctx;
}

ExecutionContext ExecutionContext::derive(std::shared_ptr<ProgressQueue> sink,
                                          std::shared_ptr<std::atomic_bool> cancel) const {
    ExecutionContext child = *this;
    child.progress_sink = std::move(sink);
    child.cancel_token = cancel ? std::move(cancel) : std::make_shared<std::atomic_bool>(false);
    return child;
}

void ExecutionContext::emit_progress(const ProgressKind kind, const std::string& agent,
                                     const std::string& message,
                                     const std::optional<std::string>& target) const {
    if (!progress_sink) {
        return;
    }
    ProgressEvent event;
    event.kind = kind;
    event.agent = agent;
    event.message = message;
    event.target = target;
    progress_sink->push(std::move(event));
}

void ExecutionContext::log_communication(CommunicationEntry entry) const {
    if (entry.message_type == "delegation") {
        emit_progress(ProgressKind::Delegation, entry.from_agent, entry.content,
                      entry.to_agent);
    }
    if (communication_log) {
        communication_log->append(std::move(entry));
    }
}

core::errors::Result<std::shared_ptr<storage::ArtifactStore>>
ExecutionContext::acquire_store() const {
    if (!store_factory) {
        return HearthError{ErrorCategory::Execution,
                           "No artifact store available in this context.",
                           "store_unavailable"};
    }
    auto store = store_factory();
    if (!store) {
        return HearthError{ErrorCategory::Execution, "Artifact store factory returned null.",
                           "store_unavailable"};
    }
    return store;
}

std::chrono::seconds ExecutionContext::timeout_for(const core::config::Settings& settings,
                                                   const std::string& tool_name) const {
    return settings.is_analysis_tool(tool_name) ? analysis_timeout : tool_timeout;
}

}  // namespace hearth::runtime

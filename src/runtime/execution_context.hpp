#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/settings.hpp"
#include "core/errors/hearth_errors.hpp"
#include "protocol/event_contract.hpp"
#include "storage/artifact_store.hpp"

namespace hearth::runtime {

using protocol::ProgressEvent;
using protocol::ProgressKind;

// Unbounded multi-producer queue. Producers never block.
class ProgressQueue {
public:
    void push(ProgressEvent event);
    std::optional<ProgressEvent> try_pop();
    // Waits up to `timeout` for an event.
    std::optional<ProgressEvent> pop_for(std::chrono::milliseconds timeout);
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ProgressEvent> events_;
};

struct CommunicationEntry {
    std::string from_agent;
    std::string to_agent;  // agent role or "team"
    std::string message_type;  // finding, question, cross_reference, synthesis, status
    std::string content;
    nlohmann::json metadata = nlohmann::json::object();
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

// Append-only; safe for concurrent writers.
class CommunicationLog {
public:
    void append(CommunicationEntry entry);
    std::vector<CommunicationEntry> snapshot() const;
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<CommunicationEntry> entries_;
};

nlohmann::json to_json(const CommunicationEntry& entry);

struct SpecialistFinding {
    std::string id;
    std::string specialist;
    std::string finding_type;  // insight, concern, recommendation, data_quality_flag
    std::string title;
    std::string description;
    double confidence = 0.0;
    std::vector<std::string> entities;
    nlohmann::json evidence = nlohmann::json::object();
};

nlohmann::json to_json(const SpecialistFinding& finding);

// Shared state of one multi-specialist analysis. Specialists run
// concurrently and all write through this handle.
class TeamAnalysis {
public:
    TeamAnalysis(std::string request_id, std::string request_summary);

    const std::string& request_id() const { return request_id_; }
    const std::string& request_summary() const { return request_summary_; }

    // Assigns an id when the finding has none; returns it.
    std::string add_finding(SpecialistFinding finding);
    std::vector<SpecialistFinding> findings() const;

    void set_consensus(std::string consensus);
    std::optional<std::string> consensus() const;

    void set_shared(const std::string& key, nlohmann::json value);
    nlohmann::json shared_data() const;

    nlohmann::json to_json() const;

private:
    const std::string request_id_;
    const std::string request_summary_;

    mutable std::mutex mutex_;
    std::vector<SpecialistFinding> findings_;
    std::optional<std::string> consensus_;
    nlohmann::json shared_data_ = nlohmann::json::object();
};

using StoreFactory = std::function<std::shared_ptr<storage::ArtifactStore>()>;

// Per-request bundle handed down every call boundary that needs it. Copies
// are cheap; all mutable state sits behind shared handles. Scoped to one
// top-level request: nothing here is shared with unrelated requests.
struct ExecutionContext {
    std::shared_ptr<ProgressQueue> progress_sink;  // may be null
    StoreFactory store_factory;                    // may be empty
    std::string conversation_id;
    std::string task_label;
    std::chrono::seconds tool_timeout{30};
    std::chrono::seconds analysis_timeout{180};
    std::shared_ptr<CommunicationLog> communication_log;
    std::shared_ptr<TeamAnalysis> team_analysis;  // set by team tools
    std::shared_ptr<std::atomic_bool> cancel_token;

    static ExecutionContext for_request(const core::config::Settings& settings,
                                        std::string conversation_id,
                                        std::string task_label = "");

    // Child context for one nested call: own progress sink and cancel token,
    // shared log/team/store handles. The parent is left untouched.
    ExecutionContext derive(std::shared_ptr<ProgressQueue> sink,
                            std::shared_ptr<std::atomic_bool> cancel = nullptr) const;

    // No-op when there is no sink.
    void emit_progress(ProgressKind kind, const std::string& agent,
                       const std::string& message,
                       const std::optional<std::string>& target = std::nullopt) const;

    // Records a communication and, for delegations, also emits progress.
    void log_communication(CommunicationEntry entry) const;

    core::errors::Result<std::shared_ptr<storage::ArtifactStore>> acquire_store() const;

    bool is_cancelled() const { return cancel_token && cancel_token->load(); }

    std::chrono::seconds timeout_for(const core::config::Settings& settings,
                                     const std::string& tool_name) const;
};

}  // namespace hearth::runtime

#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace hearth::protocol {

    // Progress notifications raised by nested agents while a call is in flight
    enum class ProgressKind {
        AgentStart,
        AgentEnd,
        Status,
        Delegation
    };

    struct ProgressEvent {
        ProgressKind kind = ProgressKind::Status;
        std::string agent;
        std::string message;
        std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
        std::optional<std::string> target;  // delegation target agent
    };

    // Events a turn streams back to its caller
    struct TokenEvent { std::string content; };
    struct ApprovalRequiredEvent {
        std::string tool_call_id;
        std::string tool;
        std::string content;
    };
    struct ToolStartEvent {
        std::string tool_call_id;
        std::string tool;
        std::string agent;
        std::string args_preview;
    };
    struct ToolEndEvent {
        std::string tool_call_id;
        std::string tool;
        std::string result_preview;
        bool success = true;
    };
    struct ProgressStreamEvent { ProgressEvent progress; };

    // The dispatch summary is a return value, never a stream event.
    using StreamEvent = std::variant<
        TokenEvent,
        ApprovalRequiredEvent,
        ToolStartEvent,
        ToolEndEvent,
        ProgressStreamEvent
    >;

    using EventSink = std::function<void(const StreamEvent&)>;

    inline std::string to_string(const ProgressKind kind) {
        switch (kind) {
            case ProgressKind::AgentStart: return "agent_start";
            case ProgressKind::AgentEnd:   return "agent_end";
            case ProgressKind::Status:     return "status";
            case ProgressKind::Delegation: return "delegation";
            default: return "unknown";
        }
    }

    inline double unix_seconds(const std::chrono::system_clock::time_point tp) {
        return std::chrono::duration<double>(tp.time_since_epoch()).count();
    }

    inline nlohmann::json to_json(const ProgressEvent& event) {
        nlohmann::json payload;
        payload["type"] = to_string(event.kind);
        payload["agent"] = event.agent;
        payload["content"] = event.message;
        payload["ts"] = unix_seconds(event.timestamp);
        if (event.target.has_value()) {
            payload["target"] = *event.target;
        }
        return payload;
    }

    inline std::string event_type(const StreamEvent& event) {
        struct Visitor {
            std::string operator()(const TokenEvent&) const { return "token"; }
            std::string operator()(const ApprovalRequiredEvent&) const { return "approval_required"; }
            std::string operator()(const ToolStartEvent&) const { return "tool_start"; }
            std::string operator()(const ToolEndEvent&) const { return "tool_end"; }
            std::string operator()(const ProgressStreamEvent& e) const { return to_string(e.progress.kind); }
        };
        return std::visit(Visitor{}, event);
    }

    // One JSON object per event, as written to the SSE/JSONL surface
    inline nlohmann::json to_json(const StreamEvent& event) {
        struct Visitor {
            nlohmann::json operator()(const TokenEvent& e) const {
                return {{"type", "token"}, {"content", e.content}};
            }
            nlohmann::json operator()(const ApprovalRequiredEvent& e) const {
                return {{"type", "approval_required"},
                        {"tool_call_id", e.tool_call_id},
                        {"tool", e.tool},
                        {"content", e.content}};
            }
            nlohmann::json operator()(const ToolStartEvent& e) const {
                return {{"type", "tool_start"},
                        {"tool_call_id", e.tool_call_id},
                        {"tool", e.tool},
                        {"agent", e.agent},
                        {"args", e.args_preview}};
            }
            nlohmann::json operator()(const ToolEndEvent& e) const {
                return {{"type", "tool_end"},
                        {"tool_call_id", e.tool_call_id},
                        {"tool", e.tool},
                        {"result", e.result_preview},
                        {"success", e.success}};
            }
            nlohmann::json operator()(const ProgressStreamEvent& e) const {
                return to_json(e.progress);
            }
        };
        return std::visit(Visitor{}, event);
    }

} // namespace hearth::protocol

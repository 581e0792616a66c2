#include "tools/tool_registry.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace hearth::tools {

using core::errors::ErrorCategory;
using core::errors::HearthError;

const std::set<std::string>& ToolRegistry::default_read_only_tools() {
    static const std::set<std::string> kReadOnly = {
        // Entity queries
        "get_entity_state",
        "list_entities_by_domain",
        "search_entities",
        "get_domain_summary",
        "list_automations",
        "get_automation_config",
        "get_script_config",
        "render_template",
        "get_ha_logs",
        "check_ha_config",
        "discover_entities",
        // Analysis and delegation
        "consult_data_science_team",
        "consult_dashboard_designer",
        "run_custom_analysis",
        "analyze_energy",
        "diagnose_issue",
        "create_insight_schedule",
        // Creating a proposal is the approval mechanism itself
        "seek_approval",
        "review_config",
    };
    return kReadOnly;
}

ToolRegistry::ToolRegistry(std::set<std::string> read_only_tools)
    : read_only_tools_(std::move(read_only_tools)) {}

core::errors::Result<bool> ToolRegistry::add(std::shared_ptr<Tool> tool) {
    if (!tool) {
        return HearthError{ErrorCategory::Internal, "Cannot register a null tool.",
                           "invalid_tool"};
    }
    const std::string name = tool->name();
    if (name.empty()) {
        return HearthError{ErrorCategory::Internal, "Tool name cannot be empty.",
                           "invalid_tool"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (tools_.find(name) != tools_.end()) {
        return HearthError{ErrorCategory::Internal, "Tool already registered: " + name,
                           "duplicate_tool"};
    }
    tools_.emplace(name, std::move(tool));
    HEARTH_LOG_DEBUG("ToolRegistry: registered " + name +
                     (read_only_tools_.count(name) != 0 ? " (read-only)" : " (mutating)"));
    return true;
}

std::shared_ptr<Tool> ToolRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = tools_.find(name);
    return it == tools_.end() ? nullptr : it->second;
}

bool ToolRegistry::is_mutating(const std::string& name) const {
    return read_only_tools_.find(name) == read_only_tools_.end();
}

void ToolRegistry::set_enabled_check(EnabledCheck check) {
    std::lock_guard<std::mutex> lock(mutex_);
    enabled_check_ = std::move(check);
}

bool ToolRegistry::is_enabled(const std::string& name) const {
    EnabledCheck check;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        check = enabled_check_;
    }
    return !check || check(name);
}

std::vector<std::string> ToolRegistry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& entry : tools_) {
        names.push_back(entry.first);
    }
    return names;
}

}  // namespace hearth::tools

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "core/errors/hearth_errors.hpp"
#include "tools/tool.hpp"

namespace hearth::tools {

class ToolRegistry {
public:
    using EnabledCheck = std::function<bool(const std::string& tool_name)>;

    // Tools allowed to run without human approval.
    static const std::set<std::string>& default_read_only_tools();

    explicit ToolRegistry(std::set<std::string> read_only_tools = default_read_only_tools());

    core::errors::Result<bool> add(std::shared_ptr<Tool> tool);

    // Null when no tool has that name.
    std::shared_ptr<Tool> find(const std::string& name) const;

    // Anything not on the read-only list needs approval, including names
    // that are not registered at all.
    bool is_mutating(const std::string& name) const;

    void set_enabled_check(EnabledCheck check);
    bool is_enabled(const std::string& name) const;

    std::vector<std::string> names() const;

private:
    const std::set<std::string> read_only_tools_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Tool>> tools_;
    EnabledCheck enabled_check_;
};

}  // namespace hearth::tools

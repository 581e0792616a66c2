#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/hearth_errors.hpp"
#include "runtime/execution_context.hpp"
#include "sandbox/sandbox_runner.hpp"
#include "tools/tool.hpp"
#include "tools/tool_registry.hpp"

namespace hearth::tools {

// Entity snapshot keyed by entity id. Accepts either an object keyed by id
// or an array of {"entity_id", "state", "attributes"} records.
core::errors::Result<nlohmann::json> normalize_entity_states(const nlohmann::json& raw);
core::errors::Result<nlohmann::json> load_entity_states(const std::filesystem::path& path);

class GetEntityStateTool : public Tool {
public:
    explicit GetEntityStateTool(nlohmann::json states);

    std::string name() const override { return "get_entity_state"; }
    std::string description() const override {
        return "Get the current state and attributes of one entity.";
    }

    core::errors::Result<std::string> invoke(const nlohmann::json& args,
                                             const runtime::ExecutionContext& ctx) override;

private:
    const nlohmann::json states_;
};

struct Proposal {
    std::string id;
    std::string action_type;
    std::string name;
    std::string description;
    nlohmann::json details = nlohmann::json::object();
};

// Records a proposal for human review. Nothing is executed here.
class SeekApprovalTool : public Tool {
public:
    std::string name() const override { return "seek_approval"; }
    std::string description() const override {
        return "Submit an automation, script or action for user approval.";
    }

    core::errors::Result<std::string> invoke(const nlohmann::json& args,
                                             const runtime::ExecutionContext& ctx) override;

    std::vector<Proposal> proposals() const;

private:
    mutable std::mutex mutex_;
    std::vector<Proposal> proposals_;
};

// Runs a generated script in the sandbox, persists whatever artifacts pass
// egress validation and reports back. A failed script is reported as an
// "analysis failed: <reason>" finding, not as a tool fault.
class RunCustomAnalysisTool : public Tool {
public:
    explicit RunCustomAnalysisTool(std::shared_ptr<sandbox::SandboxRunner> runner,
                                   std::string default_policy = "analysis");

    std::string name() const override { return "run_custom_analysis"; }
    std::string description() const override {
        return "Run a Python analysis script in the sandbox.";
    }

    core::errors::Result<std::string> invoke(const nlohmann::json& args,
                                             const runtime::ExecutionContext& ctx) override;

private:
    std::shared_ptr<sandbox::SandboxRunner> runner_;
    std::string default_policy_;
};

using SpecialistFn = std::function<core::errors::Result<std::vector<runtime::SpecialistFinding>>(
    const nlohmann::json& args, const runtime::ExecutionContext& ctx)>;

struct Specialist {
    std::string role;
    SpecialistFn analyze;
};

// Fans a question out to every specialist at once. Each one reports
// progress on its own queue; the queues are muxed into the caller's sink.
class ConsultDataScienceTeamTool : public Tool {
public:
    explicit ConsultDataScienceTeamTool(std::vector<Specialist> specialists);

    std::string name() const override { return "consult_data_science_team"; }
    std::string description() const override {
        return "Ask the data science specialists to analyze the home together.";
    }

    core::errors::Result<std::string> invoke(const nlohmann::json& args,
                                             const runtime::ExecutionContext& ctx) override;

private:
    std::vector<Specialist> specialists_;
};

// energy_analyst, behavioral_analyst and diagnostic_analyst, each reading
// the same entity snapshot.
std::vector<Specialist> snapshot_specialists(nlohmann::json states);

core::errors::Result<bool> register_builtin_tools(ToolRegistry& registry,
                                                  std::shared_ptr<sandbox::SandboxRunner> runner,
                                                  const nlohmann::json& states);

}  // namespace hearth::tools

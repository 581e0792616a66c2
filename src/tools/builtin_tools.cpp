#include "tools/builtin_tools.hpp"

#include <atomic>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iomanip>
#include <set>
#include <sstream>
#include <thread>
#include <utility>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"
#include "policy/policy_guard.hpp"
#include "runtime/progress_muxer.hpp"
#include "sandbox/sandbox_policy.hpp"

namespace hearth::tools {

using core::errors::ErrorCategory;
using core::errors::HearthError;
using core::errors::Result;
using nlohmann::json;
using runtime::CommunicationEntry;
using runtime::ProgressKind;
using runtime::SpecialistFinding;

namespace {

constexpr const char* kDataScientist = "data_scientist";
constexpr const char* kTeamAgent = "data_science_team";
constexpr std::size_t kMaxStdoutInResult = 4000;

std::string string_arg(const json& args, const char* key, const std::string& fallback) {
    const auto it = args.find(key);
    return (it != args.end() && it->is_string()) ? it->get<std::string>() : fallback;
}

HearthError missing_arg(const std::string& tool, const std::string& key) {
    return HearthError{ErrorCategory::Validation, tool + ": '" + key + "' is required",
                       "missing_argument"};
}

std::string tail(const std::string& text, std::size_t max_bytes) {
    return text.size() <= max_bytes ? text : text.substr(text.size() - max_bytes);
}

std::string last_line(const std::string& text) {
    const auto end = text.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) {
        return "";
    }
    const auto start = text.find_last_of('\n', end);
    return text.substr(start == std::string::npos ? 0 : start + 1,
                       end - (start == std::string::npos ? 0 : start + 1) + 1);
}

std::string failure_reason(const sandbox::SandboxResult& result) {
    if (result.timed_out) {
        return "execution timed out";
    }
    if (result.cancelled) {
        return "execution cancelled";
    }
    std::string reason = last_line(result.stderr_text);
    return reason.empty() ? "exit code " + std::to_string(result.exit_code) : reason;
}

std::string report_id_for(const runtime::ExecutionContext& ctx) {
    policy::PolicyGuard guard;
    auto checked = guard.validate_identifier(ctx.conversation_id, "report id");
    if (!ctx.conversation_id.empty() && !core::errors::is_error(checked)) {
        return core::errors::get_value(checked);
    }
    return core::config::generate_id("report");
}

std::string entity_state(const json& entity) {
    const auto it = entity.find("state");
    if (it == entity.end()) {
        return "";
    }
    return it->is_string() ? it->get<std::string>() : it->dump();
}

json entity_attributes(const json& entity) {
    const auto it = entity.find("attributes");
    return (it != entity.end() && it->is_object()) ? *it : json::object();
}

std::string entity_domain(const std::string& entity_id) {
    const auto dot = entity_id.find('.');
    return dot == std::string::npos ? "" : entity_id.substr(0, dot);
}

SpecialistFinding make_finding(const std::string& type, std::string title,
                               std::string description, double confidence,
                               std::vector<std::string> entities = {}) {
    SpecialistFinding finding;
    finding.finding_type = type;
    finding.title = std::move(title);
    finding.description = std::move(description);
    finding.confidence = confidence;
    finding.entities = std::move(entities);
    return finding;
}

void run_specialist(const Specialist& specialist, const json& args,
                    const runtime::ExecutionContext& ctx, runtime::TeamAnalysis& team) {
    ctx.emit_progress(ProgressKind::AgentStart, specialist.role,
                      "Analyzing: " + team.request_summary());

    Result<std::vector<SpecialistFinding>> outcome = std::vector<SpecialistFinding>{};
    try {
        outcome = specialist.analyze(args, ctx);
    } catch (const std::exception& e) {
        outcome = HearthError{ErrorCategory::Execution, e.what(), "specialist_exception"};
    }

    std::vector<SpecialistFinding> findings;
    if (core::errors::is_error(outcome)) {
        const auto& error = core::errors::get_error(outcome);
        HEARTH_LOG_WARN(specialist.role + " failed: " + error.message);
        findings.push_back(make_finding("data_quality_flag", "analysis failed: " + error.message,
                                        error.hint, 0.0));
    } else {
        findings = std::move(core::errors::get_value(outcome));
    }

    for (auto& finding : findings) {
        if (finding.specialist.empty()) {
            finding.specialist = specialist.role;
        }
        const std::string title = finding.title;
        const std::string finding_id = team.add_finding(std::move(finding));
        CommunicationEntry entry;
        entry.from_agent = specialist.role;
        entry.to_agent = "team";
        entry.message_type = "finding";
        entry.content = title;
        entry.metadata = {{"finding_id", finding_id}};
        ctx.log_communication(std::move(entry));
    }

    ctx.emit_progress(ProgressKind::AgentEnd, specialist.role,
                      std::to_string(findings.size()) + " finding(s)");
}

}  // namespace

Result<json> normalize_entity_states(const json& raw) {
    json states = json::object();
    if (raw.is_null()) {
        return states;
    }
    if (raw.is_object()) {
        for (auto it = raw.begin(); it != raw.end(); ++it) {
            if (!it->is_object()) {
                return HearthError{ErrorCategory::Validation,
                                   "Entity '" + it.key() + "' is not an object.",
                                   "invalid_entity_states"};
            }
            json entity = *it;
            entity["entity_id"] = it.key();
            states[it.key()] = std::move(entity);
        }
        return states;
    }
    if (raw.is_array()) {
        for (const auto& entity : raw) {
            const auto id = entity.is_object() ? entity.find("entity_id") : entity.end();
            if (!entity.is_object() || id == entity.end() || !id->is_string()) {
                return HearthError{ErrorCategory::Validation,
                                   "Every entity record needs a string entity_id.",
                                   "invalid_entity_states"};
            }
            states[id->get<std::string>()] = entity;
        }
        return states;
    }
    return HearthError{ErrorCategory::Validation,
                       "Entity states must be an object or an array.",
                       "invalid_entity_states"};
}

Result<json> load_entity_states(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return HearthError{ErrorCategory::Input,
                           "Cannot open entity states file: " + path.string(),
                           "entity_states_unreadable"};
    }
    json raw = json::parse(file, nullptr, false);
    if (raw.is_discarded()) {
        return HearthError{ErrorCategory::Validation,
                           "Entity states file is not valid JSON: " + path.string(),
                           "invalid_entity_states"};
    }
    return normalize_entity_states(raw);
}

GetEntityStateTool::GetEntityStateTool(json states) : states_(std::move(states)) {}

Result<std::string> GetEntityStateTool::invoke(const json& args,
                                               const runtime::ExecutionContext& ctx) {
    (void)ctx;
    const std::string entity_id = string_arg(args, "entity_id", "");
    if (entity_id.empty()) {
        return missing_arg(name(), "entity_id");
    }
    const auto it = states_.find(entity_id);
    if (it == states_.end()) {
        return HearthError{ErrorCategory::Input, "Entity " + entity_id + " not found",
                           "entity_not_found"};
    }
    return it->dump(-1, ' ', false, json::error_handler_t::replace);
}

Result<std::string> SeekApprovalTool::invoke(const json& args,
                                             const runtime::ExecutionContext& ctx) {
    Proposal proposal;
    proposal.name = string_arg(args, "name", "");
    proposal.description = string_arg(args, "description", "");
    if (proposal.name.empty()) {
        return missing_arg(name(), "name");
    }
    if (proposal.description.empty()) {
        return missing_arg(name(), "description");
    }
    proposal.action_type = string_arg(args, "action_type", "automation");
    for (auto it = args.begin(); it != args.end(); ++it) {
        if (it.key() != "name" && it.key() != "description" && it.key() != "action_type") {
            proposal.details[it.key()] = *it;
        }
    }
    proposal.id = core::config::generate_id("prop");

    const std::string text = "Proposal '" + proposal.name + "' (" + proposal.action_type +
                             ") submitted for approval (id: " + proposal.id + ").";
    ctx.emit_progress(ProgressKind::Status, "architect", "Submitted proposal " + proposal.id);
    HEARTH_LOG_INFO(text);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        proposals_.push_back(std::move(proposal));
    }
    return text;
}

std::vector<Proposal> SeekApprovalTool::proposals() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return proposals_;
}

RunCustomAnalysisTool::RunCustomAnalysisTool(std::shared_ptr<sandbox::SandboxRunner> runner,
                                             std::string default_policy)
    : runner_(std::move(runner)), default_policy_(std::move(default_policy)) {}

Result<std::string> RunCustomAnalysisTool::invoke(const json& args,
                                                  const runtime::ExecutionContext& ctx) {
    const std::string script = string_arg(args, "script", "");
    if (script.empty()) {
        return missing_arg(name(), "script");
    }
    if (!runner_) {
        return HearthError{ErrorCategory::Internal, "No sandbox runner configured.",
                           "runner_unavailable"};
    }
    const std::string description = string_arg(args, "description", "custom analysis");

    sandbox::PolicyOverrides overrides;
    overrides.artifacts_enabled = true;
    auto policy = sandbox::make_policy(string_arg(args, "policy", default_policy_), overrides);
    if (core::errors::is_error(policy)) {
        return core::errors::get_error(policy);
    }

    ctx.emit_progress(ProgressKind::AgentStart, kDataScientist, "Running " + description);

    std::shared_ptr<sandbox::ScratchDirectory> input;
    std::optional<std::filesystem::path> data_path;
    const auto data = args.find("data");
    if (data != args.end() && !data->is_null()) {
        auto scratch = sandbox::ScratchDirectory::create("hearth-input-");
        if (core::errors::is_error(scratch)) {
            return core::errors::get_error(scratch);
        }
        input = core::errors::get_value(scratch);
        data_path = input->path() / "data.json";
        std::ofstream out(*data_path);
        out << data->dump(-1, ' ', false, json::error_handler_t::replace);
        if (!out) {
            return HearthError{ErrorCategory::Internal, "Failed to write analysis input data.",
                               "io_error"};
        }
    }

    auto run = runner_->run(script, core::errors::get_value(policy), data_path, {},
                            ctx.cancel_token);
    if (core::errors::is_error(run)) {
        ctx.emit_progress(ProgressKind::AgentEnd, kDataScientist, "Sandbox unavailable");
        return core::errors::get_error(run);
    }
    const sandbox::SandboxResult& result = core::errors::get_value(run);

    if (!result.success) {
        const std::string title = "analysis failed: " + failure_reason(result);
        if (ctx.team_analysis) {
            SpecialistFinding finding = make_finding("data_quality_flag", title,
                                                     tail(result.stderr_text, 1000), 0.0);
            finding.specialist = kDataScientist;
            finding.evidence = {{"exit_code", result.exit_code},
                                {"timed_out", result.timed_out},
                                {"policy", result.policy_name}};
            ctx.team_analysis->add_finding(std::move(finding));
        }
        ctx.emit_progress(ProgressKind::AgentEnd, kDataScientist, title);
        return title;
    }

    json artifact_names = json::array();
    std::string report_id;
    if (!result.artifacts.empty()) {
        auto store = ctx.acquire_store();
        if (core::errors::is_error(store)) {
            HEARTH_LOG_WARN("Artifacts not persisted: " +
                            core::errors::get_error(store).message);
        } else {
            report_id = report_id_for(ctx);
            for (const auto& artifact : result.artifacts) {
                auto stored = core::errors::get_value(store)->persist(report_id, artifact);
                if (core::errors::is_error(stored)) {
                    HEARTH_LOG_WARN("Skipping artifact " + artifact.filename + ": " +
                                    core::errors::get_error(stored).message);
                    continue;
                }
                artifact_names.push_back(artifact.filename);
            }
        }
    }

    if (ctx.team_analysis) {
        SpecialistFinding finding = make_finding("insight", description,
                                                 tail(result.stdout_text, 1000), 0.8);
        finding.specialist = kDataScientist;
        finding.evidence = {{"artifacts", artifact_names}};
        ctx.team_analysis->add_finding(std::move(finding));
    }

    json payload;
    payload["success"] = true;
    payload["exit_code"] = result.exit_code;
    payload["stdout"] = result.stdout_text.substr(0, kMaxStdoutInResult);
    payload["duration_seconds"] = result.duration_seconds;
    payload["policy"] = result.policy_name;
    payload["artifacts"] = artifact_names;
    payload["artifacts_rejected"] = result.artifacts_rejected;
    if (!report_id.empty()) {
        payload["report_id"] = report_id;
    }

    ctx.emit_progress(ProgressKind::AgentEnd, kDataScientist, "Analysis complete");
    return payload.dump(-1, ' ', false, json::error_handler_t::replace);
}

ConsultDataScienceTeamTool::ConsultDataScienceTeamTool(std::vector<Specialist> specialists)
    : specialists_(std::move(specialists)) {}

Result<std::string> ConsultDataScienceTeamTool::invoke(const json& args,
                                                       const runtime::ExecutionContext& ctx) {
    const std::string query = string_arg(args, "query", "");
    if (query.empty()) {
        return missing_arg(name(), "query");
    }

    auto team = std::make_shared<runtime::TeamAnalysis>(core::config::generate_id("analysis"),
                                                        query);
    runtime::ExecutionContext team_ctx = ctx;
    team_ctx.team_analysis = team;

    ctx.emit_progress(ProgressKind::AgentStart, kTeamAgent,
                      "Consulting " + std::to_string(specialists_.size()) + " specialists");

    std::vector<std::shared_ptr<runtime::ProgressQueue>> queues;
    std::vector<runtime::ExecutionContext> children;
    for (const auto& specialist : specialists_) {
        CommunicationEntry delegation;
        delegation.from_agent = kTeamAgent;
        delegation.to_agent = specialist.role;
        delegation.message_type = "delegation";
        delegation.content = query;
        team_ctx.log_communication(std::move(delegation));

        auto queue = std::make_shared<runtime::ProgressQueue>();
        queues.push_back(queue);
        children.push_back(team_ctx.derive(queue, ctx.cancel_token));
    }

    std::atomic<std::size_t> finished{0};
    std::vector<std::thread> workers;
    workers.reserve(specialists_.size());
    for (std::size_t i = 0; i < specialists_.size(); ++i) {
        workers.emplace_back([&, i]() {
            run_specialist(specialists_[i], args, children[i], *team);
            finished.fetch_add(1);
        });
    }

    runtime::ProgressMuxer muxer;
    muxer.run(
        queues, [&]() { return finished.load() == specialists_.size(); },
        [&ctx](std::size_t, const runtime::ProgressEvent& event) {
            if (ctx.progress_sink) {
                ctx.progress_sink->push(event);
            }
        });
    for (auto& worker : workers) {
        worker.join();
    }

    const auto findings = team->findings();
    std::size_t concerns = 0;
    for (const auto& finding : findings) {
        if (finding.finding_type == "concern" || finding.finding_type == "data_quality_flag") {
            ++concerns;
        }
    }
    const std::string consensus = std::to_string(findings.size()) + " findings from " +
                                  std::to_string(specialists_.size()) + " specialists, " +
                                  std::to_string(concerns) + " needing attention";
    team->set_consensus(consensus);

    CommunicationEntry synthesis;
    synthesis.from_agent = kTeamAgent;
    synthesis.to_agent = "team";
    synthesis.message_type = "synthesis";
    synthesis.content = consensus;
    team_ctx.log_communication(std::move(synthesis));
    ctx.emit_progress(ProgressKind::AgentEnd, kTeamAgent, consensus);

    if (ctx.is_cancelled()) {
        return HearthError{ErrorCategory::Execution, "Team analysis cancelled", "cancelled"};
    }

    std::ostringstream out;
    out << "Team analysis " << team->request_id() << ": " << consensus << "\n";
    for (const auto& finding : findings) {
        out << "- [" << finding.specialist << "] " << finding.title << " (confidence "
            << std::fixed << std::setprecision(2) << finding.confidence << ")\n";
    }
    return out.str();
}

std::vector<Specialist> snapshot_specialists(json states) {
    auto snapshot = std::make_shared<const json>(std::move(states));

    Specialist energy{"energy_analyst", [snapshot](const json&, const runtime::ExecutionContext& ctx)
                                            -> Result<std::vector<SpecialistFinding>> {
        static const std::set<std::string> kUnits = {"W", "kW", "Wh", "kWh"};
        std::vector<std::string> sensors;
        double power_w = 0.0;
        for (const auto& entity : *snapshot) {
            const json attributes = entity_attributes(entity);
            const std::string unit = string_arg(attributes, "unit_of_measurement", "");
            if (kUnits.count(unit) == 0) {
                continue;
            }
            sensors.push_back(entity.value("entity_id", ""));
            const std::string state = entity_state(entity);
            char* end = nullptr;
            const double value = std::strtod(state.c_str(), &end);
            if (end == state.c_str() || *end != '\0') {
                continue;
            }
            if (unit == "W") {
                power_w += value;
            } else if (unit == "kW") {
                power_w += value * 1000.0;
            }
        }
        ctx.emit_progress(ProgressKind::Status, "energy_analyst",
                          "Found " + std::to_string(sensors.size()) + " energy sensors");

        if (sensors.empty()) {
            return std::vector<SpecialistFinding>{make_finding(
                "data_quality_flag", "No energy sensors found",
                "No entity reports a power or energy unit.", 0.9)};
        }
        std::ostringstream description;
        description << "Current draw across power sensors: " << std::fixed
                    << std::setprecision(1) << power_w << " W";
        SpecialistFinding finding =
            make_finding("insight", std::to_string(sensors.size()) + " energy sensors reporting",
                         description.str(), 0.8, sensors);
        finding.evidence = {{"power_w", power_w}};
        return std::vector<SpecialistFinding>{std::move(finding)};
    }};

    Specialist behavioral{"behavioral_analyst", [snapshot](const json&,
                                                           const runtime::ExecutionContext& ctx)
                                                    -> Result<std::vector<SpecialistFinding>> {
        static const std::set<std::string> kDomains = {"light", "switch", "fan", "media_player"};
        std::vector<std::string> active;
        for (const auto& entity : *snapshot) {
            const std::string id = entity.value("entity_id", "");
            const std::string state = entity_state(entity);
            if (kDomains.count(entity_domain(id)) != 0 && (state == "on" || state == "playing")) {
                active.push_back(id);
            }
        }
        ctx.emit_progress(ProgressKind::Status, "behavioral_analyst",
                          "Checked " + std::to_string(snapshot->size()) + " entities for activity");
        const std::string title = active.empty()
                                      ? "No devices currently active"
                                      : std::to_string(active.size()) + " devices currently active";
        return std::vector<SpecialistFinding>{
            make_finding("insight", title, "Lights, switches, fans and players that are on.",
                         0.7, active)};
    }};

    Specialist diagnostic{"diagnostic_analyst", [snapshot](const json&,
                                                           const runtime::ExecutionContext& ctx)
                                                    -> Result<std::vector<SpecialistFinding>> {
        std::vector<std::string> unavailable;
        for (const auto& entity : *snapshot) {
            const std::string state = entity_state(entity);
            if (state == "unavailable" || state == "unknown") {
                unavailable.push_back(entity.value("entity_id", ""));
            }
        }
        ctx.emit_progress(ProgressKind::Status, "diagnostic_analyst",
                          std::to_string(unavailable.size()) + " entities not reporting");
        if (unavailable.empty()) {
            return std::vector<SpecialistFinding>{make_finding(
                "insight", "All " + std::to_string(snapshot->size()) + " entities reporting",
                "No entity is unavailable or unknown.", 0.9)};
        }
        return std::vector<SpecialistFinding>{make_finding(
            "concern", std::to_string(unavailable.size()) + " entities unavailable",
            "These entities report unavailable or unknown and may be offline.", 0.9,
            unavailable)};
    }};

    return {std::move(energy), std::move(behavioral), std::move(diagnostic)};
}

Result<bool> register_builtin_tools(ToolRegistry& registry,
                                    std::shared_ptr<sandbox::SandboxRunner> runner,
                                    const json& states) {
    auto normalized = normalize_entity_states(states);
    if (core::errors::is_error(normalized)) {
        return core::errors::get_error(normalized);
    }
    const json& snapshot = core::errors::get_value(normalized);

    const std::vector<std::shared_ptr<Tool>> tools = {
        std::make_shared<GetEntityStateTool>(snapshot),
        std::make_shared<SeekApprovalTool>(),
        std::make_shared<RunCustomAnalysisTool>(std::move(runner)),
        std::make_shared<ConsultDataScienceTeamTool>(snapshot_specialists(snapshot)),
    };
    for (const auto& tool : tools) {
        auto added = registry.add(tool);
        if (core::errors::is_error(added)) {
            return core::errors::get_error(added);
        }
    }
    return true;
}

}  // namespace hearth::tools

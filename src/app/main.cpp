#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "core/config/ids.hpp"
#include "core/config/settings.hpp"
#include "core/errors/hearth_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/event_contract.hpp"
#include "runtime/execution_context.hpp"
#include "runtime/turn_runner.hpp"
#include "sandbox/sandbox_policy.hpp"
#include "sandbox/sandbox_runner.hpp"
#include "session/request_manager.hpp"
#include "session/signal_cancellation.hpp"
#include "storage/artifact_store.hpp"
#include "streaming/stream_consumer.hpp"
#include "tools/builtin_tools.hpp"
#include "tools/tool_registry.hpp"

namespace {

using hearth::core::errors::ErrorCategory;
using hearth::core::errors::HearthError;
using hearth::core::errors::get_error;
using hearth::core::errors::get_value;
using hearth::core::errors::is_error;
using nlohmann::json;

constexpr int kExitFailure = 1;
constexpr int kExitInput = 2;
constexpr int kExitConfiguration = 3;
constexpr int kExitRunFailed = 4;
constexpr int kExitRuntimeUnhealthy = 5;
constexpr int kExitArtifacts = 6;
constexpr int kExitCancelled = 130;

int report(const std::string& what, const HearthError& err) {
    HEARTH_LOG_ERROR(what + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        HEARTH_LOG_INFO("Hint: " + err.hint);
    }
    switch (err.category) {
        case ErrorCategory::Input:
        case ErrorCategory::Validation:
        case ErrorCategory::Security:
            return kExitInput;
        case ErrorCategory::Configuration:
            return kExitConfiguration;
        default:
            return kExitFailure;
    }
}

void print_json(const json& payload, const int indent = -1) {
    std::cout << payload.dump(indent, ' ', false, json::error_handler_t::replace) << std::endl;
}

hearth::core::errors::Result<hearth::sandbox::SandboxPolicy> resolve_policy(
    const hearth::app::cli::CliRequest& req) {
    hearth::sandbox::PolicyOverrides overrides;
    overrides.timeout_seconds = req.timeout_seconds;
    overrides.artifacts_enabled = true;
    return hearth::sandbox::make_policy(req.policy_name, overrides);
}

void finish_request(hearth::session::RequestManager& requests, const std::string& request_id,
                    const std::optional<std::string>& failure = std::nullopt) {
    const auto state = requests.get_state(request_id);
    if (!is_error(state) && get_value(state) == hearth::session::RequestState::Cancelled) {
        return;
    }
    auto moved = failure ? requests.mark_failed(request_id, *failure)
                         : requests.mark_completed(request_id);
    if (is_error(moved)) {
        HEARTH_LOG_ERROR("Failed to record request outcome [" + get_error(moved).code + "]: " +
                         get_error(moved).message);
    }
}

int run_policy_args(const hearth::app::cli::CliRequest& req) {
    auto policy = resolve_policy(req);
    if (is_error(policy)) {
        return report("Invalid policy", get_error(policy));
    }
    json payload;
    payload["policy"] = hearth::sandbox::to_json(get_value(policy));
    payload["args"] = hearth::sandbox::to_runtime_args(get_value(policy));
    print_json(payload, 2);
    return 0;
}

int run_check_runtime(const hearth::core::config::Settings& settings) {
    hearth::sandbox::SandboxRunner runner(settings);
    const auto status = runner.check_runtime();
    print_json(hearth::sandbox::to_json(status), 2);
    for (const auto& problem : status.errors) {
        HEARTH_LOG_WARN("Runtime check: " + problem);
    }
    return status.cli_available && status.image_available ? 0 : kExitRuntimeUnhealthy;
}

int run_script(const hearth::app::cli::CliRequest& req,
               const hearth::core::config::Settings& settings,
               hearth::session::RequestManager& requests, const std::string& request_id) {
    std::ifstream file(*req.script_file);
    if (!file) {
        finish_request(requests, request_id, "unreadable script");
        return report("Failed to read script",
                      HearthError{ErrorCategory::Input, "Cannot read " + req.script_file->string(),
                                  "invalid_path"});
    }
    std::stringstream script;
    script << file.rdbuf();

    auto policy = resolve_policy(req);
    if (is_error(policy)) {
        finish_request(requests, request_id, get_error(policy).message);
        return report("Invalid policy", get_error(policy));
    }

    auto cancel_token = requests.get_cancel_token(request_id);
    if (is_error(cancel_token)) {
        return report("Failed to get cancellation token", get_error(cancel_token));
    }

    hearth::sandbox::SandboxRunner runner(settings);
    auto run = runner.run(script.str(), get_value(policy), req.data_file, {},
                          get_value(cancel_token));
    if (is_error(run)) {
        finish_request(requests, request_id, get_error(run).message);
        return report("Sandbox refused to run", get_error(run));
    }
    const auto& result = get_value(run);

    json payload = hearth::sandbox::to_json(result);
    int exit_code = result.success ? 0 : kExitRunFailed;

    if (!result.artifacts.empty()) {
        const std::string report_id = req.report_id.value_or(hearth::core::config::generate_id("report"));
        hearth::storage::ArtifactStore store(settings.artifact_dir);
        json stored = json::array();
        for (const auto& artifact : result.artifacts) {
            auto persisted = store.persist(report_id, artifact);
            if (is_error(persisted)) {
                report("Failed to persist " + artifact.filename, get_error(persisted));
                exit_code = kExitArtifacts;
                continue;
            }
            stored.push_back(get_value(persisted).string());
        }
        payload["report_id"] = report_id;
        payload["stored_artifacts"] = stored;
    }
    print_json(payload, 2);

    if (result.success) {
        finish_request(requests, request_id);
    } else {
        finish_request(requests, request_id, result.stderr_text);
    }
    return exit_code;
}

int run_replay(const hearth::app::cli::CliRequest& req,
               const hearth::core::config::Settings& settings,
               hearth::session::RequestManager& requests, const std::string& request_id) {
    json states = json::object();
    if (req.states_file) {
        auto loaded = hearth::tools::load_entity_states(*req.states_file);
        if (is_error(loaded)) {
            finish_request(requests, request_id, get_error(loaded).message);
            return report("Failed to load entity states", get_error(loaded));
        }
        states = get_value(loaded);
    }

    auto registry = std::make_shared<hearth::tools::ToolRegistry>();
    auto runner = std::make_shared<hearth::sandbox::SandboxRunner>(settings);
    auto registered = hearth::tools::register_builtin_tools(*registry, runner, states);
    if (is_error(registered)) {
        finish_request(requests, request_id, get_error(registered).message);
        return report("Failed to register tools", get_error(registered));
    }

    auto ctx = hearth::runtime::ExecutionContext::for_request(settings, req.conversation_id, "replay");
    auto cancel_token = requests.get_cancel_token(request_id);
    if (is_error(cancel_token)) {
        return report("Failed to get cancellation token", get_error(cancel_token));
    }
    ctx.cancel_token = get_value(cancel_token);
    const auto artifact_dir = settings.artifact_dir;
    ctx.store_factory = [artifact_dir]() {
        return std::make_shared<hearth::storage::ArtifactStore>(artifact_dir);
    };

    std::ifstream stream_file(*req.stream_file);
    if (!stream_file) {
        finish_request(requests, request_id, "unreadable stream");
        return report("Failed to open stream",
                      HearthError{ErrorCategory::Input, "Cannot read " + req.stream_file->string(),
                                  "invalid_path"});
    }
    hearth::streaming::JsonLinesFragmentSource source(stream_file);

    hearth::runtime::TurnRunner turn(registry, settings);
    auto outcome = turn.run_turn(source, ctx, [](const hearth::protocol::StreamEvent& event) {
        print_json(hearth::protocol::to_json(event));
    }, req.parallel);
    if (is_error(outcome)) {
        finish_request(requests, request_id, get_error(outcome).message);
        const int code = report("Turn failed", get_error(outcome));
        return code == kExitFailure ? kExitRunFailed : code;
    }

    const auto& turn_outcome = get_value(outcome);
    HEARTH_LOG_INFO("Turn complete: " + std::to_string(turn_outcome.dispatch.full_tool_calls.size()) +
                    " tool call(s), " + std::to_string(turn_outcome.dispatch.approval_summaries.size()) +
                    " proposal(s), " + std::to_string(ctx.communication_log->size()) +
                    " agent message(s)");
    finish_request(requests, request_id);
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Tag bootstrap log lines until a request id exists
    hearth::core::logging::Logger::get().set_request_id(hearth::core::config::generate_id("boot"));
    if (const char* level_text = std::getenv("HEARTH_LOG_LEVEL")) {
        hearth::core::logging::LogLevel level;
        if (hearth::core::logging::Logger::parse_level(level_text, level)) {
            hearth::core::logging::Logger::get().set_level(level);
        } else {
            HEARTH_LOG_WARN(std::string("Ignoring unknown HEARTH_LOG_LEVEL: ") + level_text);
        }
    }

    // 2. Parse CLI input and return normalized input errors
    auto parsed = hearth::app::cli::parse_and_validate(argc, argv);
    if (is_error(parsed)) {
        report("Input error", get_error(parsed));
        return kExitInput;
    }
    const auto& req = get_value(parsed);
    if (req.verbose) {
        hearth::core::logging::Logger::get().set_level(hearth::core::logging::LogLevel::DEBUG);
    }

    // 3. Settings; a sandbox-disabled production config is fatal here
    auto loaded = hearth::core::config::Settings::load(req.config_file);
    if (is_error(loaded)) {
        return report("Failed to load settings", get_error(loaded));
    }
    const auto& settings = get_value(loaded);
    auto valid = settings.validate();
    if (is_error(valid)) {
        return report("Invalid settings", get_error(valid));
    }

    if (req.command == hearth::app::cli::Command::PolicyArgs) {
        return run_policy_args(req);
    }
    if (req.command == hearth::app::cli::Command::CheckRuntime) {
        return run_check_runtime(settings);
    }

    hearth::session::RequestManager requests;
    auto started = requests.start_request(req.conversation_id, hearth::app::cli::to_string(req.command));
    if (is_error(started)) {
        report("Failed to start request", get_error(started));
        return kExitConfiguration;
    }
    const std::string request_id = get_value(started);
    hearth::core::logging::Logger::get().set_request_id(request_id);

    int code = 0;
    {
        hearth::session::SignalCancellation on_signal(requests, request_id);
        code = req.command == hearth::app::cli::Command::RunScript
                   ? run_script(req, settings, requests, request_id)
                   : run_replay(req, settings, requests, request_id);
    }

    const auto state = requests.get_state(request_id);
    if (!is_error(state)) {
        HEARTH_LOG_INFO("Final request state: " + hearth::session::to_string(get_value(state)));
        if (get_value(state) == hearth::session::RequestState::Cancelled) {
            return kExitCancelled;
        }
    }
    return code;
}

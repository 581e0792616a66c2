#include "cli_parser.hpp"
#include <charconv>
#include <map>
#include <set>
#include <system_error>
#include <vector>
#include "policy/policy_guard.hpp"
#include "sandbox/sandbox_policy.hpp"

namespace hearth::app::cli {

    using namespace hearth::core::errors;

    namespace {

        constexpr const char* kUsage =
            "Usage: hearth <policy-args|run-script|replay|check-runtime> [options]";

        // 1. Raw Options Struct (Internal only)
        struct RawCliOptions {
            std::optional<std::string> config;
            std::optional<std::string> policy;
            std::optional<std::string> timeout;
            std::optional<std::string> script;
            std::optional<std::string> data;
            std::optional<std::string> report_id;
            std::optional<std::string> stream;
            std::optional<std::string> states;
            std::optional<std::string> conversation;
            bool parallel = false;
            bool verbose = false;
        };

        std::optional<Command> parse_command(const std::string& text) {
            if (text == "policy-args") return Command::PolicyArgs;
            if (text == "run-script") return Command::RunScript;
            if (text == "replay") return Command::Replay;
            if (text == "check-runtime") return Command::CheckRuntime;
            return std::nullopt;
        }

        // Options every command accepts are not listed here.
        const std::map<std::string, std::set<Command>>& option_scope() {
            static const std::map<std::string, std::set<Command>> kScope = {
                {"--policy", {Command::PolicyArgs, Command::RunScript}},
                {"--timeout", {Command::PolicyArgs, Command::RunScript}},
                {"--script", {Command::RunScript}},
                {"--data", {Command::RunScript}},
                {"--report-id", {Command::RunScript}},
                {"--stream", {Command::Replay}},
                {"--states", {Command::Replay}},
                {"--conversation", {Command::Replay}},
                {"--parallel", {Command::Replay}},
            };
            return kScope;
        }

        Result<std::filesystem::path> existing_file(const std::string& value, const std::string& flag) {
            std::filesystem::path p(value);
            std::error_code ec;
            const bool is_file = std::filesystem::is_regular_file(p, ec);
            if (ec || !is_file) {
                return HearthError{ErrorCategory::Input, flag + " must name an existing file: " + value, "invalid_path"};
            }
            return p;
        }

    }

    std::string to_string(const Command command) {
        switch (command) {
            case Command::PolicyArgs:   return "policy-args";
            case Command::RunScript:    return "run-script";
            case Command::Replay:       return "replay";
            case Command::CheckRuntime: return "check-runtime";
            default: return "unknown";
        }
    }

    Result<CliRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return HearthError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        const std::string command_text = argv[1];
        const auto command = parse_command(command_text);
        if (!command) {
            return HearthError{ErrorCategory::Input, "Unknown command: " + command_text, "unknown_command", kUsage};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and command
            args.push_back(argv[i]);
        }

        const std::map<std::string, std::optional<std::string>*> valued = {
            {"--config", &raw.config},
            {"--policy", &raw.policy},
            {"--timeout", &raw.timeout},
            {"--script", &raw.script},
            {"--data", &raw.data},
            {"--report-id", &raw.report_id},
            {"--stream", &raw.stream},
            {"--states", &raw.states},
            {"--conversation", &raw.conversation},
        };

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            const auto scope = option_scope().find(arg);
            if (scope != option_scope().end() && scope->second.count(*command) == 0) {
                return HearthError{ErrorCategory::Input, "Option " + arg + " is not valid for '" + command_text + "'", "unknown_argument"};
            }

            const auto slot = valued.find(arg);
            if (slot != valued.end()) {
                if (i + 1 < args.size()) *slot->second = args[++i];
                else return HearthError{ErrorCategory::Input, "Missing value for " + arg, "missing_value"};
            } else if (arg == "--parallel") {
                raw.parallel = true;
            } else if (arg == "--verbose") {
                raw.verbose = true;
            } else {
                return HearthError{ErrorCategory::Input, "Unknown argument: " + arg, "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        CliRequest req;
        req.command = *command;
        req.verbose = raw.verbose;
        req.parallel = raw.parallel;

        if (raw.config) {
            auto config = existing_file(*raw.config, "--config");
            if (is_error(config)) return get_error(config);
            req.config_file = get_value(config);
        }

        if (raw.policy) {
            auto known = hearth::sandbox::get_policy(*raw.policy);
            if (is_error(known)) return get_error(known);
            req.policy_name = *raw.policy;
        } else if (*command == Command::PolicyArgs) {
            req.policy_name = "standard";
        }

        // Exception-free integer parsing
        if (raw.timeout) {
            int seconds = 0;
            const char* begin = raw.timeout->data();
            const char* end = raw.timeout->data() + raw.timeout->size();
            auto [ptr, ec] = std::from_chars(begin, end, seconds);
            if (ec != std::errc() || ptr != end) {
                return HearthError{ErrorCategory::Input, "Invalid number for --timeout", "invalid_integer", "Provide a whole number of seconds."};
            }
            if (seconds < 5 || seconds > 300) {
                return HearthError{ErrorCategory::Input, "--timeout out of bounds", "bounds_error", "Must be between 5 and 300."};
            }
            req.timeout_seconds = seconds;
        }

        if (*command == Command::RunScript) {
            if (!raw.script) {
                return HearthError{ErrorCategory::Input, "run-script requires --script", "missing_required_flag"};
            }
            auto script = existing_file(*raw.script, "--script");
            if (is_error(script)) return get_error(script);
            req.script_file = get_value(script);

            if (raw.data) {
                auto data = existing_file(*raw.data, "--data");
                if (is_error(data)) return get_error(data);
                req.data_file = get_value(data);
            }
            if (raw.report_id) {
                hearth::policy::PolicyGuard guard;
                auto report_id = guard.validate_identifier(*raw.report_id, "report id");
                if (is_error(report_id)) return get_error(report_id);
                req.report_id = get_value(report_id);
            }
        }

        if (*command == Command::Replay) {
            if (!raw.stream) {
                return HearthError{ErrorCategory::Input, "replay requires --stream", "missing_required_flag"};
            }
            auto stream = existing_file(*raw.stream, "--stream");
            if (is_error(stream)) return get_error(stream);
            req.stream_file = get_value(stream);

            if (raw.states) {
                auto states = existing_file(*raw.states, "--states");
                if (is_error(states)) return get_error(states);
                req.states_file = get_value(states);
            }
            if (raw.conversation) {
                if (raw.conversation->empty()) {
                    return HearthError{ErrorCategory::Input, "--conversation cannot be empty", "missing_value"};
                }
                req.conversation_id = *raw.conversation;
            }
        }

        return req;
    }

} // namespace hearth::app::cli

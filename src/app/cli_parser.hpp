#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/hearth_errors.hpp"

namespace hearth::app::cli {

    enum class Command {
        PolicyArgs,
        RunScript,
        Replay,
        CheckRuntime
    };

    struct CliRequest {
        Command command = Command::CheckRuntime;
        std::optional<std::filesystem::path> config_file;
        bool verbose = false;

        std::string policy_name = "analysis";
        std::optional<int> timeout_seconds;

        std::optional<std::filesystem::path> script_file;
        std::optional<std::filesystem::path> data_file;
        std::optional<std::string> report_id;

        std::optional<std::filesystem::path> stream_file;
        std::optional<std::filesystem::path> states_file;
        std::string conversation_id = "cli";
        bool parallel = false;
    };

    std::string to_string(Command command);

    hearth::core::errors::Result<CliRequest> parse_and_validate(int argc, char* argv[]);
}
